/*==============================================================================
Variables

The problems handed to the optimizers are numerical problems over real valued
decision variables, and the variable type is therefore a standard double.
It is important to use the defined variable type instead of a standard double
as its definition could change in the future. The parameters of a problem are
the constant, non-optimised values passed to every function of the problem,
and they share the numeric type of the variables.

Matrix valued quantities, i.e. Hessians, constraint Jacobians and the data
batches passed to the objective function, are represented by Armadillo [1]
matrices since these can be used directly as column major arrays by the
underlying C-style library.

References:

[1] Conrad Sanderson and Ryan Curtin: Armadillo: a template-based C++ library
    for linear algebra. Journal of Open Source Software, Vol. 1, pp. 26, 2016.

Author and Copyright: Geir Horn, 2018, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_VARIABLES
#define POLYOPT_VARIABLES

#include <vector>                    // For variables and values
#include <armadillo>                 // For matrices

namespace Polyopt
{
using VariableType   = double;
using Variables      = std::vector< VariableType >;
using GradientVector = std::vector< VariableType >;
using Parameters     = std::vector< VariableType >;
using Dimension      = typename Variables::size_type;

// The constraint values are returned as a vector with one element per
// constraint function.

using ConstraintValues = std::vector< VariableType >;

// The Hessian is a square matrix of the same dimension as the variables. The
// Jacobian of the constraints is stored as a matrix with one column per
// constraint function, and each column is then the gradient of that constraint
// function with respect to the variables. This implies that the matrix has as
// many rows as there are variables. The column major storage of Armadillo
// then makes the gradient of each constraint contiguous in memory.

using HessianMatrix  = arma::Mat< VariableType >;
using GradientMatrix = arma::Mat< VariableType >;

// A mini-batch of data is an arbitrary matrix passed on to the objective
// function. The interpretation of rows and columns is left to the problem.

using DataBatch      = arma::Mat< VariableType >;

}      // End name space Polyopt
#endif // POLYOPT_VARIABLES
