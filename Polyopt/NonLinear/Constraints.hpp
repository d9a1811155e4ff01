/*==============================================================================
Constraints

The nonlinear constraints of a problem are given as a vector valued function
with lower and upper bounds on each constraint value,

  l[i] <= c[i](x) <= u[i]

and a constraint with equal lower and upper bounds is an equality constraint.
The constraint bundle contains the functions used by the constrained
algorithms: the constraint values, the Jacobian, and the Lagrangian Hessian,
which is the weighted sum of the constraint Hessians for a given set of
Lagrange multipliers. The bundle also holds the bounds on the variables,
which are empty if the problem has no bounds.

NLopt defines the constraints as c(x) <= 0 for inequality constraints and
c(x) = 0 for equality constraints. The bounded constraints are therefore
partitioned: an equality constraint becomes c[i](x) - u[i] = 0, and each
finite bound of an inequality constraint gives one NLopt constraint
c[i](x) - u[i] <= 0 or l[i] - c[i](x) <= 0. The inequality constraints and
the equality constraints are registered with NLopt as two vector valued
constraints, and the gradients of the NLopt constraints are taken from the
corresponding columns of the Jacobian.

Author and Copyright: Geir Horn, 2018, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_NON_LINEAR_CONSTRAINTS
#define POLYOPT_NON_LINEAR_CONSTRAINTS

#include <functional>                 // For the bundle functions
#include <optional>                   // For the tolerance
#include <vector>                     // For the constraint rows

#include "Variables.hpp"              // Basic definitions
#include "Problem.hpp"                // The problem functions
#include "NonLinear/Objective.hpp"    // The execution state
#include "NonLinear/Solver.hpp"       // The solver

#include <nlopt.h>                    // The C-style interface

namespace Polyopt::NonLinear
{

class ConstraintBundle
{
public:

  std::function< void( ConstraintValues &, const Variables & ) > Values;
  std::function< void( GradientMatrix &, const Variables & ) >   Jacobian;

  // The Lagrangian Hessian adds the sum of the constraint Hessians weighted
  // by the multipliers to the given matrix. An empty matrix is taken to be
  // zero.

  std::function< void( HessianMatrix &, const Variables &,
                       const std::vector< VariableType > & Multipliers ) >
    LagrangianHessian;

  Variables        LowerBounds, UpperBounds;
  ConstraintValues Lower, Upper;
};

ConstraintBundle BuildConstraints( const Problem & TheProblem,
  const ProblemFunction & Functions, const Parameters & Values );

// -----------------------------------------------------------------------------
// Partition
// -----------------------------------------------------------------------------
//
// A row of the NLopt constraints refers to the index of the problem
// constraint, the bound value, and the sign of the constraint. The sign is
// positive for c - bound and negative for bound - c.

class ConstraintRow
{
public:

  Dimension    Index;
  VariableType Bound;
  VariableType Sign;
};

class ConstraintPartition
{
public:

  std::vector< ConstraintRow > Inequalities, Equalities;

  ConstraintPartition( const ConstraintValues & Lower,
                       const ConstraintValues & Upper );

  ConstraintPartition( void ) = delete;
};

// -----------------------------------------------------------------------------
// Constraint binding
// -----------------------------------------------------------------------------

class ConstraintBinding
{
private:

  Solver                 & TheSolver;
  const ConstraintBundle & Bundle;
  ExecutionState         & State;
  const ConstraintPartition Partition;

  // The constraint function and its Jacobian are evaluated for the rows of
  // one of the vector constraints.

  void Evaluate( const std::vector< ConstraintRow > & Rows,
                 unsigned int NumberOfVariables, const double * ArgumentValues,
                 double * Result, double * Gradient );

  static void InequalityMapper( unsigned int NumberOfConstraints,
    double * Result, unsigned int NumberOfVariables,
    const double * ArgumentValues, double * Gradient, void * Data );

  static void EqualityMapper( unsigned int NumberOfConstraints,
    double * Result, unsigned int NumberOfVariables,
    const double * ArgumentValues, double * Gradient, void * Data );

public:

  // The constraints are registered with the given tolerance for all
  // constraints, or without tolerance if it is not given. The bounds on the
  // variables are set if the bundle has them.

  void Register( std::optional< double > Tolerance = std::nullopt );

  ConstraintBinding( Solver & OwningSolver, const ConstraintBundle & Functions,
                     ExecutionState & SolveState );

  ConstraintBinding( void ) = delete;
};

}      // End name space Polyopt::NonLinear
#endif // POLYOPT_NON_LINEAR_CONSTRAINTS
