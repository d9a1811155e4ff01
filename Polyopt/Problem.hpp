/*==============================================================================
Problem

A problem is defined independently of the algorithm used to solve it. It
consists of an objective function and optionally its derivatives, nonlinear
constraints with their derivatives, bounds on the variables, the direction of
the optimization, the initial point of the search, and the parameters of the
problem.

All functions of the problem take the variable values as the first argument
and the parameters as the second argument. The objective function and its
derivatives also receive the current batch of data as a third argument. For
problems not using data, the data batch is an empty matrix. The functions are
standard function objects so that they can be given as lambda expressions,
free functions or bound member functions.

The objective function may return more than the objective value, and the
additional outputs are passed unchanged to the user callback observing the
progress of the solver. A plain number is implicitly converted to an objective
result without additional outputs.

The problem class holds the definition, and the problem function class is the
facade used by the optimizers to evaluate the functions with a uniform
interface where the results are written into the vectors and matrices given
by the solver. The facade checks the dimensions of all results, and it
computes a Hessian-vector product from the Hessian if only the Hessian is
given.

Author and Copyright: Geir Horn, 2018, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_PROBLEM
#define POLYOPT_PROBLEM

#include <functional>                 // For the problem functions
#include <optional>                   // For optional bounds
#include <string>                     // For symbolic names
#include <vector>                     // For variables and values

#include "Variables.hpp"              // Basic definitions

namespace Polyopt
{

// Even though the optimizers all minimize, both minimization and maximization
// problems can be defined.

enum class Goal
{
  Minimize,
  Maximize
};

// The result of the objective function is the value and possibly a set of
// additional outputs.

class ObjectiveResult
{
public:

  VariableType                Value;
  std::vector< VariableType > Auxiliary;

  ObjectiveResult( VariableType TheValue = 0.0,
                   const std::vector< VariableType > & Extra = {} )
  : Value( TheValue ), Auxiliary( Extra )
  {}
};

// The function signatures of the problem

using ObjectiveFunction = std::function< ObjectiveResult(
  const Variables &, const Parameters &, const DataBatch & ) >;

using GradientFunction  = std::function< GradientVector(
  const Variables &, const Parameters &, const DataBatch & ) >;

using HessianFunction   = std::function< HessianMatrix(
  const Variables &, const Parameters &, const DataBatch & ) >;

using HessianVectorFunction = std::function< GradientVector(
  const Variables &, const GradientVector & Direction,
  const Parameters &, const DataBatch & ) >;

using ConstraintFunction = std::function< ConstraintValues(
  const Variables &, const Parameters & ) >;

using ConstraintJacobianFunction = std::function< GradientMatrix(
  const Variables &, const Parameters & ) >;

using ConstraintHessianFunction = std::function< std::vector< HessianMatrix >(
  const Variables &, const Parameters & ) >;

// A problem generated from a symbolic model knows the names of its state
// variables and its parameters, in the same order as the numerical vectors.

class SymbolicSystem
{
public:

  std::vector< std::string > States, ParameterNames;
};

/*==============================================================================

 Problem definition

==============================================================================*/

class Problem
{
public:

  ObjectiveFunction           Objective;
  GradientFunction            Gradient;
  HessianFunction             Hessian;
  HessianVectorFunction       HessianVectorProduct;
  ConstraintFunction          Constraints;
  ConstraintJacobianFunction  ConstraintsJacobian;
  ConstraintHessianFunction   ConstraintsHessian;

  // Bounds on the variables are optional, and if given they must have the
  // dimension of the variables. An infinite value indicates that the variable
  // is unbounded in that direction. The bounds on the constraint values must
  // be given if there are constraint functions, and equal lower and upper
  // bounds define an equality constraint.

  std::optional< Variables >        LowerBounds, UpperBounds;
  std::optional< ConstraintValues > ConstraintLower, ConstraintUpper;

  Goal                              Sense;
  Variables                         InitialPoint;
  Parameters                        ParameterValues;
  std::optional< SymbolicSystem >   Symbols;

  // Utility functions

  inline Dimension NumberOfVariables( void ) const
  { return InitialPoint.size(); }

  inline bool HasBounds( void ) const
  { return LowerBounds.has_value() || UpperBounds.has_value(); }

  inline bool HasConstraints( void ) const
  { return static_cast< bool >( Constraints ); }

  // The consistency of the definition is checked when the problem is combined
  // with an optimizer, and an invalid argument exception is thrown if the
  // dimensions do not match or if bounds for the constraints are missing.

  void Validate( void ) const;

  // The constructor requires the objective function and the initial point
  // whereas everything else can be assigned afterwards.

  Problem( ObjectiveFunction TheObjective, const Variables & StartPoint,
           const Parameters & Values = Parameters(),
           Goal Direction = Goal::Minimize );

  Problem( void ) = delete;
};

/*==============================================================================

 Problem functions

==============================================================================*/

class ProblemFunction
{
private:

  const Problem & Definition;

  // Results are checked to have the expected size, and the check is the same
  // for all functions.

  void CheckSize( const std::string & FunctionName,
                  Dimension Expected, Dimension Actual ) const;

public:

  // Tests for the available functions

  inline bool HasGradient( void ) const
  { return static_cast< bool >( Definition.Gradient ); }

  inline bool HasHessian( void ) const
  { return static_cast< bool >( Definition.Hessian ); }

  inline bool HasHessianVectorProduct( void ) const
  {
    return static_cast< bool >( Definition.HessianVectorProduct ) ||
           HasHessian();
  }

  inline bool HasConstraints( void ) const
  { return Definition.HasConstraints(); }

  inline bool HasConstraintJacobian( void ) const
  { return static_cast< bool >( Definition.ConstraintsJacobian ); }

  inline bool HasConstraintHessians( void ) const
  { return static_cast< bool >( Definition.ConstraintsHessian ); }

  inline bool HasSymbolicOrigin( void ) const
  { return Definition.Symbols.has_value(); }

  inline Dimension NumberOfConstraints( void ) const
  {
    return Definition.ConstraintUpper ? Definition.ConstraintUpper->size()
                                      : 0;
  }

  // Evaluation of the objective and its derivatives

  ObjectiveResult Value( const Variables & X, const Parameters & P,
                         const DataBatch & Batch ) const;

  void Gradient( GradientVector & G, const Variables & X,
                 const Parameters & P, const DataBatch & Batch ) const;

  void Hessian( HessianMatrix & H, const Variables & X,
                const Parameters & P, const DataBatch & Batch ) const;

  void HessianVector( GradientVector & Hv, const Variables & X,
                      const GradientVector & V, const Parameters & P,
                      const DataBatch & Batch ) const;

  // Evaluation of the constraints and their derivatives.

  void Constraints( ConstraintValues & C, const Variables & X,
                    const Parameters & P ) const;

  void ConstraintsJacobian( GradientMatrix & J, const Variables & X,
                            const Parameters & P ) const;

  void ConstraintsHessian( std::vector< HessianMatrix > & Hessians,
                           const Variables & X, const Parameters & P ) const;

  // The facade refers to the problem definition, which must therefore live
  // at least as long as the facade.

  ProblemFunction( const Problem & TheProblem )
  : Definition( TheProblem )
  {}

  ProblemFunction( void ) = delete;
};

}      // End name space Polyopt
#endif // POLYOPT_PROBLEM
