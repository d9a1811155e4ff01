/*==============================================================================
Objective

All NLopt algorithms minimize the objective function, and a maximization
problem is solved by minimizing the negated objective function. The objective
bundle is the set of functions of one variable vector used by the algorithms,
and it is built from the problem functions for each solve. The bundle
functions evaluate the problem functions with the current parameters of the
problem and the current batch of data, and they change the sign of the
objective value and of every derivative if the problem is a maximization
problem. The minimizer is not affected by the sign change, but the minimum
must be negated back when the solution is reported.

What the bundle contains depends on the solve procedure:

1. Unconstrained: value, gradient, Hessian, and Hessian-vector product.
2. Box constrained: value, gradient, and the combined value and gradient.
3. Constrained: value, gradient, Hessian, and the Hessian-vector product
   computed from the Hessian.

The functions not available for the problem are left empty.

The state shared by the functions evaluated during one solve is kept in an
execution state: the current batch of data, the last point evaluated, the
outputs of the objective function at this point, and any exception thrown by
the evaluated functions. NLopt is a C library and exceptions cannot propagate
through it, so an exception thrown while NLopt runs is stored, the solver is
stopped, and the exception is thrown again when NLopt returns.

The objective binding registers the bundle with the solver. It provides the
C-style indirection functions called by NLopt with a pointer to the binding
as the data argument. The trace hook is called after each evaluation of the
objective function, and the solver is stopped if the hook says so.

Author and Copyright: Geir Horn, 2018, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_NON_LINEAR_OBJECTIVE
#define POLYOPT_NON_LINEAR_OBJECTIVE

#include <exception>                  // For stored exceptions
#include <functional>                 // For the bundle functions

#include "Variables.hpp"              // Basic definitions
#include "Problem.hpp"                // The problem functions
#include "NonLinear/Options.hpp"      // The trace hook
#include "NonLinear/Solver.hpp"       // The solver

#include <nlopt.h>                    // The C-style interface

namespace Polyopt::NonLinear
{

class ExecutionState
{
public:

  DataBatch          CurrentBatch;
  Variables          LastPoint;
  ObjectiveResult    LastOutput;
  std::exception_ptr Failure;

  ExecutionState( void )
  : CurrentBatch(), LastPoint(), LastOutput(), Failure()
  {}
};

// -----------------------------------------------------------------------------
// Objective bundle
// -----------------------------------------------------------------------------

class ObjectiveBundle
{
public:

  std::function< VariableType( const Variables & ) > Value;
  std::function< void( GradientVector &, const Variables & ) > Gradient;
  std::function< VariableType( GradientVector &, const Variables & ) >
    ValueGradient;
  std::function< void( HessianMatrix &, const Variables & ) > Hessian;
  std::function< void( GradientVector &, const Variables &,
                       const GradientVector & ) > HessianVector;
};

// The builders take the problem functions, the direction of the problem,
// the parameters, and the execution state. The parameters are referenced and
// read for each evaluation, so they must not be destroyed before the bundle.

ObjectiveBundle UnconstrainedObjective( const ProblemFunction & Functions,
  Goal Direction, const Parameters & Values, ExecutionState & State );

ObjectiveBundle BoxConstrainedObjective( const ProblemFunction & Functions,
  Goal Direction, const Parameters & Values, ExecutionState & State );

ObjectiveBundle ConstrainedObjective( const ProblemFunction & Functions,
  Goal Direction, const Parameters & Values, ExecutionState & State );

// -----------------------------------------------------------------------------
// Objective binding
// -----------------------------------------------------------------------------

class ObjectiveBinding
{
private:

  Solver                & TheSolver;
  const ObjectiveBundle & Bundle;
  ExecutionState        & State;
  TraceHook               Trace;

  // The mapper function evaluates the objective function and the gradient if
  // the gradient pointer is not null.

  static double IndirectionMapper( unsigned int Size,
    const double * ArgumentValues, double * GradientValues, void * Data );

  // The preconditioner is the Hessian-vector product used by the algorithms
  // supporting a preconditioned objective.

  static void PreconditionerMapper( unsigned int Size,
    const double * ArgumentValues, const double * Direction,
    double * Product, void * Data );

public:

  // The objective is registered for minimization, with the preconditioner if
  // the bundle has the Hessian-vector product.

  void Register( void );

  ObjectiveBinding( Solver & OwningSolver, const ObjectiveBundle & Functions,
                    ExecutionState & SolveState, const TraceHook & Hook );

  ObjectiveBinding( void ) = delete;
};

}      // End name space Polyopt::NonLinear
#endif // POLYOPT_NON_LINEAR_OBJECTIVE
