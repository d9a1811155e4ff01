/*==============================================================================
Dispatch

There is one solve procedure for each class of optimizer. All procedures go
through the same steps:

1. The data stream is restarted and the trace bridge is activated.
2. The objective bundle, and the constraint bundle for constrained problems,
   are built for the procedure.
3. The generic options are mapped to the algorithm options.
4. The solver is created and configured, and NLopt is invoked once. The
   time used by NLopt is measured.
5. Exceptions thrown by the evaluated functions are thrown again, and so are
   the failures reported by NLopt.
6. The solution is created with the minimum in the direction of the problem.

The procedures differ in how the bounds are given to the solver and in what
functions are registered.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_NON_LINEAR_DISPATCH
#define POLYOPT_NON_LINEAR_DISPATCH

#include <memory>                     // For the procedure pointer

#include "Solution.hpp"               // The solution
#include "NonLinear/Selection.hpp"    // Solve paths
#include "NonLinear/Objective.hpp"    // The execution state
#include "NonLinear/Solver.hpp"       // The solver

namespace Polyopt
{
class Context;
}

namespace Polyopt::NonLinear
{

class SolveProcedure
{
protected:

  // The common final steps of the procedures: running the solver and
  // creating the solution.

  Solution Run( const Context & TheContext, Solver & TheSolver,
                ExecutionState & State ) const;

public:

  virtual SolvePath Path( void ) const = 0;
  virtual Solution  Solve( const Context & TheContext ) const = 0;

  virtual ~SolveProcedure( void )
  {}
};

// The unconstrained procedure gives the bounds of a population based
// algorithm to the solver if they are set for the optimizer selection.

class UnconstrainedProcedure : public SolveProcedure
{
public:

  virtual SolvePath Path( void ) const override
  { return SolvePath::Unconstrained; }

  virtual Solution Solve( const Context & TheContext ) const override;
};

// The box constrained procedure gives the bounds of the problem to the
// solver, or the bounds of the optimizer selection if the problem has no
// bounds. A missing bound is infinite.

class BoxConstrainedProcedure : public SolveProcedure
{
public:

  virtual SolvePath Path( void ) const override
  { return SolvePath::BoxConstrained; }

  virtual Solution Solve( const Context & TheContext ) const override;
};

// The constrained procedure registers the constraints with the bounds of
// the problem.

class ConstrainedProcedure : public SolveProcedure
{
public:

  virtual SolvePath Path( void ) const override
  { return SolvePath::Constrained; }

  virtual Solution Solve( const Context & TheContext ) const override;
};

std::unique_ptr< SolveProcedure > CreateSolveProcedure( SolvePath Path );

}      // End name space Polyopt::NonLinear
#endif // POLYOPT_NON_LINEAR_DISPATCH
