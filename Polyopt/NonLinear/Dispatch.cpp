/*==============================================================================
Dispatch

The solution is converged if NLopt reports success or that the stop value or
one of the tolerances was reached. Forced stops, round-off limitations and
reached limits on the number of evaluations or the time are not converged.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <chrono>                     // For timing the solver
#include <cmath>                      // For HUGE_VAL
#include <exception>                  // For stored exceptions
#include <sstream>                    // For error reporting
#include <stdexcept>                  // For standard exceptions

#include "Context.hpp"                // The context to solve
#include "NonLinear/Constraints.hpp"  // The constraint bundle
#include "NonLinear/Options.hpp"      // The algorithm options
#include "NonLinear/Trace.hpp"        // The trace bridge
#include "NonLinear/Dispatch.hpp"

namespace Polyopt::NonLinear
{
// -----------------------------------------------------------------------------
// Common steps
// -----------------------------------------------------------------------------

namespace
{
// The number of points used for the centroid

Dimension CentroidWindow( const OptimizerSelection & Selection,
                          Dimension NumberOfVariables )
{
  if ( Selection.Population() > 0 )
    return Selection.Population();
  else
    return NumberOfVariables + 1;
}

// The trace hook forwards to the bridge, which must exist for as long as the
// solver runs.

TraceHook Hook( TraceBridge & Bridge )
{
  return [&Bridge]( const Variables & Point ){ return Bridge( Point ); };
}

bool Converged( nlopt_result Status )
{
  switch( Status )
  {
    case NLOPT_SUCCESS:
    case NLOPT_STOPVAL_REACHED:
    case NLOPT_FTOL_REACHED:
    case NLOPT_XTOL_REACHED:
      return true;
    default:
      return false;
  }
}

// A bound is taken from the problem, then from the selection, and it is
// infinite if none of them has it.

Variables BoxBound( const std::optional< Variables > & ProblemBound,
                    const std::optional< Variables > & SelectionBound,
                    Dimension NumberOfVariables, double Sentinel )
{
  if ( ProblemBound )
    return *ProblemBound;
  else if ( SelectionBound )
    return *SelectionBound;
  else
    return Variables( NumberOfVariables, Sentinel );
}

}   // Anonymous name space

Solution SolveProcedure::Run( const Context & TheContext, Solver & TheSolver,
                              ExecutionState & State ) const
{
  Variables VariableValues( TheContext.InitialPoint() );
  double    ObjectiveValue = HUGE_VAL;

  auto Start = std::chrono::steady_clock::now();

  nlopt_result Status = TheSolver.Optimize( VariableValues, ObjectiveValue );

  std::chrono::duration< double > SolveTime
    = std::chrono::steady_clock::now() - Start;

  if ( State.Failure )
    std::rethrow_exception( State.Failure );

  TheSolver.CheckStatus( Status, "solving the problem" );

  VariableType Minimum = ( TheContext.Sense() == Goal::Maximize )
                         ? -ObjectiveValue : ObjectiveValue;

  return Solution( VariableValues, Minimum, Converged( Status ), SolveTime,
                   Solution::OriginalResult( VariableValues, ObjectiveValue,
                     Status, TheSolver.NumberOfEvaluations(),
                     TheSolver.GetAlgorithmName() ) );
}

// -----------------------------------------------------------------------------
// Unconstrained
// -----------------------------------------------------------------------------

Solution UnconstrainedProcedure::Solve( const Context & TheContext ) const
{
  const OptimizerSelection & Selection = TheContext.Selection();
  const Dimension            NumberOfVariables
                             = TheContext.InitialPoint().size();
  ExecutionState             State;

  TraceBridge Bridge( TheContext.GetData(), TheContext.GetOptions().Observer,
                      State, Selection.CentroidIterate(),
                      CentroidWindow( Selection, NumberOfVariables ),
                      TheContext.GetOptions().ShowProgress );

  Bridge.Start();

  ObjectiveBundle Bundle = UnconstrainedObjective( TheContext.GetFunctions(),
                           TheContext.Sense(), TheContext.GetParameters(),
                           State );

  AlgorithmOptions Options = MapOptions( TheContext.GetOptions(),
                                         Hook( Bridge ), Selection.Name() );

  Solver TheSolver( Selection, NumberOfVariables );

  TheSolver.Apply( Options );

  if ( Selection.HasBounds() )
    TheSolver.Bounds( *Selection.LowerBounds(), *Selection.UpperBounds() );

  ObjectiveBinding Objective( TheSolver, Bundle, State, Options.Trace );
  Objective.Register();

  return Run( TheContext, TheSolver, State );
}

// -----------------------------------------------------------------------------
// Box constrained
// -----------------------------------------------------------------------------

Solution BoxConstrainedProcedure::Solve( const Context & TheContext ) const
{
  const OptimizerSelection & Selection = TheContext.Selection();
  const Problem            & TheProblem = TheContext.GetProblem();
  const Dimension            NumberOfVariables
                             = TheContext.InitialPoint().size();
  ExecutionState             State;

  TraceBridge Bridge( TheContext.GetData(), TheContext.GetOptions().Observer,
                      State, Selection.CentroidIterate(),
                      CentroidWindow( Selection, NumberOfVariables ),
                      TheContext.GetOptions().ShowProgress );

  Bridge.Start();

  ObjectiveBundle Bundle = BoxConstrainedObjective( TheContext.GetFunctions(),
                           TheContext.Sense(), TheContext.GetParameters(),
                           State );

  AlgorithmOptions Options = MapOptions( TheContext.GetOptions(),
                                         Hook( Bridge ), Selection.Name() );

  Solver TheSolver( Selection, NumberOfVariables );

  TheSolver.Apply( Options );
  TheSolver.Bounds(
    BoxBound( TheProblem.LowerBounds, Selection.LowerBounds(),
              NumberOfVariables, -HUGE_VAL ),
    BoxBound( TheProblem.UpperBounds, Selection.UpperBounds(),
              NumberOfVariables,  HUGE_VAL ) );

  ObjectiveBinding Objective( TheSolver, Bundle, State, Options.Trace );
  Objective.Register();

  return Run( TheContext, TheSolver, State );
}

// -----------------------------------------------------------------------------
// Constrained
// -----------------------------------------------------------------------------

Solution ConstrainedProcedure::Solve( const Context & TheContext ) const
{
  const OptimizerSelection & Selection = TheContext.Selection();
  const Dimension            NumberOfVariables
                             = TheContext.InitialPoint().size();
  ExecutionState             State;

  TraceBridge Bridge( TheContext.GetData(), TheContext.GetOptions().Observer,
                      State, Selection.CentroidIterate(),
                      CentroidWindow( Selection, NumberOfVariables ),
                      TheContext.GetOptions().ShowProgress );

  Bridge.Start();

  ObjectiveBundle Bundle = ConstrainedObjective( TheContext.GetFunctions(),
                           TheContext.Sense(), TheContext.GetParameters(),
                           State );

  ConstraintBundle Constraints = BuildConstraints( TheContext.GetProblem(),
                                 TheContext.GetFunctions(),
                                 TheContext.GetParameters() );

  AlgorithmOptions Options = MapOptions( TheContext.GetOptions(),
                                         Hook( Bridge ), Selection.Name() );

  Solver TheSolver( Selection, NumberOfVariables );

  TheSolver.Apply( Options );

  ObjectiveBinding Objective( TheSolver, Bundle, State, Options.Trace );
  Objective.Register();

  ConstraintBinding ConstraintFunctions( TheSolver, Constraints, State );
  ConstraintFunctions.Register( Options.NativeOption( "ConstraintTolerance" ) );

  return Run( TheContext, TheSolver, State );
}

// -----------------------------------------------------------------------------
// Procedure factory
// -----------------------------------------------------------------------------

std::unique_ptr< SolveProcedure > CreateSolveProcedure( SolvePath Path )
{
  switch( Path )
  {
    case SolvePath::Unconstrained:
      return std::make_unique< UnconstrainedProcedure >();
    case SolvePath::BoxConstrained:
      return std::make_unique< BoxConstrainedProcedure >();
    case SolvePath::Constrained:
      return std::make_unique< ConstrainedProcedure >();
  }

  std::ostringstream ErrorMessage;

  ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
               << "No solve procedure for the solve path "
               << static_cast< int >( Path );

  throw std::logic_error( ErrorMessage.str() );
}

}  // End name space Polyopt::NonLinear
