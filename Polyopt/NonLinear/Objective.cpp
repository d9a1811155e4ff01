/*==============================================================================
Objective

The bundle functions are lambda expressions capturing the problem functions,
the parameters and the execution state by reference. The sign change for
maximization problems is decided when the bundle is built.

Author and Copyright: Geir Horn, 2018, 2024
License: LGPL 3.0
==============================================================================*/

#include <algorithm>                  // For copying values
#include <cmath>                      // For HUGE_VAL
#include <sstream>                    // For error reporting

#include "Errors.hpp"                 // For missing derivatives
#include "NonLinear/Objective.hpp"

namespace Polyopt::NonLinear
{
// -----------------------------------------------------------------------------
// Bundle functions
// -----------------------------------------------------------------------------
//
// The functions common to the bundles are created by the following helpers.
// The value function records the point and the outputs of the objective for
// the callback before the sign is changed.

namespace
{
using ValueFunction = std::function< VariableType( const Variables & ) >;

ValueFunction MinimizedValue( const ProblemFunction & Functions, bool Negate,
                              const Parameters & Values,
                              ExecutionState & State )
{
  return [&Functions, Negate, &Values, &State]( const Variables & X )
  {
    State.LastPoint  = X;
    State.LastOutput = Functions.Value( X, Values, State.CurrentBatch );

    return Negate ? -State.LastOutput.Value : State.LastOutput.Value;
  };
}

std::function< void( GradientVector &, const Variables & ) >
MinimizedGradient( const ProblemFunction & Functions, bool Negate,
                   const Parameters & Values, ExecutionState & State )
{
  return [&Functions, Negate, &Values, &State]( GradientVector & G,
                                                const Variables & X )
  {
    Functions.Gradient( G, X, Values, State.CurrentBatch );

    if ( Negate )
      for ( VariableType & Element : G )
        Element = -Element;
  };
}

std::function< void( HessianMatrix &, const Variables & ) >
MinimizedHessian( const ProblemFunction & Functions, bool Negate,
                  const Parameters & Values, ExecutionState & State )
{
  return [&Functions, Negate, &Values, &State]( HessianMatrix & H,
                                                const Variables & X )
  {
    Functions.Hessian( H, X, Values, State.CurrentBatch );

    if ( Negate )
      H = -H;
  };
}

std::function< void( GradientVector &, const Variables &,
                     const GradientVector & ) >
MinimizedHessianVector( const ProblemFunction & Functions, bool Negate,
                        const Parameters & Values, ExecutionState & State )
{
  return [&Functions, Negate, &Values, &State]( GradientVector & Hv,
    const Variables & X, const GradientVector & V )
  {
    Functions.HessianVector( Hv, X, V, Values, State.CurrentBatch );

    if ( Negate )
      for ( VariableType & Element : Hv )
        Element = -Element;
  };
}

}   // Anonymous name space

// -----------------------------------------------------------------------------
// Bundle builders
// -----------------------------------------------------------------------------

ObjectiveBundle UnconstrainedObjective( const ProblemFunction & Functions,
  Goal Direction, const Parameters & Values, ExecutionState & State )
{
  bool            Negate = ( Direction == Goal::Maximize );
  ObjectiveBundle Bundle;

  Bundle.Value = MinimizedValue( Functions, Negate, Values, State );

  if ( Functions.HasGradient() )
    Bundle.Gradient = MinimizedGradient( Functions, Negate, Values, State );

  if ( Functions.HasHessian() )
    Bundle.Hessian = MinimizedHessian( Functions, Negate, Values, State );

  if ( Functions.HasHessianVectorProduct() )
    Bundle.HessianVector =
      MinimizedHessianVector( Functions, Negate, Values, State );

  return Bundle;
}

// The combined value and gradient function evaluates the objective before the
// gradient, so that the recorded outputs are always for the current point.

ObjectiveBundle BoxConstrainedObjective( const ProblemFunction & Functions,
  Goal Direction, const Parameters & Values, ExecutionState & State )
{
  bool            Negate = ( Direction == Goal::Maximize );
  ObjectiveBundle Bundle;

  Bundle.Value = MinimizedValue( Functions, Negate, Values, State );

  if ( Functions.HasGradient() )
  {
    Bundle.Gradient = MinimizedGradient( Functions, Negate, Values, State );

    Bundle.ValueGradient =
    [ Value = Bundle.Value, Gradient = Bundle.Gradient ](
      GradientVector & G, const Variables & X )
    {
      VariableType TheValue = Value( X );

      Gradient( G, X );
      return TheValue;
    };
  }

  return Bundle;
}

// The constrained algorithms using a preconditioner get the product of the
// Hessian and the direction computed from the sign corrected Hessian.

ObjectiveBundle ConstrainedObjective( const ProblemFunction & Functions,
  Goal Direction, const Parameters & Values, ExecutionState & State )
{
  bool            Negate = ( Direction == Goal::Maximize );
  ObjectiveBundle Bundle;

  Bundle.Value = MinimizedValue( Functions, Negate, Values, State );

  if ( Functions.HasGradient() )
    Bundle.Gradient = MinimizedGradient( Functions, Negate, Values, State );

  if ( Functions.HasHessian() )
  {
    Bundle.Hessian = MinimizedHessian( Functions, Negate, Values, State );

    Bundle.HessianVector = [ Hessian = Bundle.Hessian ]( GradientVector & Hv,
      const Variables & X, const GradientVector & V )
    {
      HessianMatrix H;

      Hessian( H, X );
      Hv = arma::conv_to< GradientVector >::from(
             H * arma::Col< VariableType >( V ) );
    };
  }

  return Bundle;
}

// -----------------------------------------------------------------------------
// Objective binding
// -----------------------------------------------------------------------------

ObjectiveBinding::ObjectiveBinding( Solver & OwningSolver,
  const ObjectiveBundle & Functions, ExecutionState & SolveState,
  const TraceHook & Hook )
: TheSolver( OwningSolver ), Bundle( Functions ), State( SolveState ),
  Trace( Hook )
{}

void ObjectiveBinding::Register( void )
{
  if ( Bundle.HessianVector )
    TheSolver.CheckStatus( nlopt_set_precond_min_objective(
      TheSolver.Pointer(), &IndirectionMapper, &PreconditionerMapper, this ),
      "setting the preconditioned objective function" );
  else
    TheSolver.CheckStatus( nlopt_set_min_objective(
      TheSolver.Pointer(), &IndirectionMapper, this ),
      "setting the objective function" );
}

// An exception is stored in the execution state, and the solver is stopped.
// Later evaluations will not call the functions again. The status of the
// forced stop is not checked as it can only fail for a null solver, and
// throwing is not an option in the exception handler.

double ObjectiveBinding::IndirectionMapper( unsigned int Size,
  const double * ArgumentValues, double * GradientValues, void * Data )
{
  ObjectiveBinding * This = static_cast< ObjectiveBinding * >( Data );
  double             Value = HUGE_VAL;

  if ( This->State.Failure )
    return Value;

  try
  {
    Variables VariableValues( ArgumentValues, ArgumentValues + Size );

    if ( GradientValues == nullptr )
      Value = This->Bundle.Value( VariableValues );
    else
    {
      GradientVector Gradient;

      if ( This->Bundle.ValueGradient )
        Value = This->Bundle.ValueGradient( Gradient, VariableValues );
      else if ( This->Bundle.Gradient )
      {
        Value = This->Bundle.Value( VariableValues );
        This->Bundle.Gradient( Gradient, VariableValues );
      }
      else
      {
        std::ostringstream ErrorMessage;

        ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                     << "The algorithm " << This->TheSolver.GetAlgorithmName()
                     << " requested the gradient for a problem without a "
                     << "gradient function";

        throw MissingDerivative( ErrorMessage.str() );
      }

      std::copy( Gradient.begin(), Gradient.end(), GradientValues );
    }

    if ( This->Trace && This->Trace( VariableValues ) )
      This->TheSolver.ForceStop();
  }
  catch ( ... )
  {
    This->State.Failure = std::current_exception();
    nlopt_force_stop( This->TheSolver.Pointer() );
  }

  return Value;
}

void ObjectiveBinding::PreconditionerMapper( unsigned int Size,
  const double * ArgumentValues, const double * Direction,
  double * Product, void * Data )
{
  ObjectiveBinding * This = static_cast< ObjectiveBinding * >( Data );

  if ( This->State.Failure )
  {
    std::fill( Product, Product + Size, 0.0 );
    return;
  }

  try
  {
    Variables      VariableValues( ArgumentValues, ArgumentValues + Size );
    GradientVector TheDirection( Direction, Direction + Size ), Result;

    This->Bundle.HessianVector( Result, VariableValues, TheDirection );
    std::copy( Result.begin(), Result.end(), Product );
  }
  catch ( ... )
  {
    This->State.Failure = std::current_exception();
    nlopt_force_stop( This->TheSolver.Pointer() );
    std::fill( Product, Product + Size, 0.0 );
  }
}

}  // End name space Polyopt::NonLinear
