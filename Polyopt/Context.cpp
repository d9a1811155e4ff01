/*==============================================================================
Context

The solve procedure is created from the classification, and solving the
context is then delegated to the procedure.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <algorithm>                  // For searching names
#include <sstream>                    // For error reporting
#include <stdexcept>                  // For standard exceptions

#include "Errors.hpp"                 // Context errors
#include "Context.hpp"
#include "NonLinear/Dispatch.hpp"     // The solve procedures

namespace Polyopt
{

Context::Context( const Problem & TheProblem,
                  const NonLinear::OptimizerSelection & Optimizer,
                  std::shared_ptr< DataStream > Stream,
                  const OptionSet & Settings )
: Definition( TheProblem ), Functions( Definition ),
  Classified( NonLinear::Classify( TheProblem, Optimizer ) ),
  Data( Stream ), Options( Settings ),
  State{ TheProblem.ParameterValues, TheProblem.InitialPoint },
  Procedure()
{
  Validate();

  if ( !Data )
    Data = std::make_shared< NoData >();
  else if ( !Data->IsSentinel() )
    if ( auto Length = Data->Length() )
      Options.MaxIterations = *Length;

  Procedure = NonLinear::CreateSolveProcedure( Classified.Path );
}

// The destructor is defined here where the solve procedure is a complete
// type.

Context::~Context( void )
{}

void Context::Validate( void ) const
{
  Definition.Validate();

  const NonLinear::OptimizerSelection & Optimizer = Classified.Selection;

  if ( !Optimizer.DerivativeFree() && !Functions.HasGradient() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The algorithm " << Optimizer.Name() << " requires the "
                 << "gradient of the objective function, and the problem "
                 << "has no gradient function";

    throw MissingDerivative( ErrorMessage.str() );
  }

  if ( Optimizer.SupportsConstraints() && !Functions.HasConstraintJacobian() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The algorithm " << Optimizer.Name() << " requires the "
                 << "Jacobian of the constraint functions, and the problem "
                 << "has no constraint Jacobian function";

    throw MissingConstraintDerivative( ErrorMessage.str() );
  }

  if ( Functions.HasConstraints() && !Optimizer.SupportsConstraints() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The algorithm " << Optimizer.Name() << " cannot handle "
                 << "the nonlinear constraints of the problem";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  if ( Optimizer.RequiresBounds() && !Definition.HasBounds() &&
       !Optimizer.HasBounds() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The algorithm " << Optimizer.Name() << " requires "
                 << "bounds on the variables, and none are given";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

// -----------------------------------------------------------------------------
// Re-initialisation
// -----------------------------------------------------------------------------

Variables Context::Remap( const Replacement & NewValues,
                          const Variables & Current,
                          const std::vector< std::string > & Names,
                          const std::string & Description ) const
{
  if ( std::holds_alternative< Variables >( NewValues ) )
  {
    const Variables & Values = std::get< Variables >( NewValues );

    if ( Values.size() != Current.size() )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The new " << Description << " have dimension "
                   << Values.size() << " where " << Current.size()
                   << " is required";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    return Values;
  }

  const SymbolicMap & Map = std::get< SymbolicMap >( NewValues );

  if ( Map.empty() )
    return Current;

  if ( !Functions.HasSymbolicOrigin() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The " << Description << " are given by name, but the "
                 << "problem has no symbolic system defining the names";

    throw UnsupportedSymbolicRemap( ErrorMessage.str() );
  }

  Variables Values( Current );

  for ( const auto & [ Name, Value ] : Map )
  {
    auto Position = std::find( Names.begin(), Names.end(), Name );

    if ( Position == Names.end() || Names.size() != Current.size() )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The name " << Name << " is not one of the "
                   << Description << " of the symbolic system";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    Values[ std::distance( Names.begin(), Position ) ] = Value;
  }

  return Values;
}

// Both values are remapped before any of them are changed so that the state
// is unchanged if one of them fails.

Context & Context::Reinitialise(
  const std::optional< Replacement > & NewParameters,
  const std::optional< Replacement > & NewInitialPoint )
{
  static const std::vector< std::string > NoNames;

  const std::vector< std::string > & ParameterNames
    = Definition.Symbols ? Definition.Symbols->ParameterNames : NoNames;
  const std::vector< std::string > & StateNames
    = Definition.Symbols ? Definition.Symbols->States : NoNames;

  Parameters TheParameters( State.ParameterValues );
  Variables  StartPoint( State.InitialPoint );

  if ( NewParameters )
    TheParameters = Remap( *NewParameters, State.ParameterValues,
                           ParameterNames, "parameters" );

  if ( NewInitialPoint )
    StartPoint = Remap( *NewInitialPoint, State.InitialPoint,
                        StateNames, "initial values" );

  State.ParameterValues = TheParameters;
  State.InitialPoint    = StartPoint;

  return *this;
}

Solution Context::Solve( void )
{
  return Procedure->Solve( *this );
}

}  // End name space Polyopt
