/*==============================================================================
Selection

The classification of an optimizer for a problem applies the rules for the
bounds described in the header. The constraint capable algorithms take the
bounds directly, and so do the algorithms supporting bounds. The others are
decorated, rebuilt, or their bounds are dropped.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <cmath>                      // For HUGE_VAL
#include <map>                        // For the algorithm names
#include <sstream>                    // For error reporting
#include <stdexcept>                  // For standard exceptions

#include "Errors.hpp"                 // For the warnings
#include "NonLinear/Selection.hpp"

namespace Polyopt::NonLinear
{
// -----------------------------------------------------------------------------
// Algorithm names
// -----------------------------------------------------------------------------

Algorithm::ID Algorithm::Parse( const std::string & ShortName )
{
  static const std::map< std::string, Algorithm::ID > Algorithms = {
    { "LBFGS",            Local::LowStorageBFGS },
    { "VAR1",             Local::VariableMetric::RankOne },
    { "VAR2",             Local::VariableMetric::RankTwo },
    { "TNEWTON",          Local::TruncatedNewton::Standard },
    { "TNEWTON_RESTART",  Local::TruncatedNewton::Restarting },
    { "TNEWTON_PRECOND",  Local::TruncatedNewton::Preconditioned },
    { "TNEWTON_PRECOND_RESTART",
                          Local::TruncatedNewton::PreconditionedRestart },
    { "NELDERMEAD",       Local::Simplex::NelderMead },
    { "SBPLX",            Local::Simplex::Subspace },
    { "BOBYQA",           Local::QuadraticApproximation::BOBYQA },
    { "NEWUOA_BOUND",     Local::QuadraticApproximation::NEWUOA },
    { "COBYLA",           Local::LinearApproximation },
    { "PRAXIS",           Local::PrincipalAxis },
    { "SLSQP",            Local::Constrained::SequentialQuadratic },
    { "MMA",              Local::Constrained::MovingAsymptotes },
    { "CCSAQ",            Local::Constrained::ConservativeQuadratic },
    { "DIRECT",           Global::DIRECT::Standard },
    { "DIRECT_L",         Global::DIRECT::Local },
    { "CRS2_LM",          Global::ControlledRandomSearch },
    { "ESCH",             Global::Evolutionary },
    { "ISRES",            Global::StochasticRanking }
  };

  auto Found = Algorithms.find( ShortName );

  if ( Found == Algorithms.end() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The algorithm name " << ShortName
                 << " is not a supported algorithm";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  return Found->second;
}

// -----------------------------------------------------------------------------
// Optimizer selection
// -----------------------------------------------------------------------------

OptimizerSelection::OptimizerSelection( Algorithm::ID TheAlgorithm,
                                        unsigned int ThePopulation )
: Primary( TheAlgorithm ), Subsidiary( Algorithm::ID::NoAlgorithm ),
  PopulationSize( ThePopulation ), Lower(), Upper()
{
  if ( !Algorithm::Legal( Primary ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The algorithm ID " << static_cast< int >( Primary )
                 << " does not correspond to a legal algorithm";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  if ( Algorithm::RequiresSubsidiary( Primary ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The algorithm " << Algorithm::Name( Primary )
                 << " requires a subsidiary algorithm and cannot be "
                 << "selected directly";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

bool OptimizerSelection::SupportsBounds( void ) const
{
  if ( IsBoxDecorator() )
    return true;
  else
    return Algorithm::SupportsBoundConstraints( Primary ) &&
           !Algorithm::PopulationBased( Primary );
}

std::string OptimizerSelection::Name( void ) const
{
  if ( IsBoxDecorator() )
    return "Box(" + Algorithm::Name( Subsidiary ) + ")";
  else
    return Algorithm::Name( Primary );
}

OptimizerSelection OptimizerSelection::WithBounds(
  const std::optional< Variables > & LowerBound,
  const std::optional< Variables > & UpperBound ) const
{
  OptimizerSelection Bounded( *this );
  Dimension          Size = 0;

  if ( LowerBound )
    Size = LowerBound->size();
  else if ( UpperBound )
    Size = UpperBound->size();

  Bounded.Lower = LowerBound ? *LowerBound : Variables( Size, -HUGE_VAL );
  Bounded.Upper = UpperBound ? *UpperBound : Variables( Size,  HUGE_VAL );

  return Bounded;
}

OptimizerSelection OptimizerSelection::BoxConstrained(
  const OptimizerSelection & Unbounded )
{
  if ( Unbounded.IsBoxDecorator() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The optimizer " << Unbounded.Name()
                 << " is already restricted to a box";

    throw std::logic_error( ErrorMessage.str() );
  }

  OptimizerSelection Decorator( Unbounded );

  Decorator.Subsidiary = Unbounded.Primary;
  Decorator.Primary    = Algorithm::Global::Penalty;

  return Decorator;
}

// -----------------------------------------------------------------------------
// Classification
// -----------------------------------------------------------------------------

std::string to_string( SolvePath Path )
{
  switch( Path )
  {
    case SolvePath::Unconstrained:
      return "unconstrained";
    case SolvePath::BoxConstrained:
      return "box constrained";
    case SolvePath::Constrained:
      return "constrained";
  }

  return "unknown";
}

Classification Classify( const Problem & TheProblem,
                         const OptimizerSelection & Requested )
{
  if ( Requested.SupportsConstraints() )
    return Classification( Requested, SolvePath::Constrained );

  if ( TheProblem.HasBounds() )
  {
    if ( Requested.SupportsBounds() )
      return Classification( Requested, SolvePath::BoxConstrained );
    else if ( Requested.PopulationBased() )
      return Classification(
        Requested.WithBounds( TheProblem.LowerBounds, TheProblem.UpperBounds ),
        SolvePath::Unconstrained );
    else if ( Requested.IgnoresBounds() )
    {
      std::ostringstream Explanation;

      Explanation << "The algorithm " << Requested.Name()
                  << " cannot respect bounds and the bounds of the problem "
                  << "will be ignored";

      ReportWarning( IncompatibleBoundsWarning( Explanation.str() ) );

      return Classification( Requested, SolvePath::Unconstrained, true );
    }
    else
      return Classification( OptimizerSelection::BoxConstrained( Requested ),
                             SolvePath::BoxConstrained );
  }

  // Without bounds in the problem, the algorithms requiring bounds will be
  // given them by the box solve procedure unless they carry them already.

  if ( Requested.RequiresBounds() && Requested.SupportsBounds() )
    return Classification( Requested, SolvePath::BoxConstrained );
  else
    return Classification( Requested, SolvePath::Unconstrained );
}

}  // End name space Polyopt::NonLinear
