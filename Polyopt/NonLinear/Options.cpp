/*==============================================================================
Algorithm options

The iteration budget is converted to the integer type used by NLopt with a
Boost numeric cast throwing if the budget cannot be represented.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <sstream>                           // For messages

#include <boost/numeric/conversion/cast.hpp> // Casting numeric types

#include "Errors.hpp"                        // For the warnings
#include "NonLinear/Options.hpp"

namespace Polyopt::NonLinear
{

std::optional< double >
AlgorithmOptions::NativeOption( const std::string & Name ) const
{
  auto Option = Native.find( Name );

  if ( Option != Native.end() )
    return Option->second;
  else
    return std::nullopt;
}

AlgorithmOptions MapOptions( const OptionSet & Generic,
                             const TraceHook & Hook,
                             const std::string & AlgorithmName )
{
  AlgorithmOptions Mapped;

  if ( Generic.MaxIterations )
    Mapped.MaxEvaluations = boost::numeric_cast< int >( *Generic.MaxIterations );

  if ( Generic.MaxTime )
    Mapped.MaxTime = Generic.MaxTime->count();

  if ( Generic.RelativeTolerance )
    Mapped.ObjectiveTolerance = *Generic.RelativeTolerance;

  if ( Generic.AbsoluteTolerance )
  {
    std::ostringstream Explanation;

    Explanation << "The common absolute tolerance is currently not used by "
                << AlgorithmName;

    ReportWarning( UnmappedOptionWarning( Explanation.str() ) );
  }

  Mapped.Trace  = Hook;
  Mapped.Native = Generic.Native;

  return Mapped;
}

}  // End name space Polyopt::NonLinear
