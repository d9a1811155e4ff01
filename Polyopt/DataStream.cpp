/*==============================================================================
Data stream

The cursor of the sequence points at the batch to be returned by the next
call to the next batch function.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <sstream>                    // For error reporting
#include <stdexcept>                  // For standard exceptions

#include "DataStream.hpp"

namespace Polyopt
{
// -----------------------------------------------------------------------------
// Data sequence
// -----------------------------------------------------------------------------

std::optional< DataBatch > DataSequence::First( void )
{
  Cursor = 0;
  return Next();
}

std::optional< DataBatch > DataSequence::Next( void )
{
  if ( Cursor < Batches.size() )
    return Batches[ Cursor++ ];
  else
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// Data generator
// -----------------------------------------------------------------------------

DataGenerator::DataGenerator( Generator TheGenerator, Restarter TheRestart )
: DataStream(), NextBatch( TheGenerator ), Restart( TheRestart )
{
  if ( !NextBatch )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "A data generator needs a function producing the batches";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

std::optional< DataBatch > DataGenerator::First( void )
{
  if ( Restart )
    Restart();

  return NextBatch();
}

}  // End name space Polyopt
