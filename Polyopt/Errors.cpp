/*==============================================================================
Errors

The warning handler is a global function object since warnings may be raised
both when the context is built and during the solve. The default handler
writes the explanation of the warning to the standard error stream.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <iostream>                   // For the default warning output
#include <utility>                    // For swapping the handler

#include "Errors.hpp"

namespace Polyopt
{

namespace
{
void DefaultWarningHandler( const Warning & TheWarning )
{
  std::cerr << "Warning: " << TheWarning.what() << std::endl;
}

WarningHandler CurrentHandler( &DefaultWarningHandler );
}

WarningHandler SetWarningHandler( WarningHandler NewHandler )
{
  if ( !NewHandler )
    NewHandler = &DefaultWarningHandler;

  std::swap( CurrentHandler, NewHandler );
  return NewHandler;
}

void ReportWarning( const Warning & TheWarning )
{
  CurrentHandler( TheWarning );
}

}  // End name space Polyopt
