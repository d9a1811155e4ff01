/*==============================================================================
Trace

The progress is written to the standard log stream, one line per traced
evaluation.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <iostream>                   // For progress messages
#include <sstream>                    // For error reporting
#include <stdexcept>                  // For standard exceptions

#include <boost/logic/tribool.hpp>    // For the callback decision

#include "Errors.hpp"                 // Invalid callback return
#include "NonLinear/Trace.hpp"

namespace Polyopt::NonLinear
{

TraceBridge::TraceBridge( DataStream & Stream, const Callback & UserCallback,
                          ExecutionState & SolveState, bool Centroid,
                          Dimension CentroidWindow, bool Progress )
: Data( Stream ), Observer( UserCallback ), Execution( SolveState ),
  UseCentroid( Centroid ), Window( CentroidWindow > 0 ? CentroidWindow : 1 ),
  ShowProgress( Progress ), RecentPoints(), Status( State::Active ),
  Events( 0 )
{}

void TraceBridge::Start( void )
{
  std::optional< DataBatch > FirstBatch = Data.First();

  if ( !FirstBatch )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The data stream has no data for the first iteration";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  Execution.CurrentBatch = *FirstBatch;
  RecentPoints.clear();
  Status = State::Active;
  Events = 0;
}

Variables TraceBridge::Iterate( const Variables & Point )
{
  if ( !UseCentroid )
    return Point;

  RecentPoints.push_back( Point );

  if ( RecentPoints.size() > Window )
    RecentPoints.pop_front();

  Variables Centroid( Point.size(), 0.0 );

  for ( const Variables & Vertex : RecentPoints )
    for ( Dimension i = 0; i < Centroid.size(); i++ )
      Centroid[i] += Vertex[i];

  for ( VariableType & Element : Centroid )
    Element /= RecentPoints.size();

  return Centroid;
}

bool TraceBridge::operator() ( const Variables & Point )
{
  if ( Status == State::Halted )
    return true;

  Events++;

  Variables             TheIterate( Iterate( Point ) );
  boost::logic::tribool Decision( false );

  if ( Observer )
    Decision = Observer( TheIterate, Execution.LastOutput );

  if ( boost::logic::indeterminate( Decision ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The callback must return true or false, but it did not "
                 << "decide at iteration " << Events;

    throw InvalidCallbackReturn( ErrorMessage.str() );
  }

  if ( ShowProgress )
    std::clog << "Iteration " << Events << ": objective value "
              << Execution.LastOutput.Value << std::endl;

  std::optional< DataBatch > NextBatch = Data.Next();

  if ( !NextBatch )
    Status = State::Halted;
  else
  {
    Execution.CurrentBatch = *NextBatch;

    if ( Decision )
      Status = State::Halted;
  }

  return Status == State::Halted;
}

}  // End name space Polyopt::NonLinear
