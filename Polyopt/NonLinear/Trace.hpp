/*==============================================================================
Trace

The trace bridge couples the data stream with the user callback. It is called
by the objective binding after each evaluation of the objective function,
and it is a state machine with two states: active and halted. When an
evaluation is traced while the bridge is active,

1. the iterate is taken as the evaluated point, or for the simplex and the
   population based algorithms the centroid of the most recently evaluated
   points,
2. the user callback is invoked with the iterate and the outputs of the
   objective function. If the callback does not return a decision an
   invalid callback return exception is thrown,
3. the data stream is advanced to the next batch. If the stream is exhausted
   the bridge halts independent of the callback decision, and otherwise it
   halts if the callback returned true.

The return value tells the objective binding whether the solver should stop.
Once halted, the callback is not invoked again even if the solver evaluates
the objective function before it stops.

The number of points used for the centroid is the population size if it is
given, and otherwise the number of variables plus one, which is the number
of vertices of the simplex.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_NON_LINEAR_TRACE
#define POLYOPT_NON_LINEAR_TRACE

#include <deque>                      // For the recent points

#include "Variables.hpp"              // Basic definitions
#include "DataStream.hpp"             // The data stream
#include "Options.hpp"                // The user callback
#include "NonLinear/Objective.hpp"    // The execution state

namespace Polyopt::NonLinear
{

class TraceBridge
{
public:

  enum class State
  {
    Active,
    Halted
  };

private:

  DataStream        & Data;
  const Callback    & Observer;
  ExecutionState    & Execution;
  const bool          UseCentroid;
  const Dimension     Window;
  const bool          ShowProgress;

  std::deque< Variables > RecentPoints;
  State                   Status;
  unsigned long int       Events;

  // The iterate reported to the callback

  Variables Iterate( const Variables & Point );

public:

  // The start function initialises the data cursor to the first batch and
  // activates the bridge. It throws if the data stream is empty.

  void Start( void );

  bool operator() ( const Variables & Point );

  inline State CurrentState( void ) const
  { return Status; }

  inline unsigned long int NumberOfEvents( void ) const
  { return Events; }

  TraceBridge( DataStream & Stream, const Callback & UserCallback,
               ExecutionState & SolveState, bool Centroid,
               Dimension CentroidWindow, bool Progress = false );

  TraceBridge( void ) = delete;
};

}      // End name space Polyopt::NonLinear
#endif // POLYOPT_NON_LINEAR_TRACE
