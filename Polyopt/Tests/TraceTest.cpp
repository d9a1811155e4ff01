/*==============================================================================
Trace test

The trace bridge is driven directly as the objective binding would do after
each evaluation, without running a solver.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <stdexcept>
#include <vector>

#include <boost/logic/tribool.hpp>
#include <gtest/gtest.h>

#include "Errors.hpp"
#include "DataStream.hpp"
#include "Options.hpp"
#include "NonLinear/Objective.hpp"
#include "NonLinear/Trace.hpp"

using namespace Polyopt;
using namespace Polyopt::NonLinear;

namespace
{
DataBatch Batch( double Value )
{
  DataBatch TheBatch( 1, 1 );

  TheBatch.fill( Value );
  return TheBatch;
}

}

TEST( TraceBridge, ContinuesWhileTheCallbackSaysSo )
{
  NoData         Stream;
  ExecutionState State;
  int            Calls = 0;
  Callback       Observer = [&Calls]( const Variables &, const ObjectiveResult & )
                            -> boost::logic::tribool { Calls++; return false; };

  TraceBridge Bridge( Stream, Observer, State, false, 1 );

  Bridge.Start();

  for ( int i = 0; i < 10; i++ )
    EXPECT_FALSE( Bridge( { 1.0 } ) );

  EXPECT_EQ( Calls, 10 );
  EXPECT_EQ( Bridge.NumberOfEvents(), 10u );
  EXPECT_EQ( Bridge.CurrentState(), TraceBridge::State::Active );
}

TEST( TraceBridge, WorksWithoutCallback )
{
  NoData         Stream;
  ExecutionState State;
  Callback       Observer;

  TraceBridge Bridge( Stream, Observer, State, false, 1 );

  Bridge.Start();

  EXPECT_FALSE( Bridge( { 1.0 } ) );
  EXPECT_FALSE( Bridge( { 2.0 } ) );
}

TEST( TraceBridge, HaltsWhenTheCallbackSaysSo )
{
  NoData         Stream;
  ExecutionState State;
  int            Calls = 0;
  Callback       Observer = [&Calls]( const Variables &, const ObjectiveResult & )
                            -> boost::logic::tribool { return ++Calls == 2; };

  TraceBridge Bridge( Stream, Observer, State, false, 1 );

  Bridge.Start();

  EXPECT_FALSE( Bridge( { 1.0 } ) );
  EXPECT_TRUE( Bridge( { 2.0 } ) );
  EXPECT_EQ( Bridge.CurrentState(), TraceBridge::State::Halted );

  // Evaluations after the halt do not reach the callback

  EXPECT_TRUE( Bridge( { 3.0 } ) );
  EXPECT_EQ( Calls, 2 );
  EXPECT_EQ( Bridge.NumberOfEvents(), 2u );
}

TEST( TraceBridge, HaltsWhenTheDataIsExhausted )
{
  DataSequence   Stream( { Batch( 1 ), Batch( 2 ), Batch( 3 ) } );
  ExecutionState State;
  int            Calls = 0;
  Callback       Observer = [&Calls]( const Variables &, const ObjectiveResult & )
                            -> boost::logic::tribool { Calls++; return false; };

  TraceBridge Bridge( Stream, Observer, State, false, 1 );

  Bridge.Start();
  EXPECT_DOUBLE_EQ( State.CurrentBatch( 0, 0 ), 1.0 );

  EXPECT_FALSE( Bridge( { 0.0 } ) );
  EXPECT_DOUBLE_EQ( State.CurrentBatch( 0, 0 ), 2.0 );

  EXPECT_FALSE( Bridge( { 0.0 } ) );
  EXPECT_DOUBLE_EQ( State.CurrentBatch( 0, 0 ), 3.0 );

  EXPECT_TRUE( Bridge( { 0.0 } ) );
  EXPECT_TRUE( Bridge( { 0.0 } ) );
  EXPECT_EQ( Calls, 3 );
}

TEST( TraceBridge, RestartsTheDataOnStart )
{
  DataSequence   Stream( { Batch( 1 ), Batch( 2 ) } );
  ExecutionState State;
  Callback       Observer;

  TraceBridge Bridge( Stream, Observer, State, false, 1 );

  Bridge.Start();
  Bridge( { 0.0 } );
  Bridge( { 0.0 } );

  EXPECT_EQ( Bridge.CurrentState(), TraceBridge::State::Halted );

  Bridge.Start();

  EXPECT_EQ( Bridge.CurrentState(), TraceBridge::State::Active );
  EXPECT_EQ( Bridge.NumberOfEvents(), 0u );
  EXPECT_DOUBLE_EQ( State.CurrentBatch( 0, 0 ), 1.0 );
}

TEST( TraceBridge, RejectsAnEmptyDataStream )
{
  DataSequence   Stream( std::vector< DataBatch >{} );
  ExecutionState State;
  Callback       Observer;

  TraceBridge Bridge( Stream, Observer, State, false, 1 );

  EXPECT_THROW( Bridge.Start(), std::invalid_argument );
}

TEST( TraceBridge, RejectsUndecidedCallbacks )
{
  NoData         Stream;
  ExecutionState State;
  Callback       Observer = []( const Variables &, const ObjectiveResult & ){
                              return boost::logic::tribool(
                                       boost::logic::indeterminate ); };

  TraceBridge Bridge( Stream, Observer, State, false, 1 );

  Bridge.Start();

  EXPECT_THROW( Bridge( { 1.0 } ), InvalidCallbackReturn );
}

TEST( TraceBridge, PassesTheObjectiveOutputs )
{
  NoData          Stream;
  ExecutionState  State;
  ObjectiveResult Seen;
  Callback        Observer = [&Seen]( const Variables &,
                                      const ObjectiveResult & Outputs )
                             -> boost::logic::tribool {
                               Seen = Outputs; return false; };

  TraceBridge Bridge( Stream, Observer, State, false, 1 );

  Bridge.Start();
  State.LastOutput = ObjectiveResult( 4.0, { 1.0, 2.0 } );
  Bridge( { 1.0 } );

  EXPECT_DOUBLE_EQ( Seen.Value, 4.0 );
  EXPECT_EQ( Seen.Auxiliary, ( std::vector< VariableType >{ 1.0, 2.0 } ) );
}

TEST( TraceBridge, ReportsTheCentroidOfTheRecentPoints )
{
  NoData                   Stream;
  ExecutionState           State;
  std::vector< Variables > Iterates;
  Callback                 Observer = [&Iterates]( const Variables & Iterate,
                                                   const ObjectiveResult & )
                                      -> boost::logic::tribool {
                                        Iterates.push_back( Iterate );
                                        return false; };

  TraceBridge Bridge( Stream, Observer, State, true, 3 );

  Bridge.Start();
  Bridge( { 0.0, 0.0 } );
  Bridge( { 3.0, 0.0 } );
  Bridge( { 0.0, 3.0 } );
  Bridge( { 3.0, 3.0 } );

  ASSERT_EQ( Iterates.size(), 4u );
  EXPECT_DOUBLE_EQ( Iterates[0][0], 0.0 );
  EXPECT_DOUBLE_EQ( Iterates[1][0], 1.5 );
  EXPECT_DOUBLE_EQ( Iterates[2][0], 1.0 );
  EXPECT_DOUBLE_EQ( Iterates[2][1], 1.0 );
  EXPECT_DOUBLE_EQ( Iterates[3][0], 2.0 );
  EXPECT_DOUBLE_EQ( Iterates[3][1], 2.0 );
}
