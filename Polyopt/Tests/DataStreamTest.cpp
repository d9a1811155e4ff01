/*==============================================================================
Data stream test

The three data streams are tested for the order of the batches, for the
restart when the first batch is requested, and for their lengths.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <optional>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "DataStream.hpp"

namespace
{
// A batch is identified by the value of its single element

Polyopt::DataBatch Batch( double Value )
{
  Polyopt::DataBatch TheBatch( 1, 1 );

  TheBatch.fill( Value );
  return TheBatch;
}

}

TEST( NoDataStream, RepeatsTheEmptyBatch )
{
  Polyopt::NoData Stream;

  std::optional< Polyopt::DataBatch > Current = Stream.First();

  ASSERT_TRUE( Current.has_value() );
  EXPECT_EQ( Current->n_elem, 0u );

  for ( int i = 0; i < 1000; i++ )
  {
    Current = Stream.Next();
    ASSERT_TRUE( Current.has_value() );
    EXPECT_EQ( Current->n_elem, 0u );
  }

  EXPECT_EQ( Stream.Length(), std::optional< std::size_t >( 1 ) );
  EXPECT_TRUE( Stream.IsSentinel() );
}

TEST( DataSequenceStream, ReturnsTheBatchesInOrder )
{
  Polyopt::DataSequence Stream( { Batch( 1 ), Batch( 2 ), Batch( 3 ) } );

  EXPECT_EQ( Stream.Length(), std::optional< std::size_t >( 3 ) );
  EXPECT_FALSE( Stream.IsSentinel() );

  EXPECT_DOUBLE_EQ( Stream.First()->at( 0 ), 1.0 );
  EXPECT_DOUBLE_EQ( Stream.Next()->at( 0 ),  2.0 );
  EXPECT_DOUBLE_EQ( Stream.Next()->at( 0 ),  3.0 );
  EXPECT_FALSE( Stream.Next().has_value() );
  EXPECT_FALSE( Stream.Next().has_value() );
}

TEST( DataSequenceStream, RestartsFromTheFirstBatch )
{
  Polyopt::DataSequence Stream( { Batch( 1 ), Batch( 2 ) } );

  Stream.First();
  Stream.Next();

  EXPECT_DOUBLE_EQ( Stream.First()->at( 0 ), 1.0 );
  EXPECT_DOUBLE_EQ( Stream.Next()->at( 0 ),  2.0 );
}

TEST( DataSequenceStream, EmptySequenceHasNoFirstBatch )
{
  Polyopt::DataSequence Stream( std::vector< Polyopt::DataBatch >{} );

  EXPECT_FALSE( Stream.First().has_value() );
  EXPECT_EQ( Stream.Length(), std::optional< std::size_t >( 0 ) );
}

TEST( DataGeneratorStream, CallsTheGeneratorAndTheRestarter )
{
  int Counter  = 0;
  int Restarts = 0;

  Polyopt::DataGenerator Stream(
    [&Counter]() -> std::optional< Polyopt::DataBatch > {
      if ( Counter < 2 )
        return Batch( ++Counter );
      else
        return std::nullopt;
    },
    [&Counter, &Restarts](){ Counter = 0; Restarts++; } );

  EXPECT_FALSE( Stream.Length().has_value() );

  EXPECT_DOUBLE_EQ( Stream.First()->at( 0 ), 1.0 );
  EXPECT_DOUBLE_EQ( Stream.Next()->at( 0 ),  2.0 );
  EXPECT_FALSE( Stream.Next().has_value() );

  EXPECT_DOUBLE_EQ( Stream.First()->at( 0 ), 1.0 );
  EXPECT_EQ( Restarts, 2 );
}

TEST( DataGeneratorStream, RequiresAGenerator )
{
  Polyopt::DataGenerator::Generator NoGenerator;

  EXPECT_THROW( Polyopt::DataGenerator Stream( NoGenerator ),
                std::invalid_argument );
}
