/*==============================================================================
Data stream

Some problems, typically parameter estimation problems, evaluate the
objective function over batches of data, and a new batch is used for each
iteration of the solver. The data stream is the source of these batches. It
may be finite or infinite, and it may be possible to restart it from the
first batch or not.

The stream is read through two functions: the first returns the first batch
of the stream restarting the stream if possible, and the next returns the
following batch. Both return an empty optional if the stream is exhausted.

There are three implementations of the stream: the no-data stream used when
the problem has no data, a sequence of batches held in memory, and a
generator calling a function to produce the next batch.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_DATA_STREAM
#define POLYOPT_DATA_STREAM

#include <cstddef>                    // For sizes
#include <functional>                 // For the generator function
#include <optional>                   // For the batches
#include <vector>                     // For the sequence

#include "Variables.hpp"              // For the data batch

namespace Polyopt
{

class DataStream
{
public:

  virtual std::optional< DataBatch > First( void ) = 0;
  virtual std::optional< DataBatch > Next ( void ) = 0;

  // The number of batches is only known for finite streams.

  virtual std::optional< std::size_t > Length( void ) const = 0;

  // The stream used when no data is given is a sentinel. It is distinguished
  // from a real data stream because a real stream limits the number of
  // iterations to the number of batches.

  virtual bool IsSentinel( void ) const
  { return false; }

  virtual ~DataStream( void )
  {}
};

// -----------------------------------------------------------------------------
// No data
// -----------------------------------------------------------------------------
//
// A problem without data gets an empty batch for every evaluation, and the
// stream is never exhausted. It has one element that is repeated.

class NoData : public DataStream
{
public:

  virtual std::optional< DataBatch > First( void ) override
  { return DataBatch(); }

  virtual std::optional< DataBatch > Next( void ) override
  { return DataBatch(); }

  virtual std::optional< std::size_t > Length( void ) const override
  { return 1; }

  virtual bool IsSentinel( void ) const override
  { return true; }

  NoData( void )
  {}
};

// -----------------------------------------------------------------------------
// Data sequence
// -----------------------------------------------------------------------------
//
// A sequence holds a fixed set of batches and returns them in order. It is
// restarted from the first element when the first batch is requested.

class DataSequence : public DataStream
{
private:

  std::vector< DataBatch > Batches;
  std::size_t              Cursor;

public:

  virtual std::optional< DataBatch > First( void ) override;
  virtual std::optional< DataBatch > Next ( void ) override;

  virtual std::optional< std::size_t > Length( void ) const override
  { return Batches.size(); }

  DataSequence( const std::vector< DataBatch > & TheBatches )
  : Batches( TheBatches ), Cursor( 0 )
  {}

  DataSequence( void ) = delete;
};

// -----------------------------------------------------------------------------
// Data generator
// -----------------------------------------------------------------------------
//
// The generator function is called for each batch and returns the empty
// optional when there are no more data. An optional restart function is
// called before the first batch is produced, and if it is not given, the
// generator just continues from where it is. The length of a generated stream
// is unknown.

class DataGenerator : public DataStream
{
public:

  using Generator = std::function< std::optional< DataBatch >( void ) >;
  using Restarter = std::function< void( void ) >;

private:

  Generator NextBatch;
  Restarter Restart;

public:

  virtual std::optional< DataBatch > First( void ) override;

  virtual std::optional< DataBatch > Next( void ) override
  { return NextBatch(); }

  virtual std::optional< std::size_t > Length( void ) const override
  { return std::nullopt; }

  DataGenerator( Generator TheGenerator, Restarter TheRestart = Restarter() );

  DataGenerator( void ) = delete;
};

}      // End name space Polyopt
#endif // POLYOPT_DATA_STREAM
