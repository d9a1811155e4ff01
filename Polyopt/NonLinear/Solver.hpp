/*==============================================================================
Solver

The solver owns the NLopt optimizer object for one solve. It is created for
a given algorithm selection and number of variables, and it is destroyed
when the solver goes out of scope. The solver offers the NLopt settings used
by the dispatch layer as member functions checking the status returned by
NLopt.

The NLopt functions return a status code, and the codes indicating a failure
are converted to exceptions: a general failure is a runtime error, invalid
arguments give an invalid argument exception, and if NLopt runs out of memory
a system error is thrown. The other codes indicate why the algorithm stopped
and they are returned to the caller.

A box decorator selection is realised by the augmented Lagrangian algorithm
with the decorated algorithm as the subsidiary algorithm. NLopt copies the
subsidiary optimizer when it is set, and the subsidiary is therefore created
when the options are applied so that it can be given the same tolerances as
the primary algorithm.

Author and Copyright: Geir Horn, 2018-2019, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_NON_LINEAR_SOLVER
#define POLYOPT_NON_LINEAR_SOLVER

#include <chrono>                     // Search time limit in seconds
#include <optional>                   // For values that may not be set
#include <string>                     // Strings
#include <nlopt.h>                    // The C-style interface

#include "Variables.hpp"              // Basic definitions
#include "NonLinear/Selection.hpp"    // The algorithm selection
#include "NonLinear/Options.hpp"      // The algorithm options

namespace Polyopt::NonLinear
{

class Solver
{
private:

  nlopt_opt                Handle;
  const OptimizerSelection Selection;

  // The subsidiary algorithm of the box decorator

  void CreateSubsidiary( const AlgorithmOptions & Options );

public:

  // The status is checked for the NLopt functions, and an exception is thrown
  // for the status codes indicating a failure. The context is a string
  // describing the operation for the error message.

  void CheckStatus( nlopt_result Status,
                    const std::string & Context = std::string() ) const;

  // Access to the NLopt object is needed to register the functions

  inline nlopt_opt Pointer( void ) const
  { return Handle; }

  inline Dimension GetDimension( void ) const
  { return nlopt_get_dimension( Handle ); }

  inline std::string GetAlgorithmName( void ) const
  { return Selection.Name(); }

  inline int NumberOfEvaluations( void ) const
  { return nlopt_get_numevals( Handle ); }

  // ---------------------------------------------------------------------------
  // Bounds
  // ---------------------------------------------------------------------------
  //
  // The bounds must have the dimension of the solver, and infinite values
  // are used for the variables without bounds.

  void Bounds( const Variables & Lower, const Variables & Upper );

  // ---------------------------------------------------------------------------
  // Stopping criteria
  // ---------------------------------------------------------------------------
  //
  // The getter functions return a value only if the criteria is set.

  void StopValue( double TheValue );
  std::optional< double > StopValue( void ) const;

  void RelativeObjectiveValueTolerance( double Tolerance );
  std::optional< double > RelativeObjectiveValueTolerance( void ) const;

  void AbsoluteObjectiveValueTolerance( double Tolerance );
  std::optional< double > AbsoluteObjectiveValueTolerance( void ) const;

  void RelativeVariableValueTolerance( double Tolerance );
  std::optional< double > RelativeVariableValueTolerance( void ) const;

  void AbsoluteVariableValueTolerance( double Tolerance );

  void MaxNumberOfEvaluations( int Evaluations );
  std::optional< int > MaxNumberOfEvaluations( void ) const;

  void MaxTime( std::chrono::duration< double > TimeLimit );
  std::optional< std::chrono::duration< double > > MaxTime( void ) const;

  // ---------------------------------------------------------------------------
  // Algorithm parameters
  // ---------------------------------------------------------------------------

  void Population( unsigned int Size );
  void InitialStep( double Step );
  void VectorStorage( unsigned int Vectors );
  void Parameter( const std::string & Name, double Value );

  // All options are applied by the following function, which also creates
  // the subsidiary algorithm of the box decorator.

  void Apply( const AlgorithmOptions & Options );

  // ---------------------------------------------------------------------------
  // Solving
  // ---------------------------------------------------------------------------
  //
  // The solver can be stopped from the functions evaluated by the algorithm.

  void ForceStop( void );

  // The optimization starts from the given variable values, and they are
  // updated to the best point found. The objective value at this point is
  // stored in the given value. The returned status code is not checked
  // since an exception raised by one of the evaluated functions forces the
  // solver to stop, and that exception must be handled before the status.

  nlopt_result Optimize( Variables & VariableValues, double & ObjectiveValue );

  // The constructor creates the NLopt object and throws if this fails.

  Solver( const OptimizerSelection & TheSelection,
          Dimension NumberOfVariables );

  Solver( void ) = delete;
  Solver( const Solver & Other ) = delete;
  Solver & operator= ( const Solver & Other ) = delete;

  ~Solver( void );
};

}      // End name space Polyopt::NonLinear
#endif // POLYOPT_NON_LINEAR_SOLVER
