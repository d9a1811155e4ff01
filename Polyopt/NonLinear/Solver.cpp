/*==============================================================================
Solver

The implementation of the setters follows the same pattern: the NLopt
function is called and the returned status is checked. The getters return
a value only if NLopt reports a value different from the value indicating
that the criteria is not set.

Author and Copyright: Geir Horn, 2018-2019, 2024
License: LGPL 3.0
==============================================================================*/

#include <cerrno>                            // System error codes
#include <cmath>                             // For HUGE_VAL
#include <memory>                            // For the subsidiary solver
#include <sstream>                           // For error messages
#include <stdexcept>                         // For standard exceptions
#include <system_error>                      // Error categories

#include <boost/numeric/conversion/cast.hpp> // Casting numeric types

#include "NonLinear/Solver.hpp"

namespace Polyopt::NonLinear
{
// -----------------------------------------------------------------------------
// Creating and deleting the solver
// -----------------------------------------------------------------------------

Solver::Solver( const OptimizerSelection & TheSelection,
                Dimension NumberOfVariables )
: Handle( nullptr ), Selection( TheSelection )
{
  Handle = nlopt_create(
    static_cast< nlopt_algorithm >( Selection.PrimaryAlgorithm() ),
    boost::numeric_cast< unsigned int >( NumberOfVariables ) );

  if ( Handle == nullptr )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Failed to allocate NLopt solver for "
                 << Selection.Name();

    throw std::runtime_error( ErrorMessage.str() );
  }

  if ( Selection.Population() > 0 )
    Population( Selection.Population() );
}

Solver::~Solver( void )
{
  if ( Handle != nullptr )
    nlopt_destroy( Handle );
}

// The subsidiary solver of the box decorator is given the tolerances of the
// primary solver. The objective function and the bounds of the subsidiary
// solver are set by the augmented Lagrangian algorithm.

void Solver::CreateSubsidiary( const AlgorithmOptions & Options )
{
  std::unique_ptr< nlopt_opt_s, decltype( &nlopt_destroy ) > LocalSolver(
    nlopt_create(
      static_cast< nlopt_algorithm >( Selection.SubsidiaryAlgorithm() ),
      GetDimension() ),
    &nlopt_destroy );

  if ( !LocalSolver )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Failed to create the subsidiary solver for "
                 << Selection.Name();

    throw std::runtime_error( ErrorMessage.str() );
  }

  if ( Options.ObjectiveTolerance )
    CheckStatus( nlopt_set_ftol_rel( LocalSolver.get(),
                                     *Options.ObjectiveTolerance ),
                 "setting the subsidiary objective tolerance" );

  if ( auto Tolerance = Options.NativeOption( "VariableTolerance" ) )
    CheckStatus( nlopt_set_xtol_rel( LocalSolver.get(), *Tolerance ),
                 "setting the subsidiary variable tolerance" );

  if ( auto Vectors = Options.NativeOption( "VectorStorage" ) )
    CheckStatus( nlopt_set_vector_storage( LocalSolver.get(),
                   boost::numeric_cast< unsigned int >( *Vectors ) ),
                 "setting the subsidiary vector storage" );

  // Setting the local optimizer stores a copy of the local solver, which is
  // destroyed when leaving this function.

  CheckStatus( nlopt_set_local_optimizer( Handle, LocalSolver.get() ),
               "setting the subsidiary solver" );
}

// -----------------------------------------------------------------------------
// Error handling
// -----------------------------------------------------------------------------

void Solver::CheckStatus( nlopt_result Status,
                          const std::string & Context ) const
{
  switch( Status )
  {
    case NLOPT_FAILURE:
      {
        std::ostringstream ErrorMessage;

        ErrorMessage << "General failure when " << Context << " for "
                     << Selection.Name();

        throw std::runtime_error( ErrorMessage.str() );
      }
      break;
    case NLOPT_INVALID_ARGS:
      {
        std::ostringstream ErrorMessage;

        ErrorMessage << "The operation " << Context
                     << " was performed with invalid arguments for the "
                     << "algorithm " << Selection.Name();

        throw std::invalid_argument( ErrorMessage.str() );
      }
      break;
    case NLOPT_OUT_OF_MEMORY:
      // Ideally a bad_alloc exception should be thrown but it does not allow
      // for a descriptive message, and it is also not sure that it really was
      // bad allocation. A standard system error is therefore generated.

      throw std::system_error( ENOMEM, std::generic_category(), Context );
      break;
    default:
      break; // Not a failure
  }
}

// -----------------------------------------------------------------------------
// Bounds
// -----------------------------------------------------------------------------

void Solver::Bounds( const Variables & Lower, const Variables & Upper )
{
  if ( Lower.size() != GetDimension() || Upper.size() != GetDimension() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The bounds have dimensions " << Lower.size() << " and "
                 << Upper.size() << " for a solver of dimension "
                 << GetDimension();

    throw std::invalid_argument( ErrorMessage.str() );
  }

  CheckStatus( nlopt_set_lower_bounds( Handle, Lower.data() ),
               "setting the lower bounds" );
  CheckStatus( nlopt_set_upper_bounds( Handle, Upper.data() ),
               "setting the upper bounds" );
}

// -----------------------------------------------------------------------------
// Stopping criteria
// -----------------------------------------------------------------------------

void Solver::StopValue( double TheValue )
{
  CheckStatus( nlopt_set_stopval( Handle, TheValue ),
               "setting a stop value for the solver" );
}

std::optional< double > Solver::StopValue( void ) const
{
  double Value = nlopt_get_stopval( Handle );

  if ( std::abs( Value ) < HUGE_VAL )
    return Value;
  else
    return std::nullopt;
}

// The tolerance is relative to the function value, and the change in the
// objective value is compared with the tolerance multiplied by the objective
// value. Tolerances that are not set are zero.

void Solver::RelativeObjectiveValueTolerance( double Tolerance )
{
  CheckStatus( nlopt_set_ftol_rel( Handle, Tolerance ),
               "setting the relative objective value tolerance" );
}

std::optional< double > Solver::RelativeObjectiveValueTolerance( void ) const
{
  double Tolerance = nlopt_get_ftol_rel( Handle );

  if ( Tolerance > 0.0 )
    return Tolerance;
  else
    return std::nullopt;
}

void Solver::AbsoluteObjectiveValueTolerance( double Tolerance )
{
  CheckStatus( nlopt_set_ftol_abs( Handle, Tolerance ),
               "setting the absolute objective value tolerance" );
}

std::optional< double > Solver::AbsoluteObjectiveValueTolerance( void ) const
{
  double Tolerance = nlopt_get_ftol_abs( Handle );

  if ( Tolerance > 0.0 )
    return Tolerance;
  else
    return std::nullopt;
}

void Solver::RelativeVariableValueTolerance( double Tolerance )
{
  CheckStatus( nlopt_set_xtol_rel( Handle, Tolerance ),
               "setting the relative variable value tolerance" );
}

std::optional< double > Solver::RelativeVariableValueTolerance( void ) const
{
  double Tolerance = nlopt_get_xtol_rel( Handle );

  if ( Tolerance > 0.0 )
    return Tolerance;
  else
    return std::nullopt;
}

// The absolute variable tolerance is the same for all variables

void Solver::AbsoluteVariableValueTolerance( double Tolerance )
{
  CheckStatus( nlopt_set_xtol_abs1( Handle, Tolerance ),
               "setting the absolute variable value tolerance" );
}

void Solver::MaxNumberOfEvaluations( int Evaluations )
{
  CheckStatus( nlopt_set_maxeval( Handle, Evaluations ),
               "setting the maximal number of evaluations" );
}

std::optional< int > Solver::MaxNumberOfEvaluations( void ) const
{
  int Evaluations = nlopt_get_maxeval( Handle );

  if ( Evaluations > 0 )
    return Evaluations;
  else
    return std::nullopt;
}

void Solver::MaxTime( std::chrono::duration< double > TimeLimit )
{
  CheckStatus( nlopt_set_maxtime( Handle, TimeLimit.count() ),
               "setting the maximal search time" );
}

std::optional< std::chrono::duration< double > > Solver::MaxTime( void ) const
{
  double Seconds = nlopt_get_maxtime( Handle );

  if ( Seconds > 0.0 )
    return std::chrono::duration< double >( Seconds );
  else
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// Algorithm parameters
// -----------------------------------------------------------------------------

void Solver::Population( unsigned int Size )
{
  CheckStatus( nlopt_set_population( Handle, Size ),
               "setting the population size" );
}

void Solver::InitialStep( double Step )
{
  CheckStatus( nlopt_set_initial_step1( Handle, Step ),
               "setting the initial step" );
}

void Solver::VectorStorage( unsigned int Vectors )
{
  CheckStatus( nlopt_set_vector_storage( Handle, Vectors ),
               "setting the vector storage" );
}

void Solver::Parameter( const std::string & Name, double Value )
{
  CheckStatus( nlopt_set_param( Handle, Name.c_str(), Value ),
               "setting the parameter " + Name );
}

// The native options are recognised by name and set by the corresponding
// function. The constraint tolerance is used when the constraints are
// registered and it is therefore skipped here.

void Solver::Apply( const AlgorithmOptions & Options )
{
  if ( Options.MaxEvaluations )
    MaxNumberOfEvaluations( *Options.MaxEvaluations );

  if ( Options.MaxTime )
    MaxTime( std::chrono::duration< double >( *Options.MaxTime ) );

  if ( Options.ObjectiveTolerance )
    RelativeObjectiveValueTolerance( *Options.ObjectiveTolerance );

  for ( const auto & [ Name, Value ] : Options.Native )
    if ( Name == "StopValue" )
      StopValue( Value );
    else if ( Name == "ObjectiveAbsoluteTolerance" )
      AbsoluteObjectiveValueTolerance( Value );
    else if ( Name == "VariableTolerance" )
      RelativeVariableValueTolerance( Value );
    else if ( Name == "AbsoluteVariableTolerance" )
      AbsoluteVariableValueTolerance( Value );
    else if ( Name == "InitialStep" )
      InitialStep( Value );
    else if ( Name == "Population" )
      Population( boost::numeric_cast< unsigned int >( Value ) );
    else if ( Name == "VectorStorage" )
      VectorStorage( boost::numeric_cast< unsigned int >( Value ) );
    else if ( Name != "ConstraintTolerance" )
      Parameter( Name, Value );

  if ( Selection.IsBoxDecorator() )
    CreateSubsidiary( Options );
}

// -----------------------------------------------------------------------------
// Solving
// -----------------------------------------------------------------------------

void Solver::ForceStop( void )
{
  CheckStatus( nlopt_force_stop( Handle ), "forcing the solver to stop" );
}

nlopt_result Solver::Optimize( Variables & VariableValues,
                               double & ObjectiveValue )
{
  if ( VariableValues.size() != GetDimension() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The initial point has " << VariableValues.size()
                 << " variables for a solver of dimension " << GetDimension();

    throw std::invalid_argument( ErrorMessage.str() );
  }

  return nlopt_optimize( Handle, VariableValues.data(), &ObjectiveValue );
}

}  // End name space Polyopt::NonLinear
