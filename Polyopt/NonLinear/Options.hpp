/*==============================================================================
Algorithm options

The generic options are mapped to the options understood by the NLopt
algorithms. The mapping is

  Maximum iterations -> Maximum number of objective evaluations
  Maximum time       -> Maximum time in seconds
  Relative tolerance -> Relative tolerance on the objective value
  Callback           -> The trace hook called after each evaluation

NLopt has no absolute tolerance matching the generic absolute tolerance, and
if it is given, a warning is reported and the option is ignored. The NLopt
objective function always receives the point to evaluate, so the trace hook
always has access to the current iterate and nothing more is needed for the
callback to inspect it.

The native options are passed on to the solver by name. The following names
are recognised and set by the corresponding NLopt function:

  StopValue                   nlopt_set_stopval
  ObjectiveAbsoluteTolerance  nlopt_set_ftol_abs
  VariableTolerance           nlopt_set_xtol_rel
  AbsoluteVariableTolerance   nlopt_set_xtol_abs1
  InitialStep                 nlopt_set_initial_step1
  Population                  nlopt_set_population
  VectorStorage               nlopt_set_vector_storage
  ConstraintTolerance         Tolerance for the nonlinear constraints

Any other name is passed on as an algorithm specific parameter with
nlopt_set_param.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_NON_LINEAR_OPTIONS
#define POLYOPT_NON_LINEAR_OPTIONS

#include <functional>                 // For the trace hook
#include <map>                        // For native options
#include <optional>                   // For options that may not be set
#include <string>                     // For names

#include "Variables.hpp"              // Basic definitions
#include "Options.hpp"                // The generic options

namespace Polyopt::NonLinear
{

// The trace hook is called with the evaluated point and returns true if the
// solver should stop.

using TraceHook = std::function< bool( const Variables & Point ) >;

class AlgorithmOptions
{
public:

  std::optional< int >            MaxEvaluations;
  std::optional< double >         MaxTime;
  std::optional< double >         ObjectiveTolerance;
  TraceHook                       Trace;
  std::map< std::string, double > Native;

  // There is a utility function to look up a native option

  std::optional< double > NativeOption( const std::string & Name ) const;
};

AlgorithmOptions MapOptions( const OptionSet & Generic,
                             const TraceHook & Hook,
                             const std::string & AlgorithmName );

}      // End name space Polyopt::NonLinear
#endif // POLYOPT_NON_LINEAR_OPTIONS
