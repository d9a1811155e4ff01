/*==============================================================================
Options

The generic options are the tuning knobs that are common to most optimization
algorithms. They are all optional, and an option that is not set is left to
the default of the algorithm used. It is not defaulted here.

The callback is invoked for each iteration of the solver with the current
iterate and the outputs of the objective function at that point. It should
return true if the solver should stop and false if it should continue. The
return value is a Boost tri-state boolean [1] because a callback may not be
able to decide, and an indeterminate return is an error that stops the solve.

Options that are specific to an algorithm family can be passed on by name as
native options. The names recognised are documented with the option mapper
of the algorithm family.

References:

[1] https://www.boost.org/doc/libs/release/doc/html/tribool.html

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_OPTIONS
#define POLYOPT_OPTIONS

#include <chrono>                     // For time limits
#include <functional>                 // For the callback
#include <map>                        // For native options
#include <optional>                   // For options that may not be set
#include <string>                     // For native option names

#include <boost/logic/tribool.hpp>    // For the callback return

#include "Variables.hpp"              // Basic definitions
#include "Problem.hpp"                // Objective results

namespace Polyopt
{

using Callback = std::function< boost::logic::tribool(
  const Variables & Iterate, const ObjectiveResult & Outputs ) >;

class OptionSet
{
public:

  Callback                                        Observer;
  std::optional< unsigned long int >              MaxIterations;
  std::optional< std::chrono::duration< double > > MaxTime;
  std::optional< double >                         AbsoluteTolerance,
                                                  RelativeTolerance;
  bool                                            ShowProgress = false;
  std::map< std::string, double >                 Native;
};

}      // End name space Polyopt
#endif // POLYOPT_OPTIONS
