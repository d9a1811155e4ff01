/*==============================================================================
Command options

The demonstration program solves one of the built-in test problems with an
algorithm chosen on the command line. The command line options are processed
using Boost::Program Options in the constructor of the options class.

The following options are currently supported:

-h [ --help ]                    = help message
-a [ --algorithm <name> ]        = NLopt short name, e.g. LBFGS or NELDERMEAD
Optional parameters:
-p [ --problem <name> ]          = quadratic (default) or rosenbrock
-m [ --maximize ]                = maximize the negated test problem
-l [ --lower <x0> <x1> ]         = lower bounds on the variables
-u [ --upper <x0> <x1> ]         = upper bounds on the variables
-i [ --max-iterations <n> ]      = maximum number of evaluations
-t [ --max-time <seconds> ]      = maximum solution time
-r [ --rel-tol <value> ]         = relative tolerance on the objective
-b [ --abs-tol <value> ]         = absolute tolerance (reported as unmapped)
-n [ --population <n> ]          = population size for population methods
-v [ --progress ]                = print the objective value per iteration

Author and Copyright: Geir Horn, 2019, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_COMMAND_OPTIONS
#define POLYOPT_COMMAND_OPTIONS

#include <optional>                   // For options that may not be given
#include <string>                     // For the problem name

#include "Variables.hpp"              // Bounds
#include "Problem.hpp"                // The goal
#include "Options.hpp"                // The generic options
#include "NonLinear/Algorithms.hpp"   // The algorithm identifiers

namespace Polyopt
{

class CommandLineOptions
{
private:

  NonLinear::Algorithm::ID    Optimizer;
  std::string                 TestProblem;
  Goal                        Direction;
  std::optional< Variables >  Lower, Upper;
  unsigned int                PopulationSize;
  OptionSet                   Settings;

public:

  inline NonLinear::Algorithm::ID Algorithm( void ) const
  { return Optimizer; }

  inline std::string ProblemName( void ) const
  { return TestProblem; }

  inline Goal Sense( void ) const
  { return Direction; }

  inline const std::optional< Variables > & LowerBounds( void ) const
  { return Lower; }

  inline const std::optional< Variables > & UpperBounds( void ) const
  { return Upper; }

  inline unsigned int Population( void ) const
  { return PopulationSize; }

  inline const OptionSet & Options( void ) const
  { return Settings; }

  // The constructor must have the argument count and the argument vector
  // and it will do all the command line parsing.

  CommandLineOptions( int argc, char **argv );
  CommandLineOptions( void ) = delete;
  CommandLineOptions( const CommandLineOptions & Other ) = delete;
};

}      // End name space Polyopt
#endif // POLYOPT_COMMAND_OPTIONS
