/*==============================================================================
Command options

This implements the parsing of the command line options for the solver
demonstration.

Author and Copyright: Geir Horn, 2019, 2024
License: LGPL 3.0
==============================================================================*/

#include <chrono>                     // For the time limit
#include <cstdlib>                    // For exit codes
#include <iostream>                   // Printing errors
#include <stdexcept>                  // Unknown algorithms
#include <string>                     // Standard strings
#include <vector>                     // Standard vectors

#include <boost/program_options.hpp>  // Option parser

#include "Tools/CommandOptions.hpp"

namespace cmd = boost::program_options;

Polyopt::CommandLineOptions::CommandLineOptions( int argc, char **argv )
: Optimizer( NonLinear::Algorithm::ID::NoAlgorithm ),
  TestProblem("quadratic"), Direction( Goal::Minimize ),
  Lower(), Upper(), PopulationSize( 0 ), Settings()
{
  cmd::options_description Description("Allowed options");
  cmd::variables_map       Values;

  Description.add_options()
    ( "help,h", "Produce this help message" )
    ( "algorithm,a", cmd::value< std::string >()->required(),
                "NLopt short name of the algorithm, e.g. LBFGS" )
    ( "problem,p", cmd::value< std::string >(),
                "Test problem: quadratic or rosenbrock" )
    ( "maximize,m", "Maximize the negated test problem" )
    ( "lower,l", cmd::value< std::vector< double > >()->multitoken(),
                "Lower bounds on the two variables" )
    ( "upper,u", cmd::value< std::vector< double > >()->multitoken(),
                "Upper bounds on the two variables" )
    ( "max-iterations,i", cmd::value< unsigned long int >(),
                "Maximum number of objective evaluations" )
    ( "max-time,t", cmd::value< double >(),
                "Maximum solution time in seconds" )
    ( "rel-tol,r", cmd::value< double >(),
                "Relative tolerance on the objective value" )
    ( "abs-tol,b", cmd::value< double >(),
                "Absolute tolerance on the objective value" )
    ( "population,n", cmd::value< unsigned int >(),
                "Population size of the population based algorithms" )
    ( "progress,v", "Print the objective value for each iteration" );

  cmd::store( cmd::parse_command_line( argc, argv, Description), Values );

  if ( Values.count("help") > 0 )
  {
    std::cout << Description << std::endl;
    exit( EXIT_SUCCESS );
  }

  cmd::notify( Values );

  // The algorithm name is parsed by the algorithm class and an unknown name
  // is reported and terminates the program.

  try
  {
    Optimizer = NonLinear::Algorithm::Parse(
                Values["algorithm"].as< std::string >() );
  }
  catch ( const std::invalid_argument & Error )
  {
    std::cout << "The algorithm " << Values["algorithm"].as< std::string >()
              << " is not supported: " << Error.what() << std::endl;
    exit( EXIT_FAILURE );
  }

  if ( Values.count("problem") > 0 )
  {
    TestProblem = Values["problem"].as< std::string >();

    if ( TestProblem != "quadratic" && TestProblem != "rosenbrock" )
    {
      std::cout << "The test problem must be quadratic or rosenbrock, and "
                << TestProblem << " is unknown" << std::endl;
      exit( EXIT_FAILURE );
    }
  }

  if ( Values.count("maximize") > 0 )
    Direction = Goal::Maximize;

  // Both test problems have two variables and the bounds must have two
  // values if they are given.

  for ( const std::string & Side : { std::string("lower"),
                                     std::string("upper") } )
    if ( Values.count( Side ) > 0 )
    {
      Variables Bound( Values[ Side ].as< std::vector< double > >() );

      if ( Bound.size() != 2 )
      {
        std::cout << "The " << Side << " bounds must have two values but "
                  << Bound.size() << " were given" << std::endl;
        exit( EXIT_FAILURE );
      }

      if ( Side == "lower" )
        Lower = Bound;
      else
        Upper = Bound;
    }

  if ( Values.count("max-iterations") > 0 )
    Settings.MaxIterations = Values["max-iterations"].as< unsigned long int >();

  if ( Values.count("max-time") > 0 )
    Settings.MaxTime = std::chrono::duration< double >(
                       Values["max-time"].as< double >() );

  if ( Values.count("rel-tol") > 0 )
    Settings.RelativeTolerance = Values["rel-tol"].as< double >();

  if ( Values.count("abs-tol") > 0 )
    Settings.AbsoluteTolerance = Values["abs-tol"].as< double >();

  if ( Values.count("population") > 0 )
    PopulationSize = Values["population"].as< unsigned int >();

  if ( Values.count("progress") > 0 )
    Settings.ShowProgress = true;
}
