/*==============================================================================
Solve demonstration

The demonstration solves one of two test problems with two variables:

quadratic:  f(x) = (x[0] - 1)^2 + (x[1] - 2)^2 with minimum at (1,2)
rosenbrock: f(x) = (1 - x[0])^2 + 100 (x[1] - x[0]^2)^2 with minimum at (1,1)

Both problems provide the gradient and the Hessian. If maximization is asked
for, the negated function is maximized, which has the same solution. The
problem is solved with the algorithm given on the command line, and the
solution is printed together with the solve path chosen for the algorithm.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <cmath>                      // For the test functions
#include <cstdlib>                    // For exit codes
#include <exception>                  // For standard exceptions
#include <iostream>                   // For printing the solution

#include "Polyopt.hpp"                // The optimization interface
#include "Tools/CommandOptions.hpp"   // The command line

namespace
{
// The problem is defined for minimization, and the sign is changed for
// maximization.

Polyopt::Problem TestProblem( const std::string & Name, Polyopt::Goal Sense )
{
  using namespace Polyopt;

  const VariableType Sign = ( Sense == Goal::Maximize ) ? -1.0 : 1.0;

  if ( Name == "rosenbrock" )
  {
    Problem Rosenbrock(
      [=]( const Variables & x, const Parameters &, const DataBatch & )
      -> ObjectiveResult {
        return Sign * ( std::pow( 1.0 - x[0], 2 )
                        + 100.0 * std::pow( x[1] - x[0]*x[0], 2 ) );
      }, Variables{ -1.2, 1.0 }, Parameters(), Sense );

    Rosenbrock.Gradient =
      [=]( const Variables & x, const Parameters &, const DataBatch & ){
        return GradientVector{
          Sign * ( -2.0*( 1.0 - x[0] ) - 400.0*x[0]*( x[1] - x[0]*x[0] ) ),
          Sign * ( 200.0*( x[1] - x[0]*x[0] ) ) };
      };

    Rosenbrock.Hessian =
      [=]( const Variables & x, const Parameters &, const DataBatch & ){
        HessianMatrix H( 2, 2 );

        H(0,0) = Sign * ( 2.0 - 400.0*x[1] + 1200.0*x[0]*x[0] );
        H(0,1) = Sign * ( -400.0*x[0] );
        H(1,0) = H(0,1);
        H(1,1) = Sign * 200.0;

        return H;
      };

    return Rosenbrock;
  }

  Problem Quadratic(
    [=]( const Variables & x, const Parameters &, const DataBatch & )
    -> ObjectiveResult {
      return Sign * ( std::pow( x[0] - 1.0, 2 ) + std::pow( x[1] - 2.0, 2 ) );
    }, Variables{ 0.0, 0.0 }, Parameters(), Sense );

  Quadratic.Gradient =
    [=]( const Variables & x, const Parameters &, const DataBatch & ){
      return GradientVector{ Sign * 2.0 * ( x[0] - 1.0 ),
                             Sign * 2.0 * ( x[1] - 2.0 ) };
    };

  Quadratic.Hessian =
    [=]( const Variables &, const Parameters &, const DataBatch & ){
      HessianMatrix H( 2, 2, arma::fill::zeros );

      H(0,0) = Sign * 2.0;
      H(1,1) = Sign * 2.0;

      return H;
    };

  return Quadratic;
}

}   // Anonymous name space

int main( int argc, char **argv )
{
  Polyopt::CommandLineOptions Options( argc, argv );

  Polyopt::Problem TheProblem( TestProblem( Options.ProblemName(),
                                            Options.Sense() ) );

  TheProblem.LowerBounds = Options.LowerBounds();
  TheProblem.UpperBounds = Options.UpperBounds();

  try
  {
    Polyopt::Context TheContext( TheProblem,
      Polyopt::NonLinear::OptimizerSelection( Options.Algorithm(),
                                              Options.Population() ),
      nullptr, Options.Options() );

    std::cout << "Solving the " << Options.ProblemName() << " problem with "
              << TheContext.Selection().Name() << " on the "
              << Polyopt::NonLinear::to_string( TheContext.Path() )
              << " path" << std::endl;

    Polyopt::Solution Result = TheContext.Solve();

    std::cout << "Minimizer: [ ";

    for ( Polyopt::VariableType Value : Result.Minimizer )
      std::cout << Value << " ";

    std::cout << "]" << std::endl
              << "Minimum: " << Result.Minimum << std::endl
              << "Converged: " << std::boolalpha << Result.Converged
              << std::endl
              << "Evaluations: " << Result.Original.Evaluations << std::endl
              << "Time: " << Result.SolveTime.count() << " seconds"
              << std::endl;
  }
  catch ( const std::exception & Error )
  {
    std::cerr << Error.what() << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
