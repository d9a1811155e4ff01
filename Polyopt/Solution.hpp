/*==============================================================================
Solution

The solution returned from a solve is the same for all algorithms. It holds
the minimizer, which is the variable values found, and the minimum, which is
the objective value at the minimizer in the direction of the problem. For a
maximization problem the minimum is therefore the maximal value found. The
solution is converged if the algorithm stopped because one of its tolerances
or the stop value was reached. A solution where the algorithm was stopped by
the callback, by the data stream, by an evaluation limit or by the time limit
is not converged.

The original result of the algorithm is kept for the caller who needs the
status code of the algorithm. The objective value of the original result is
the value of the function minimized by the algorithm, i.e. with the sign
changed for maximization problems.

Author and Copyright: Geir Horn, 2019, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_SOLUTION
#define POLYOPT_SOLUTION

#include <chrono>                     // For the solution time
#include <string>                     // For the algorithm name
#include <nlopt.h>                    // For the status code

#include "Variables.hpp"              // Basic definitions

namespace Polyopt
{

class Solution
{
public:

  // The result as returned by the algorithm

  class OriginalResult
  {
  public:

    const Variables    VariableValues;
    const double       ObjectiveValue;
    const nlopt_result Status;
    const int          Evaluations;
    const std::string  Algorithm;

    OriginalResult( const Variables & VariableAssignments,
                    double ValueOfObjective, nlopt_result SolverStatus,
                    int NumberOfEvaluations, const std::string & AlgorithmName )
    : VariableValues( VariableAssignments ),
      ObjectiveValue( ValueOfObjective ), Status( SolverStatus ),
      Evaluations( NumberOfEvaluations ), Algorithm( AlgorithmName )
    {}

    OriginalResult( void ) = delete;
  };

  const Variables                       Minimizer;
  const VariableType                    Minimum;
  const bool                            Converged;
  const std::chrono::duration< double > SolveTime;
  const OriginalResult                  Original;

  Solution( const Variables & TheMinimizer, VariableType TheMinimum,
            bool HasConverged, std::chrono::duration< double > Duration,
            const OriginalResult & Result )
  : Minimizer( TheMinimizer ), Minimum( TheMinimum ),
    Converged( HasConverged ), SolveTime( Duration ), Original( Result )
  {}

  Solution( void ) = delete;
};

}      // End name space Polyopt
#endif // POLYOPT_SOLUTION
