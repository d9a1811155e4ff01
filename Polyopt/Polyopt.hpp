/*==============================================================================
Polyopt

This header includes everything an application needs to define a problem,
combine it with an optimizer, and solve it. A typical use is

  Polyopt::Problem TheProblem( Objective, StartPoint );
  TheProblem.Gradient = Gradient;

  Polyopt::Context TheContext( TheProblem,
    Polyopt::NonLinear::OptimizerSelection(
      Polyopt::NonLinear::Algorithm::Local::LowStorageBFGS ) );

  Polyopt::Solution Result = TheContext.Solve();

The context can be re-initialised with new parameters or a new initial point
and solved again.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT
#define POLYOPT

#include "Variables.hpp"
#include "Errors.hpp"
#include "Problem.hpp"
#include "DataStream.hpp"
#include "Options.hpp"
#include "Solution.hpp"
#include "Context.hpp"
#include "NonLinear/Algorithms.hpp"
#include "NonLinear/Selection.hpp"

#endif // POLYOPT
