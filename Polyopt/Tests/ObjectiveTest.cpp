/*==============================================================================
Objective test

The objective bundles evaluate the problem functions with the current
parameters and data batch, and change the sign of the value and all
derivatives for maximization problems.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <gtest/gtest.h>

#include "Problem.hpp"
#include "NonLinear/Objective.hpp"
#include "TestProblems.hpp"

using namespace Polyopt;
using namespace Polyopt::NonLinear;

namespace
{
// The test problem has a non-symmetric point so that the sign change can be
// seen on all derivatives

const Variables Point{ 2.0, 5.0 };
const Parameters Centre{ 1.0, 2.0 };

}

TEST( ObjectiveBundle, EvaluatesMinimizationProblemsUnchanged )
{
  Problem         TheProblem( Test::Quadratic() );
  ProblemFunction Functions( TheProblem );
  ExecutionState  State;
  ObjectiveBundle Bundle = UnconstrainedObjective( Functions, Goal::Minimize,
                                                   Centre, State );
  GradientVector  G;

  EXPECT_DOUBLE_EQ( Bundle.Value( Point ), 10.0 );

  Bundle.Gradient( G, Point );

  EXPECT_DOUBLE_EQ( G[0], 2.0 );
  EXPECT_DOUBLE_EQ( G[1], 6.0 );
}

TEST( ObjectiveBundle, NegatesMaximizationProblems )
{
  Problem         TheProblem( Test::Quadratic() );
  ProblemFunction Functions( TheProblem );
  ExecutionState  State;
  ObjectiveBundle Bundle = UnconstrainedObjective( Functions, Goal::Maximize,
                                                   Centre, State );
  GradientVector  G, Hv;
  HessianMatrix   H;

  EXPECT_DOUBLE_EQ( Bundle.Value( Point ), -10.0 );

  Bundle.Gradient( G, Point );

  EXPECT_DOUBLE_EQ( G[0], -2.0 );
  EXPECT_DOUBLE_EQ( G[1], -6.0 );

  Bundle.Hessian( H, Point );

  EXPECT_DOUBLE_EQ( H( 0, 0 ), -2.0 );
  EXPECT_DOUBLE_EQ( H( 1, 1 ), -2.0 );
  EXPECT_DOUBLE_EQ( H( 0, 1 ),  0.0 );

  Bundle.HessianVector( Hv, Point, { 1.0, 3.0 } );

  EXPECT_DOUBLE_EQ( Hv[0], -2.0 );
  EXPECT_DOUBLE_EQ( Hv[1], -6.0 );
}

TEST( ObjectiveBundle, RecordsTheUnchangedOutputs )
{
  Problem         TheProblem( Test::Quadratic() );
  ProblemFunction Functions( TheProblem );
  ExecutionState  State;
  ObjectiveBundle Bundle = UnconstrainedObjective( Functions, Goal::Maximize,
                                                   Centre, State );

  Bundle.Value( Point );

  EXPECT_EQ( State.LastPoint, Point );
  EXPECT_DOUBLE_EQ( State.LastOutput.Value, 10.0 );
}

TEST( ObjectiveBundle, ReadsTheCurrentParametersAndBatch )
{
  Problem TheProblem(
    []( const Variables & x, const Parameters & p, const DataBatch & Batch )
    -> ObjectiveResult {
      return p[0] * x[0] + ( Batch.n_elem > 0 ? Batch( 0, 0 ) : 0.0 );
    }, Variables{ 0.0 }, Parameters{ 1.0 } );

  ProblemFunction Functions( TheProblem );
  ExecutionState  State;
  Parameters      Values{ 2.0 };
  ObjectiveBundle Bundle = UnconstrainedObjective( Functions, Goal::Minimize,
                                                   Values, State );

  EXPECT_DOUBLE_EQ( Bundle.Value( { 3.0 } ), 6.0 );

  Values[0] = 3.0;
  State.CurrentBatch = DataBatch( 1, 1 );
  State.CurrentBatch( 0, 0 ) = 0.5;

  EXPECT_DOUBLE_EQ( Bundle.Value( { 3.0 } ), 9.5 );
}

TEST( ObjectiveBundle, LeavesMissingFunctionsEmpty )
{
  Problem TheProblem( Test::Quadratic() );

  TheProblem.Gradient = GradientFunction();
  TheProblem.Hessian  = HessianFunction();

  ProblemFunction Functions( TheProblem );
  ExecutionState  State;

  ObjectiveBundle Unconstrained = UnconstrainedObjective( Functions,
                                  Goal::Minimize, Centre, State );
  ObjectiveBundle Box = BoxConstrainedObjective( Functions, Goal::Minimize,
                                                 Centre, State );

  EXPECT_TRUE( Unconstrained.Value );
  EXPECT_FALSE( Unconstrained.Gradient );
  EXPECT_FALSE( Unconstrained.Hessian );
  EXPECT_FALSE( Unconstrained.HessianVector );
  EXPECT_FALSE( Box.ValueGradient );
}

TEST( ObjectiveBundle, CombinesTheValueAndTheGradientForBoxes )
{
  Problem         TheProblem( Test::Quadratic() );
  ProblemFunction Functions( TheProblem );
  ExecutionState  State;
  ObjectiveBundle Bundle = BoxConstrainedObjective( Functions, Goal::Maximize,
                                                    Centre, State );
  GradientVector  G;

  EXPECT_FALSE( Bundle.Hessian );
  ASSERT_TRUE( Bundle.ValueGradient );
  EXPECT_DOUBLE_EQ( Bundle.ValueGradient( G, Point ), -10.0 );
  EXPECT_DOUBLE_EQ( G[1], -6.0 );
  EXPECT_EQ( State.LastPoint, Point );
}

TEST( ObjectiveBundle, ComputesTheProductFromTheNegatedHessian )
{
  Problem         TheProblem( Test::Quadratic() );
  ProblemFunction Functions( TheProblem );
  ExecutionState  State;
  ObjectiveBundle Bundle = ConstrainedObjective( Functions, Goal::Maximize,
                                                 Centre, State );
  GradientVector  Hv;

  ASSERT_TRUE( Bundle.HessianVector );

  Bundle.HessianVector( Hv, Point, { 0.5, -1.0 } );

  ASSERT_EQ( Hv.size(), 2u );
  EXPECT_DOUBLE_EQ( Hv[0], -1.0 );
  EXPECT_DOUBLE_EQ( Hv[1],  2.0 );
}
