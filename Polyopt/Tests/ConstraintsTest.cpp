/*==============================================================================
Constraints test

The partition of bounded constraints into NLopt inequality and equality
constraints, and the functions of the constraint bundle.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <cmath>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "Problem.hpp"
#include "NonLinear/Constraints.hpp"
#include "TestProblems.hpp"

using namespace Polyopt;
using namespace Polyopt::NonLinear;

// -----------------------------------------------------------------------------
// Partition
// -----------------------------------------------------------------------------

TEST( ConstraintPartition, SeparatesEqualitiesAndInequalities )
{
  ConstraintPartition Partition( { 0.0, -HUGE_VAL, 1.0,      -HUGE_VAL },
                                 { 0.0,  2.0,      HUGE_VAL,  HUGE_VAL } );

  ASSERT_EQ( Partition.Equalities.size(), 1u );
  EXPECT_EQ( Partition.Equalities[0].Index, 0u );
  EXPECT_DOUBLE_EQ( Partition.Equalities[0].Bound, 0.0 );

  ASSERT_EQ( Partition.Inequalities.size(), 2u );
  EXPECT_EQ( Partition.Inequalities[0].Index, 1u );
  EXPECT_DOUBLE_EQ( Partition.Inequalities[0].Bound, 2.0 );
  EXPECT_DOUBLE_EQ( Partition.Inequalities[0].Sign, 1.0 );
  EXPECT_EQ( Partition.Inequalities[1].Index, 2u );
  EXPECT_DOUBLE_EQ( Partition.Inequalities[1].Bound, 1.0 );
  EXPECT_DOUBLE_EQ( Partition.Inequalities[1].Sign, -1.0 );
}

TEST( ConstraintPartition, SplitsTwoSidedConstraints )
{
  ConstraintPartition Partition( { -1.0 }, { 1.0 } );

  EXPECT_TRUE( Partition.Equalities.empty() );
  ASSERT_EQ( Partition.Inequalities.size(), 2u );
  EXPECT_DOUBLE_EQ( Partition.Inequalities[0].Sign,  1.0 );
  EXPECT_DOUBLE_EQ( Partition.Inequalities[1].Sign, -1.0 );
}

TEST( ConstraintPartition, RejectsBoundsOfDifferentLengths )
{
  EXPECT_THROW( ConstraintPartition Partition( { 0.0 }, { 0.0, 1.0 } ),
                std::invalid_argument );
}

// -----------------------------------------------------------------------------
// Constraint bundle
// -----------------------------------------------------------------------------

namespace
{
// Two constraints with constant Hessians so that the weighted sum is easy
// to verify

Problem CurvedConstraints( void )
{
  Problem TheProblem( Test::Tutorial() );

  TheProblem.ConstraintsHessian = []( const Variables &, const Parameters & ){
    HessianMatrix First( 2, 2, arma::fill::zeros ),
                  Second( 2, 2, arma::fill::zeros );

    First( 0, 0 )  = 1.0;
    Second( 1, 1 ) = 2.0;
    Second( 0, 1 ) = Second( 1, 0 ) = 0.5;

    return std::vector< HessianMatrix >{ First, Second };
  };

  return TheProblem;
}

}

TEST( ConstraintBundle, CarriesTheBoundsOfTheProblem )
{
  Problem          TheProblem( Test::Tutorial() );
  ProblemFunction  Functions( TheProblem );
  Parameters       Values;
  ConstraintBundle Bundle = BuildConstraints( TheProblem, Functions, Values );

  ASSERT_EQ( Bundle.LowerBounds.size(), 2u );
  EXPECT_DOUBLE_EQ( Bundle.LowerBounds[1], 0.0 );
  EXPECT_TRUE( Bundle.UpperBounds.empty() );
  EXPECT_EQ( Bundle.Upper, ( ConstraintValues{ 0.0, 0.0 } ) );
  EXPECT_TRUE( Bundle.Values );
  EXPECT_TRUE( Bundle.Jacobian );
  EXPECT_FALSE( Bundle.LagrangianHessian );
}

TEST( ConstraintBundle, SumsTheWeightedConstraintHessians )
{
  Problem          TheProblem( CurvedConstraints() );
  ProblemFunction  Functions( TheProblem );
  Parameters       Values;
  ConstraintBundle Bundle = BuildConstraints( TheProblem, Functions, Values );
  HessianMatrix    H;

  ASSERT_TRUE( Bundle.LagrangianHessian );

  Bundle.LagrangianHessian( H, { 0.0, 1.0 }, { 3.0, 2.0 } );

  EXPECT_DOUBLE_EQ( H( 0, 0 ), 3.0 );
  EXPECT_DOUBLE_EQ( H( 1, 1 ), 4.0 );
  EXPECT_DOUBLE_EQ( H( 0, 1 ), 1.0 );
}

TEST( ConstraintBundle, AddsToTheGivenMatrix )
{
  Problem          TheProblem( CurvedConstraints() );
  ProblemFunction  Functions( TheProblem );
  Parameters       Values;
  ConstraintBundle Bundle = BuildConstraints( TheProblem, Functions, Values );
  HessianMatrix    H( 2, 2 );

  H.fill( 1.0 );

  Bundle.LagrangianHessian( H, { 0.0, 1.0 }, { 1.0, 0.0 } );

  EXPECT_DOUBLE_EQ( H( 0, 0 ), 2.0 );
  EXPECT_DOUBLE_EQ( H( 1, 1 ), 1.0 );
}

TEST( ConstraintBundle, RequiresOneMultiplierPerConstraint )
{
  Problem          TheProblem( CurvedConstraints() );
  ProblemFunction  Functions( TheProblem );
  Parameters       Values;
  ConstraintBundle Bundle = BuildConstraints( TheProblem, Functions, Values );
  HessianMatrix    H;

  EXPECT_THROW( Bundle.LagrangianHessian( H, { 0.0, 1.0 }, { 1.0 } ),
                std::invalid_argument );
}
