/*==============================================================================
Context test

The checks made when a problem is combined with an optimizer, and the
re-initialisation of the parameters and the initial point.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>

#include "Errors.hpp"
#include "Context.hpp"
#include "TestProblems.hpp"

using namespace Polyopt;
using namespace Polyopt::NonLinear;

namespace
{
const OptimizerSelection LBFGS( Algorithm::Local::LowStorageBFGS );
const OptimizerSelection SLSQP(
  Algorithm::Local::Constrained::SequentialQuadratic );
const OptimizerSelection NelderMead( Algorithm::Local::Simplex::NelderMead );

// The quadratic problem with names for its states and parameters

Problem NamedQuadratic( void )
{
  Problem TheProblem( Test::Quadratic() );

  TheProblem.Symbols = SymbolicSystem{ { "x", "y" }, { "p", "q" } };

  return TheProblem;
}

}

// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------

TEST( ContextValidation, RequiresTheGradientForDerivativeBasedAlgorithms )
{
  Problem TheProblem( Test::Quadratic() );

  TheProblem.Gradient = GradientFunction();

  EXPECT_THROW( Context Invalid( TheProblem, LBFGS ), MissingDerivative );
  EXPECT_NO_THROW( Context Valid( TheProblem, NelderMead ) );
}

TEST( ContextValidation, RequiresTheConstraintJacobianForConstrainedAlgorithms )
{
  Problem TheProblem( Test::Tutorial() );

  TheProblem.ConstraintsJacobian = ConstraintJacobianFunction();

  EXPECT_THROW( Context Invalid( TheProblem, SLSQP ),
                MissingConstraintDerivative );
  EXPECT_THROW( Context Invalid( Test::Quadratic(), SLSQP ),
                MissingConstraintDerivative );
}

TEST( ContextValidation, RejectsConstraintsForUnconstrainedAlgorithms )
{
  EXPECT_THROW( Context Invalid( Test::Tutorial(), LBFGS ),
                std::invalid_argument );
}

TEST( ContextValidation, RequiresBoundsForGlobalAlgorithms )
{
  OptimizerSelection DIRECT( Algorithm::Global::DIRECT::Standard );
  Problem            TheProblem( Test::Quadratic() );

  EXPECT_THROW( Context Invalid( TheProblem, DIRECT ), std::invalid_argument );

  TheProblem.LowerBounds = Variables{ -5.0, -5.0 };
  TheProblem.UpperBounds = Variables{  5.0,  5.0 };

  EXPECT_NO_THROW( Context Valid( TheProblem, DIRECT ) );
}

TEST( ContextValidation, ValidatesTheProblem )
{
  Problem TheProblem( Test::Quadratic() );

  TheProblem.LowerBounds = Variables{ 0.0 };

  EXPECT_THROW( Context Invalid( TheProblem, LBFGS ), std::invalid_argument );
}

TEST( ContextValidation, RecordsTheClassification )
{
  Test::WarningCollector Warnings;
  Problem                TheProblem( Test::Quadratic() );

  TheProblem.UpperBounds = Variables{ 0.5, 0.5 };

  Context Boxed( TheProblem, LBFGS );

  EXPECT_EQ( Boxed.Path(), SolvePath::BoxConstrained );
  EXPECT_TRUE( Boxed.Selection().IsBoxDecorator() );
  EXPECT_FALSE( Boxed.BoundsDropped() );

  Context Dropped( TheProblem,
                   OptimizerSelection( Algorithm::Local::PrincipalAxis ) );

  EXPECT_EQ( Dropped.Path(), SolvePath::Unconstrained );
  EXPECT_TRUE( Dropped.BoundsDropped() );
  EXPECT_EQ( Warnings.Bounds.size(), 1u );
}

TEST( ContextValidation, LimitsTheIterationsToTheDataLength )
{
  std::vector< DataBatch > Batches( 5, DataBatch( 1, 1, arma::fill::zeros ) );

  Context WithData( Test::Quadratic(), LBFGS,
                    std::make_shared< DataSequence >( Batches ) );

  EXPECT_EQ( WithData.GetOptions().MaxIterations,
             std::optional< unsigned long int >( 5 ) );

  Context WithoutData( Test::Quadratic(), LBFGS );

  EXPECT_FALSE( WithoutData.GetOptions().MaxIterations.has_value() );
  EXPECT_TRUE( WithoutData.GetData().IsSentinel() );
}

// -----------------------------------------------------------------------------
// Re-initialisation
// -----------------------------------------------------------------------------

TEST( Reinitialisation, ReplacesNumericValues )
{
  Context TheContext( Test::Quadratic(), LBFGS );

  TheContext.Reinitialise( Variables{ 3.0, 4.0 }, Variables{ 1.0, 1.0 } );

  EXPECT_EQ( TheContext.GetParameters(), ( Parameters{ 3.0, 4.0 } ) );
  EXPECT_EQ( TheContext.InitialPoint(),  ( Variables{ 1.0, 1.0 } ) );

  TheContext.Reinitialise();

  EXPECT_EQ( TheContext.GetParameters(), ( Parameters{ 3.0, 4.0 } ) );
  EXPECT_EQ( TheContext.InitialPoint(),  ( Variables{ 1.0, 1.0 } ) );

  TheContext.Reinitialise( std::nullopt, Variables{ 2.0, 2.0 } );

  EXPECT_EQ( TheContext.GetParameters(), ( Parameters{ 3.0, 4.0 } ) );
  EXPECT_EQ( TheContext.InitialPoint(),  ( Variables{ 2.0, 2.0 } ) );
}

TEST( Reinitialisation, RejectsVectorsOfTheWrongDimension )
{
  Context TheContext( Test::Quadratic(), LBFGS );

  EXPECT_THROW( TheContext.Reinitialise( Variables{ 1.0 } ),
                std::invalid_argument );
  EXPECT_EQ( TheContext.GetParameters(), ( Parameters{ 1.0, 2.0 } ) );
}

TEST( Reinitialisation, ChangesNothingIfOneValueFails )
{
  Context TheContext( Test::Quadratic(), LBFGS );

  EXPECT_THROW( TheContext.Reinitialise( Variables{ 5.0, 6.0 },
                                         Variables{ 1.0, 2.0, 3.0 } ),
                std::invalid_argument );
  EXPECT_EQ( TheContext.GetParameters(), ( Parameters{ 1.0, 2.0 } ) );
  EXPECT_EQ( TheContext.InitialPoint(),  ( Variables{ 0.0, 0.0 } ) );
}

TEST( Reinitialisation, RequiresASymbolicSystemForNames )
{
  Context TheContext( Test::Quadratic(), LBFGS );

  EXPECT_THROW( TheContext.Reinitialise( SymbolicMap{ { "p", 3.0 } } ),
                UnsupportedSymbolicRemap );

  // An empty map changes nothing and needs no names

  EXPECT_NO_THROW( TheContext.Reinitialise( SymbolicMap() ) );
  EXPECT_EQ( TheContext.GetParameters(), ( Parameters{ 1.0, 2.0 } ) );
}

TEST( Reinitialisation, ReplacesNamedValues )
{
  Context TheContext( NamedQuadratic(), LBFGS );

  TheContext.Reinitialise( SymbolicMap{ { "q", 5.0 } },
                           SymbolicMap{ { "x", -1.0 } } );

  EXPECT_EQ( TheContext.GetParameters(), ( Parameters{ 1.0, 5.0 } ) );
  EXPECT_EQ( TheContext.InitialPoint(),  ( Variables{ -1.0, 0.0 } ) );
}

TEST( Reinitialisation, RejectsUnknownNames )
{
  Context TheContext( NamedQuadratic(), LBFGS );

  EXPECT_THROW( TheContext.Reinitialise( SymbolicMap{ { "r", 5.0 } } ),
                std::invalid_argument );
  EXPECT_EQ( TheContext.GetParameters(), ( Parameters{ 1.0, 2.0 } ) );
}
