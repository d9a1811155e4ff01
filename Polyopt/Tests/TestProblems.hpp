/*==============================================================================
Test problems

The problems used by the tests:

Quadratic: f(x) = (x[0] - p[0])^2 + (x[1] - p[1])^2 with the minimum f = 0
at x = p, and the parameters are p = (1,2) unless other values are given.

Tutorial: The problem of the NLopt tutorial [1]

minimize Sqrt( x[1] )

subject to

x[1] >= 0 (Bound constraint)
x[1] >= ( a[0] x[0] + b[0] )^3
x[1] >= ( a[1] x[0] + b[1] )^3

with a[0] = 2, b[0] = 0, a[1] = -1 and b[1] = 1. The constraints are written
as c[i](x) = ( a[i] x[0] + b[i] )^3 - x[1] <= 0. The solution is
x = (1/3, 8/27) with the objective value Sqrt( 8/27 ).

The warning collector replaces the warning handler for the lifetime of the
collector and restores the previous handler when it is destroyed.

References:
[1] https://nlopt.readthedocs.io/en/latest/NLopt_Tutorial/

Author and Copyright: Geir Horn, 2019, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_TEST_PROBLEMS
#define POLYOPT_TEST_PROBLEMS

#include <cmath>                      // Mathematical functions
#include <string>                     // Warning texts
#include <vector>                     // Collected warnings

#include "Variables.hpp"
#include "Errors.hpp"
#include "Problem.hpp"

namespace Polyopt::Test
{

inline Problem Quadratic( const Parameters & Centre = Parameters{ 1.0, 2.0 } )
{
  Problem TheProblem(
    []( const Variables & x, const Parameters & p, const DataBatch & )
    -> ObjectiveResult {
      return std::pow( x[0] - p[0], 2 ) + std::pow( x[1] - p[1], 2 );
    }, Variables{ 0.0, 0.0 }, Centre );

  TheProblem.Gradient =
    []( const Variables & x, const Parameters & p, const DataBatch & ){
      return GradientVector{ 2.0 * ( x[0] - p[0] ), 2.0 * ( x[1] - p[1] ) };
    };

  TheProblem.Hessian =
    []( const Variables &, const Parameters &, const DataBatch & ){
      HessianMatrix H( 2, 2, arma::fill::zeros );

      H(0,0) = 2.0;
      H(1,1) = 2.0;

      return H;
    };

  return TheProblem;
}

// The negated quadratic has its maximum at the same point

inline Problem ConcaveQuadratic( void )
{
  Problem TheProblem(
    []( const Variables & x, const Parameters & p, const DataBatch & )
    -> ObjectiveResult {
      return 3.0 - std::pow( x[0] - p[0], 2 ) - std::pow( x[1] - p[1], 2 );
    }, Variables{ 0.0, 0.0 }, Parameters{ 1.0, 2.0 }, Goal::Maximize );

  TheProblem.Gradient =
    []( const Variables & x, const Parameters & p, const DataBatch & ){
      return GradientVector{ -2.0 * ( x[0] - p[0] ), -2.0 * ( x[1] - p[1] ) };
    };

  return TheProblem;
}

inline Problem Tutorial( void )
{
  static const std::vector< VariableType > a{ 2.0, -1.0 }, b{ 0.0, 1.0 };

  Problem TheProblem(
    []( const Variables & x, const Parameters &, const DataBatch & )
    -> ObjectiveResult {
      return std::sqrt( x[1] );
    }, Variables{ 1.234, 5.678 } );

  TheProblem.Gradient =
    []( const Variables & x, const Parameters &, const DataBatch & ){
      return GradientVector{ 0.0, 0.5 / std::sqrt( x[1] ) };
    };

  TheProblem.Constraints = []( const Variables & x, const Parameters & ){
    ConstraintValues C( 2 );

    for ( Dimension i = 0; i < 2; i++ )
      C[i] = std::pow( a[i] * x[0] + b[i], 3 ) - x[1];

    return C;
  };

  // The Jacobian has one column per constraint

  TheProblem.ConstraintsJacobian =
    []( const Variables & x, const Parameters & ){
      GradientMatrix J( 2, 2 );

      for ( Dimension i = 0; i < 2; i++ )
      {
        J( 0, i ) = 3.0 * a[i] * std::pow( a[i] * x[0] + b[i], 2 );
        J( 1, i ) = -1.0;
      }

      return J;
    };

  TheProblem.LowerBounds     = Variables{ -HUGE_VAL, 0.0 };
  TheProblem.ConstraintLower = ConstraintValues{ -HUGE_VAL, -HUGE_VAL };
  TheProblem.ConstraintUpper = ConstraintValues{ 0.0, 0.0 };

  return TheProblem;
}

class WarningCollector
{
private:

  WarningHandler Previous;

public:

  std::vector< std::string > Bounds, Options;

  WarningCollector( void )
  : Previous(), Bounds(), Options()
  {
    Previous = SetWarningHandler( [this]( const Warning & TheWarning ){
      if ( dynamic_cast< const IncompatibleBoundsWarning * >( &TheWarning ) )
        Bounds.push_back( TheWarning.what() );
      else if ( dynamic_cast< const UnmappedOptionWarning * >( &TheWarning ) )
        Options.push_back( TheWarning.what() );
    } );
  }

  WarningCollector( const WarningCollector & Other ) = delete;

  ~WarningCollector( void )
  { SetWarningHandler( Previous ); }
};

}      // End name space Polyopt::Test
#endif // POLYOPT_TEST_PROBLEMS
