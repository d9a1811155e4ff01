/*==============================================================================
Constraints

The gradient of a vector constraint is stored by NLopt as a row major
matrix with one row per constraint and one column per variable. The Jacobian
of the problem has one column per constraint, and the column major storage of
Armadillo means that the gradient of each problem constraint is contiguous.
The rows of the NLopt gradient are therefore copied from the columns of the
Jacobian with the sign of the NLopt constraint.

Author and Copyright: Geir Horn, 2018, 2024
License: LGPL 3.0
==============================================================================*/

#include <algorithm>                  // For filling values
#include <cmath>                      // For finite values and HUGE_VAL
#include <sstream>                    // For error reporting
#include <stdexcept>                  // For standard exceptions

#include "NonLinear/Constraints.hpp"

namespace Polyopt::NonLinear
{
// -----------------------------------------------------------------------------
// Constraint bundle
// -----------------------------------------------------------------------------

ConstraintBundle BuildConstraints( const Problem & TheProblem,
  const ProblemFunction & Functions, const Parameters & Values )
{
  ConstraintBundle Bundle;

  if ( Functions.HasConstraints() )
    Bundle.Values = [&Functions, &Values]( ConstraintValues & C,
                                           const Variables & X )
    { Functions.Constraints( C, X, Values ); };

  if ( Functions.HasConstraintJacobian() )
    Bundle.Jacobian = [&Functions, &Values]( GradientMatrix & J,
                                             const Variables & X )
    { Functions.ConstraintsJacobian( J, X, Values ); };

  if ( Functions.HasConstraintHessians() )
    Bundle.LagrangianHessian = [&Functions, &Values]( HessianMatrix & H,
      const Variables & X, const std::vector< VariableType > & Multipliers )
    {
      std::vector< HessianMatrix > Hessians;

      Functions.ConstraintsHessian( Hessians, X, Values );

      if ( Multipliers.size() != Hessians.size() )
      {
        std::ostringstream ErrorMessage;

        ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                     << "There are " << Multipliers.size() << " multipliers "
                     << "for " << Hessians.size() << " constraints";

        throw std::invalid_argument( ErrorMessage.str() );
      }

      if ( H.n_elem == 0 )
        H.zeros( X.size(), X.size() );

      for ( Dimension i = 0; i < Hessians.size(); i++ )
        H += Multipliers[i] * Hessians[i];
    };

  Bundle.LowerBounds = TheProblem.LowerBounds.value_or( Variables() );
  Bundle.UpperBounds = TheProblem.UpperBounds.value_or( Variables() );
  Bundle.Lower       = TheProblem.ConstraintLower.value_or( ConstraintValues() );
  Bundle.Upper       = TheProblem.ConstraintUpper.value_or( ConstraintValues() );

  return Bundle;
}

// -----------------------------------------------------------------------------
// Partition
// -----------------------------------------------------------------------------

ConstraintPartition::ConstraintPartition( const ConstraintValues & Lower,
                                          const ConstraintValues & Upper )
: Inequalities(), Equalities()
{
  if ( Lower.size() != Upper.size() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "There are " << Lower.size() << " lower constraint bounds "
                 << "and " << Upper.size() << " upper constraint bounds";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  for ( Dimension i = 0; i < Lower.size(); i++ )
    if ( Lower[i] == Upper[i] && std::isfinite( Upper[i] ) )
      Equalities.push_back( ConstraintRow{ i, Upper[i], 1.0 } );
    else
    {
      if ( std::isfinite( Upper[i] ) )
        Inequalities.push_back( ConstraintRow{ i, Upper[i], 1.0 } );

      if ( std::isfinite( Lower[i] ) )
        Inequalities.push_back( ConstraintRow{ i, Lower[i], -1.0 } );
    }
}

// -----------------------------------------------------------------------------
// Constraint binding
// -----------------------------------------------------------------------------

ConstraintBinding::ConstraintBinding( Solver & OwningSolver,
  const ConstraintBundle & Functions, ExecutionState & SolveState )
: TheSolver( OwningSolver ), Bundle( Functions ), State( SolveState ),
  Partition( Functions.Lower, Functions.Upper )
{}

void ConstraintBinding::Evaluate( const std::vector< ConstraintRow > & Rows,
  unsigned int NumberOfVariables, const double * ArgumentValues,
  double * Result, double * Gradient )
{
  Variables        VariableValues( ArgumentValues,
                                   ArgumentValues + NumberOfVariables );
  ConstraintValues Values;

  Bundle.Values( Values, VariableValues );

  for ( Dimension Row = 0; Row < Rows.size(); Row++ )
    Result[ Row ] = Rows[ Row ].Sign *
                    ( Values[ Rows[ Row ].Index ] - Rows[ Row ].Bound );

  if ( Gradient != nullptr )
  {
    GradientMatrix Jacobian;

    Bundle.Jacobian( Jacobian, VariableValues );

    for ( Dimension Row = 0; Row < Rows.size(); Row++ )
      for ( Dimension Variable = 0; Variable < NumberOfVariables; Variable++ )
        Gradient[ Row * NumberOfVariables + Variable ] =
          Rows[ Row ].Sign * Jacobian( Variable, Rows[ Row ].Index );
  }
}

// The mappers store exceptions in the same way as the objective function.

void ConstraintBinding::InequalityMapper( unsigned int NumberOfConstraints,
  double * Result, unsigned int NumberOfVariables,
  const double * ArgumentValues, double * Gradient, void * Data )
{
  ConstraintBinding * This = static_cast< ConstraintBinding * >( Data );

  if ( This->State.Failure )
  {
    std::fill( Result, Result + NumberOfConstraints, 0.0 );
    return;
  }

  try
  {
    This->Evaluate( This->Partition.Inequalities, NumberOfVariables,
                    ArgumentValues, Result, Gradient );
  }
  catch ( ... )
  {
    This->State.Failure = std::current_exception();
    nlopt_force_stop( This->TheSolver.Pointer() );
    std::fill( Result, Result + NumberOfConstraints, 0.0 );
  }
}

void ConstraintBinding::EqualityMapper( unsigned int NumberOfConstraints,
  double * Result, unsigned int NumberOfVariables,
  const double * ArgumentValues, double * Gradient, void * Data )
{
  ConstraintBinding * This = static_cast< ConstraintBinding * >( Data );

  if ( This->State.Failure )
  {
    std::fill( Result, Result + NumberOfConstraints, 0.0 );
    return;
  }

  try
  {
    This->Evaluate( This->Partition.Equalities, NumberOfVariables,
                    ArgumentValues, Result, Gradient );
  }
  catch ( ... )
  {
    This->State.Failure = std::current_exception();
    nlopt_force_stop( This->TheSolver.Pointer() );
    std::fill( Result, Result + NumberOfConstraints, 0.0 );
  }
}

// A bound given on one side only is completed with the open ended sentinel
// on the other side.

void ConstraintBinding::Register( std::optional< double > Tolerance )
{
  if ( !Bundle.LowerBounds.empty() || !Bundle.UpperBounds.empty() )
  {
    Dimension Size = TheSolver.GetDimension();

    TheSolver.Bounds(
      Bundle.LowerBounds.empty() ? Variables( Size, -HUGE_VAL )
                                 : Bundle.LowerBounds,
      Bundle.UpperBounds.empty() ? Variables( Size,  HUGE_VAL )
                                 : Bundle.UpperBounds );
  }

  if ( !Partition.Inequalities.empty() )
  {
    std::vector< double > Tolerances( Partition.Inequalities.size(),
                                      Tolerance.value_or( 0.0 ) );

    TheSolver.CheckStatus( nlopt_add_inequality_mconstraint(
      TheSolver.Pointer(), Partition.Inequalities.size(), &InequalityMapper,
      this, Tolerance ? Tolerances.data() : nullptr ),
      "adding the inequality constraints" );
  }

  if ( !Partition.Equalities.empty() )
  {
    std::vector< double > Tolerances( Partition.Equalities.size(),
                                      Tolerance.value_or( 0.0 ) );

    TheSolver.CheckStatus( nlopt_add_equality_mconstraint(
      TheSolver.Pointer(), Partition.Equalities.size(), &EqualityMapper,
      this, Tolerance ? Tolerances.data() : nullptr ),
      "adding the equality constraints" );
  }
}

}  // End name space Polyopt::NonLinear
