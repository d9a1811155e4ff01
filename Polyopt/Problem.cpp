/*==============================================================================
Problem

The evaluation functions of the facade call the user functions and copy the
results into the vectors and matrices given by the caller after checking the
dimensions. Derivatives that are not defined for the problem will result in
the same exceptions as the ones thrown when the problem is combined with an
algorithm requiring the derivatives.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#include <sstream>                    // For error reporting
#include <stdexcept>                  // For standard exceptions

#include "Errors.hpp"                 // Derivative errors
#include "Problem.hpp"

namespace Polyopt
{
// -----------------------------------------------------------------------------
// Problem definition
// -----------------------------------------------------------------------------

Problem::Problem( ObjectiveFunction TheObjective, const Variables & StartPoint,
                  const Parameters & Values, Goal Direction )
: Objective( TheObjective ), Gradient(), Hessian(), HessianVectorProduct(),
  Constraints(), ConstraintsJacobian(), ConstraintsHessian(),
  LowerBounds(), UpperBounds(), ConstraintLower(), ConstraintUpper(),
  Sense( Direction ), InitialPoint( StartPoint ), ParameterValues( Values ),
  Symbols()
{}

void Problem::Validate( void ) const
{
  std::ostringstream ErrorMessage;

  ErrorMessage << __FILE__ << " at line " << __LINE__ << ": ";

  if ( !Objective )
  {
    ErrorMessage << "The problem has no objective function";
    throw std::invalid_argument( ErrorMessage.str() );
  }

  if ( InitialPoint.empty() )
  {
    ErrorMessage << "The initial point of the problem has no variables";
    throw std::invalid_argument( ErrorMessage.str() );
  }

  if ( ( LowerBounds && LowerBounds->size() != NumberOfVariables() ) ||
       ( UpperBounds && UpperBounds->size() != NumberOfVariables() ) )
  {
    ErrorMessage << "The variable bounds must have the same dimension as the "
                 << "initial point (" << NumberOfVariables() << ")";
    throw std::invalid_argument( ErrorMessage.str() );
  }

  if ( LowerBounds && UpperBounds )
    for ( Dimension i = 0; i < NumberOfVariables(); i++ )
      if ( LowerBounds->at(i) > UpperBounds->at(i) )
      {
        ErrorMessage << "The lower bound " << LowerBounds->at(i)
                     << " of variable " << i << " is larger than the upper "
                     << "bound " << UpperBounds->at(i);
        throw std::invalid_argument( ErrorMessage.str() );
      }

  if ( HasConstraints() )
  {
    if ( !ConstraintLower || !ConstraintUpper )
    {
      ErrorMessage << "Constraint functions are given without both the "
                   << "lower and the upper constraint bounds";
      throw std::invalid_argument( ErrorMessage.str() );
    }

    if ( ConstraintLower->size() != ConstraintUpper->size() )
    {
      ErrorMessage << "The number of lower constraint bounds ("
                   << ConstraintLower->size() << ") differs from the number "
                   << "of upper constraint bounds (" << ConstraintUpper->size()
                   << ")";
      throw std::invalid_argument( ErrorMessage.str() );
    }
  }

  if ( Symbols && !Symbols->States.empty() &&
       Symbols->States.size() != NumberOfVariables() )
  {
    ErrorMessage << "The symbolic system names " << Symbols->States.size()
                 << " states for " << NumberOfVariables() << " variables";
    throw std::invalid_argument( ErrorMessage.str() );
  }
}

// -----------------------------------------------------------------------------
// Problem functions
// -----------------------------------------------------------------------------

void ProblemFunction::CheckSize( const std::string & FunctionName,
                                 Dimension Expected, Dimension Actual ) const
{
  if ( Expected != Actual )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The " << FunctionName << " returned " << Actual
                 << " elements where " << Expected << " were expected";

    throw std::logic_error( ErrorMessage.str() );
  }
}

ObjectiveResult ProblemFunction::Value( const Variables & X,
                          const Parameters & P, const DataBatch & Batch ) const
{
  return Definition.Objective( X, P, Batch );
}

void ProblemFunction::Gradient( GradientVector & G, const Variables & X,
                         const Parameters & P, const DataBatch & Batch ) const
{
  if ( !HasGradient() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The gradient was requested for a problem without a "
                 << "gradient function";

    throw MissingDerivative( ErrorMessage.str() );
  }

  G = Definition.Gradient( X, P, Batch );
  CheckSize( "gradient function", X.size(), G.size() );
}

void ProblemFunction::Hessian( HessianMatrix & H, const Variables & X,
                        const Parameters & P, const DataBatch & Batch ) const
{
  if ( !HasHessian() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The Hessian was requested for a problem without a "
                 << "Hessian function";

    throw MissingDerivative( ErrorMessage.str() );
  }

  H = Definition.Hessian( X, P, Batch );

  CheckSize( "Hessian function rows", X.size(), H.n_rows );
  CheckSize( "Hessian function columns", X.size(), H.n_cols );
}

// If there is no Hessian-vector product function, the product is computed
// from the Hessian matrix.

void ProblemFunction::HessianVector( GradientVector & Hv, const Variables & X,
                        const GradientVector & V, const Parameters & P,
                        const DataBatch & Batch ) const
{
  if ( Definition.HessianVectorProduct )
    Hv = Definition.HessianVectorProduct( X, V, P, Batch );
  else
  {
    HessianMatrix H;

    Hessian( H, X, P, Batch );
    CheckSize( "direction vector", X.size(), V.size() );

    arma::Col< VariableType > Product( H * arma::Col< VariableType >( V ) );
    Hv = arma::conv_to< GradientVector >::from( Product );
  }

  CheckSize( "Hessian-vector product", X.size(), Hv.size() );
}

void ProblemFunction::Constraints( ConstraintValues & C, const Variables & X,
                                   const Parameters & P ) const
{
  if ( !HasConstraints() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Constraint values requested for a problem without "
                 << "constraint functions";

    throw std::logic_error( ErrorMessage.str() );
  }

  C = Definition.Constraints( X, P );
  CheckSize( "constraint function", NumberOfConstraints(), C.size() );
}

void ProblemFunction::ConstraintsJacobian( GradientMatrix & J,
                         const Variables & X, const Parameters & P ) const
{
  if ( !HasConstraintJacobian() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The constraint Jacobian was requested for a problem "
                 << "without a constraint Jacobian function";

    throw MissingConstraintDerivative( ErrorMessage.str() );
  }

  J = Definition.ConstraintsJacobian( X, P );

  CheckSize( "constraint Jacobian rows", X.size(), J.n_rows );
  CheckSize( "constraint Jacobian columns", NumberOfConstraints(), J.n_cols );
}

void ProblemFunction::ConstraintsHessian(
  std::vector< HessianMatrix > & Hessians,
  const Variables & X, const Parameters & P ) const
{
  if ( !HasConstraintHessians() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The constraint Hessians were requested for a problem "
                 << "without a constraint Hessian function";

    throw MissingConstraintDerivative( ErrorMessage.str() );
  }

  Hessians = Definition.ConstraintsHessian( X, P );

  CheckSize( "constraint Hessian function", NumberOfConstraints(),
             Hessians.size() );

  for ( const HessianMatrix & H : Hessians )
  {
    CheckSize( "constraint Hessian rows", X.size(), H.n_rows );
    CheckSize( "constraint Hessian columns", X.size(), H.n_cols );
  }
}

}  // End name space Polyopt
