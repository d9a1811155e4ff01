/*==============================================================================
Selection

The optimizer selection is the algorithm chosen by the user together with the
capabilities of the algorithm. The capabilities decide how the problem can be
passed to the algorithm, and problems and algorithms fall in three classes:

1. Unconstrained: the algorithm is given only the objective function and
   possibly its derivatives.
2. Box constrained: the algorithm is restricted to the hyper-rectangle defined
   by the bounds on the variables. This is either because the algorithm
   supports bounds natively or because it is wrapped in a box decorator.
3. Constrained: the algorithm handles general nonlinear constraints in
   addition to the bounds.

An algorithm without support for bounds can be restricted to the box by the
augmented Lagrangian method [1], which adds a penalty for leaving the box and
solves the penalised problem with the given algorithm as the subsidiary
algorithm. This box decorator is created automatically if the problem has
bounds. There are two exceptions: The population based algorithms take the
bounds as a part of their definition, and the bounds are therefore passed to
the algorithm directly. The principal axis method cannot be restricted to a
box, and the bounds are ignored with a warning.

The classification is done once when the problem is combined with the
optimizer, and it decides which of the solve procedures that is used.

References:

[1] Andrew R. Conn, Nicholas I. M. Gould, and Philippe L. Toint: A globally
    convergent augmented Lagrangian algorithm for optimization with general
    constraints and simple bounds, SIAM J. Numer. Anal. vol. 28, no. 2,
    p. 545-572, 1991

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_NON_LINEAR_SELECTION
#define POLYOPT_NON_LINEAR_SELECTION

#include <optional>                   // For constructor bounds
#include <string>                     // For names

#include "Variables.hpp"              // Basic definitions
#include "Problem.hpp"                // The problem to classify
#include "NonLinear/Algorithms.hpp"   // Algorithm capabilities

namespace Polyopt::NonLinear
{

class OptimizerSelection
{
private:

  // The primary algorithm is the one given to NLopt, and the subsidiary
  // algorithm is only set for the box decorator.

  Algorithm::ID Primary, Subsidiary;

  // The population size is zero if the default population of the algorithm
  // should be used.

  unsigned int PopulationSize;

  // Bounds given to the population based algorithms

  std::optional< Variables > Lower, Upper;

public:

  // Access functions

  inline Algorithm::ID PrimaryAlgorithm( void ) const
  { return Primary; }

  inline Algorithm::ID SubsidiaryAlgorithm( void ) const
  { return Subsidiary; }

  inline bool IsBoxDecorator( void ) const
  { return Subsidiary != Algorithm::ID::NoAlgorithm; }

  // The algorithm working on the objective function is the subsidiary
  // algorithm of the decorator, or the primary algorithm otherwise.

  inline Algorithm::ID ObjectiveAlgorithm( void ) const
  { return IsBoxDecorator() ? Subsidiary : Primary; }

  inline unsigned int Population( void ) const
  { return PopulationSize; }

  inline bool HasBounds( void ) const
  { return Lower.has_value() || Upper.has_value(); }

  inline const std::optional< Variables > & LowerBounds( void ) const
  { return Lower; }

  inline const std::optional< Variables > & UpperBounds( void ) const
  { return Upper; }

  // The capability tags. The population based algorithms are not considered
  // to support bounds since the bounds are part of their construction.

  bool SupportsBounds( void ) const;

  inline bool RequiresBounds( void ) const
  {
    return IsBoxDecorator() ||
           Algorithm::RequiresBoundConstraints( Primary );
  }

  inline bool SupportsConstraints( void ) const
  { return Algorithm::SupportsNonlinearConstraints( Primary ); }

  inline bool DerivativeFree( void ) const
  { return Algorithm::DerivativeFree( ObjectiveAlgorithm() ); }

  inline bool PopulationBased( void ) const
  { return Algorithm::PopulationBased( Primary ); }

  inline bool IgnoresBounds( void ) const
  { return Algorithm::IgnoresBoundConstraints( Primary ); }

  inline bool CentroidIterate( void ) const
  { return Algorithm::CentroidIterate( ObjectiveAlgorithm() ); }

  // The name used in messages

  std::string Name( void ) const;

  // A population based algorithm is rebuilt with the bounds as a part of its
  // definition by the following function. Missing bounds on one side are
  // taken to be infinite.

  OptimizerSelection WithBounds( const std::optional< Variables > & LowerBound,
                         const std::optional< Variables > & UpperBound ) const;

  // The box decorator is created by a static function taking the selection
  // to decorate.

  static OptimizerSelection BoxConstrained(
    const OptimizerSelection & Unbounded );

  // The constructor takes the algorithm and optionally the population size.
  // An invalid argument exception is thrown if the algorithm is not legal
  // or if it requires a subsidiary algorithm.

  OptimizerSelection( Algorithm::ID TheAlgorithm,
                      unsigned int ThePopulation = 0 );

  OptimizerSelection( void ) = delete;
};

// -----------------------------------------------------------------------------
// Classification
// -----------------------------------------------------------------------------

enum class SolvePath
{
  Unconstrained,
  BoxConstrained,
  Constrained
};

std::string to_string( SolvePath Path );

// The classification is the selection to use, which may differ from the one
// given by the user, and the solve path. It also records if the bounds of the
// problem were dropped because the algorithm cannot respect them.

class Classification
{
public:

  const OptimizerSelection Selection;
  const SolvePath          Path;
  const bool               BoundsDropped;

  Classification( const OptimizerSelection & TheSelection, SolvePath ThePath,
                  bool Dropped = false )
  : Selection( TheSelection ), Path( ThePath ), BoundsDropped( Dropped )
  {}

  Classification( void ) = delete;
};

Classification Classify( const Problem & TheProblem,
                         const OptimizerSelection & Requested );

}      // End name space Polyopt::NonLinear
#endif // POLYOPT_NON_LINEAR_SELECTION
