/*==============================================================================
Context

The context combines a problem with an optimizer, a data stream and the
generic options, and it can be solved repeatedly. The optimizer is classified
when the context is constructed, and the context checks that the problem
provides what the optimizer needs: a derivative based algorithm needs the
gradient of the objective, and a constraint handling algorithm needs the
Jacobian of the constraints. Algorithms requiring bounds must be given
bounds either by the problem or by the optimizer selection. Errors are thrown
from the constructor, so that a context that exists can be solved.

If a data stream of known length is given, the number of iterations is
limited to the number of batches in the stream.

The parameters and the initial point of the problem can be changed between
solves by re-initialising the context. The new values can be given as numeric
vectors of the same dimension as the current values, or as maps from the
symbolic names to values for problems carrying the symbolic system. Values
not given in a map keep their current value.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_CONTEXT
#define POLYOPT_CONTEXT

#include <map>                        // For symbolic maps
#include <memory>                     // For smart pointers
#include <optional>                   // For optional arguments
#include <string>                     // For names
#include <variant>                    // For numeric or symbolic values
#include <vector>                     // For names

#include "Variables.hpp"              // Basic definitions
#include "Problem.hpp"                // The problem
#include "DataStream.hpp"             // The data
#include "Options.hpp"                // The generic options
#include "Solution.hpp"               // The solution
#include "NonLinear/Selection.hpp"    // The optimizer classification

namespace Polyopt
{
namespace NonLinear
{
  class SolveProcedure;
}

// The state that can be changed between solves

class ReinitializableState
{
public:

  Parameters ParameterValues;
  Variables  InitialPoint;
};

// A replacement is a numeric vector or a map from names to values.

using SymbolicMap = std::map< std::string, VariableType >;
using Replacement = std::variant< Variables, SymbolicMap >;

class Context
{
private:

  // The problem functions refer to the problem definition, and the
  // definition must therefore be declared first.

  const Problem                               Definition;
  const ProblemFunction                       Functions;
  const NonLinear::Classification             Classified;
  std::shared_ptr< DataStream >               Data;
  OptionSet                                   Options;
  ReinitializableState                        State;
  std::unique_ptr< NonLinear::SolveProcedure > Procedure;

  // Checks made by the constructor

  void Validate( void ) const;

  // Replacing a vector of current values

  Variables Remap( const Replacement & NewValues, const Variables & Current,
                   const std::vector< std::string > & Names,
                   const std::string & Description ) const;

public:

  // Accessors

  inline const Parameters & GetParameters( void ) const
  { return State.ParameterValues; }

  inline const Variables & InitialPoint( void ) const
  { return State.InitialPoint; }

  inline const Problem & GetProblem( void ) const
  { return Definition; }

  inline const ProblemFunction & GetFunctions( void ) const
  { return Functions; }

  inline Goal Sense( void ) const
  { return Definition.Sense; }

  inline const NonLinear::OptimizerSelection & Selection( void ) const
  { return Classified.Selection; }

  inline NonLinear::SolvePath Path( void ) const
  { return Classified.Path; }

  inline bool BoundsDropped( void ) const
  { return Classified.BoundsDropped; }

  inline DataStream & GetData( void ) const
  { return *Data; }

  inline const OptionSet & GetOptions( void ) const
  { return Options; }

  // Changing the parameters or the initial point. An argument not given
  // keeps the current value. An invalid argument exception is thrown if the
  // dimension of a numeric vector differs from the current dimension or if a
  // map has an unknown name, and an unsupported symbolic remap exception is
  // thrown if a map is given for a problem without symbolic system.

  Context & Reinitialise(
    const std::optional< Replacement > & NewParameters   = std::nullopt,
    const std::optional< Replacement > & NewInitialPoint = std::nullopt );

  // Solving the problem from the current initial point

  Solution Solve( void );

  // The constructor validates the combination of the problem and the
  // optimizer. If no data stream is given, the problem has no data.

  Context( const Problem & TheProblem,
           const NonLinear::OptimizerSelection & Optimizer,
           std::shared_ptr< DataStream > Stream = nullptr,
           const OptionSet & Settings = OptionSet() );

  Context( void ) = delete;
  Context( const Context & Other ) = delete;
  Context & operator= ( const Context & Other ) = delete;

  ~Context( void );
};

}      // End name space Polyopt
#endif // POLYOPT_CONTEXT
