/*==============================================================================
Algorithms

The NLopt library [1] implements a range of algorithms for nonlinear
optimization identified by a flat enumerated list. This makes it impossible
to see from the identifier what an algorithm needs and what it can do: some
algorithms require the gradient of the objective function, some respect bound
constraints on the variables, some require the bounds, some handle general
nonlinear constraints, and some do not respect bounds at all.

The algorithm identifiers are here redefined as a scoped enumeration grouped
by the type of algorithm, and the capabilities of the algorithms are given as
constant expression functions on the identifiers. The dispatch layer uses the
capabilities to decide how a problem is passed to the algorithm. Only the
algorithms that can be used with the dispatch layer are defined. The
algorithms needing a subsidiary algorithm are not available for direct
selection, but the augmented Lagrangian is used internally to restrict
algorithms to the box defined by the bounds.

The descriptions of the algorithms are largely taken from the NLopt
documentation, and the copyright of the descriptions belongs to
Steven G. Johnson.

References:

[1] Steven G. Johnson: The NLopt nonlinear-optimization package,
    http://ab-initio.mit.edu/nlopt

Author and Copyright: Geir Horn, 2018, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_NON_LINEAR_ALGORITHMS
#define POLYOPT_NON_LINEAR_ALGORITHMS

#include <string>                     // For algorithm names
#include <nlopt.h>                    // The C-style interface

namespace Polyopt::NonLinear
{

class Algorithm
{
public:

  // The scoped enumeration prevents the implicit conversion of any integer to
  // an algorithm identifier. The maximal number is used to check that a given
  // identifier is a legal NLopt algorithm.

  enum class ID : unsigned short int {
    MaxNumber = NLOPT_NUM_ALGORITHMS,
    NoAlgorithm
  };

  // ---------------------------------------------------------------------------
  // Local algorithms
  // ---------------------------------------------------------------------------

  struct Local
  {
    // Low-storage BFGS
    // The quasi-Newton method builds an approximation of the Hessian from the
    // gradients of a limited number of previous iterations.

    static constexpr ID LowStorageBFGS = ID{ NLOPT_LD_LBFGS };

    // Shifted limited-memory variable-metric using rank 1 or rank 2 updates
    // of the Hessian approximation.

    struct VariableMetric
    {
      static constexpr ID
        RankOne = ID{ NLOPT_LD_VAR1 },
        RankTwo = ID{ NLOPT_LD_VAR2 };
    };

    // Truncated Newton method, optionally preconditioned by low-storage BFGS
    // and optionally restarting with steepest descent.

    struct TruncatedNewton
    {
      static constexpr ID
        Standard              = ID{ NLOPT_LD_TNEWTON },
        Restarting            = ID{ NLOPT_LD_TNEWTON_RESTART },
        Preconditioned        = ID{ NLOPT_LD_TNEWTON_PRECOND },
        PreconditionedRestart = ID{ NLOPT_LD_TNEWTON_PRECOND_RESTART };
    };

    // The Nelder-Mead simplex and the Subplex variant applying the simplex
    // on a sequence of subspaces.

    struct Simplex
    {
      static constexpr ID
        NelderMead = ID{ NLOPT_LN_NELDERMEAD },
        Subspace   = ID{ NLOPT_LN_SBPLX };
    };

    // Derivative free methods building quadratic approximations of the
    // objective function.

    struct QuadraticApproximation
    {
      static constexpr ID
        BOBYQA = ID{ NLOPT_LN_BOBYQA },
        NEWUOA = ID{ NLOPT_LN_NEWUOA_BOUND };
    };

    // Constrained optimization by linear approximations.

    static constexpr ID LinearApproximation = ID{ NLOPT_LN_COBYLA };

    // The principal axis method of Brent. It is an unconstrained algorithm
    // and it cannot be restricted to a box.

    static constexpr ID PrincipalAxis = ID{ NLOPT_LN_PRAXIS };

    // Gradient based algorithms supporting nonlinear constraints: sequential
    // quadratic programming, the method of moving asymptotes, and the
    // conservative convex separable quadratic approximation.

    struct Constrained
    {
      static constexpr ID
        SequentialQuadratic   = ID{ NLOPT_LD_SLSQP },
        MovingAsymptotes      = ID{ NLOPT_LD_MMA },
        ConservativeQuadratic = ID{ NLOPT_LD_CCSAQ };
    };
  };

  // ---------------------------------------------------------------------------
  // Global algorithms
  // ---------------------------------------------------------------------------

  struct Global
  {
    // DIviding RECTangles (DIRECT) systematically divides the search domain
    // into smaller and smaller hyper-rectangles, and the locally biased
    // variant is faster for objective functions without many local minima.

    struct DIRECT
    {
      static constexpr ID
        Standard = ID{ NLOPT_GN_DIRECT },
        Local    = ID{ NLOPT_GN_DIRECT_L };
    };

    // The population based methods: the controlled random search, the
    // evolutionary strategy, and the improved stochastic ranking evolution
    // strategy.

    static constexpr ID
      ControlledRandomSearch = ID{ NLOPT_GN_CRS2_LM },
      Evolutionary           = ID{ NLOPT_GN_ESCH },
      StochasticRanking      = ID{ NLOPT_GN_ISRES };

    // The augmented Lagrangian adds a penalty to the objective function
    // and solves the penalised problem with a subsidiary algorithm.

    static constexpr ID Penalty = ID{ NLOPT_AUGLAG };
  };

  // ---------------------------------------------------------------------------
  // Capabilities
  // ---------------------------------------------------------------------------
  //
  // Some compilers still require the result variables of constant expressions
  // to be initialised.

  static constexpr bool RequiresGradient( const ID TheAlgorithm )
  {
    bool Result = false;

    switch( static_cast< nlopt_algorithm >( TheAlgorithm ) )
    {
      case NLOPT_LD_LBFGS:
      case NLOPT_LD_VAR1:
      case NLOPT_LD_VAR2:
      case NLOPT_LD_TNEWTON:
      case NLOPT_LD_TNEWTON_RESTART:
      case NLOPT_LD_TNEWTON_PRECOND:
      case NLOPT_LD_TNEWTON_PRECOND_RESTART:
      case NLOPT_LD_MMA:
      case NLOPT_LD_SLSQP:
      case NLOPT_LD_CCSAQ:
        Result = true;
        break;
      default:
        Result = false;
        break;
    }

    return Result;
  }

  static constexpr bool DerivativeFree( const ID TheAlgorithm )
  { return !RequiresGradient( TheAlgorithm ); }

  // The algorithms that can be restricted to a box by giving them bounds

  static constexpr bool SupportsBoundConstraints( const ID TheAlgorithm )
  {
    bool Result = false;

    switch( static_cast< nlopt_algorithm >( TheAlgorithm ) )
    {
      case NLOPT_GN_DIRECT:
      case NLOPT_GN_DIRECT_L:
      case NLOPT_GN_CRS2_LM:
      case NLOPT_GN_ESCH:
      case NLOPT_GN_ISRES:
      case NLOPT_LN_COBYLA:
      case NLOPT_LN_BOBYQA:
      case NLOPT_LN_NEWUOA_BOUND:
      case NLOPT_LN_NELDERMEAD:
      case NLOPT_LN_SBPLX:
      case NLOPT_LD_MMA:
      case NLOPT_LD_SLSQP:
      case NLOPT_LD_CCSAQ:
      case NLOPT_AUGLAG:
        Result = true;
        break;
      default:
        Result = false;
        break;
    }

    return Result;
  }

  // The global algorithms search the domain defined by the bounds, and
  // the bounds must therefore be finite.

  static constexpr bool RequiresBoundConstraints( const ID TheAlgorithm )
  {
    bool Result = false;

    switch( static_cast< nlopt_algorithm >( TheAlgorithm ) )
    {
      case NLOPT_GN_DIRECT:
      case NLOPT_GN_DIRECT_L:
      case NLOPT_GN_CRS2_LM:
      case NLOPT_GN_ESCH:
      case NLOPT_GN_ISRES:
        Result = true;
        break;
      default:
        Result = false;
        break;
    }

    return Result;
  }

  // Only the principal axis method does not respect bounds, and it is not
  // possible to restrict it by the penalty method either.

  static constexpr bool IgnoresBoundConstraints( const ID TheAlgorithm )
  {
    return TheAlgorithm == Local::PrincipalAxis;
  }

  // The population based algorithms evolve a set of points, and the bounds
  // are part of their definition since they define the region where the
  // initial population is drawn.

  static constexpr bool PopulationBased( const ID TheAlgorithm )
  {
    bool Result = false;

    switch( static_cast< nlopt_algorithm >( TheAlgorithm ) )
    {
      case NLOPT_GN_CRS2_LM:
      case NLOPT_GN_ESCH:
      case NLOPT_GN_ISRES:
        Result = true;
        break;
      default:
        Result = false;
        break;
    }

    return Result;
  }

  // The point evaluated by a simplex or population method is a trial point
  // and the progress is better represented by the centroid of the recently
  // evaluated points.

  static constexpr bool CentroidIterate( const ID TheAlgorithm )
  {
    return PopulationBased( TheAlgorithm ) ||
           TheAlgorithm == Local::Simplex::NelderMead;
  }

  // The gradient based algorithms handling general nonlinear constraints.
  // COBYLA and ISRES also support constraints in NLopt, but they are used
  // only for their bound constraint support here.

  static constexpr bool SupportsNonlinearConstraints( const ID TheAlgorithm )
  {
    bool Result = false;

    switch( static_cast< nlopt_algorithm >( TheAlgorithm ) )
    {
      case NLOPT_LD_MMA:
      case NLOPT_LD_SLSQP:
      case NLOPT_LD_CCSAQ:
        Result = true;
        break;
      default:
        Result = false;
        break;
    }

    return Result;
  }

  // The augmented Lagrangian is the only algorithm used here that requires a
  // subsidiary algorithm.

  static constexpr bool RequiresSubsidiary( const ID TheAlgorithm )
  {
    return TheAlgorithm == Global::Penalty;
  }

  // Legal identifiers are the ones defined by NLopt.

  static constexpr bool Legal( const ID TheAlgorithm )
  {
    return TheAlgorithm < ID::MaxNumber;
  }

  // The name is the descriptive name of the algorithm given by NLopt.

  static std::string Name( const ID TheAlgorithm )
  {
    return std::string( nlopt_algorithm_name(
                        static_cast< nlopt_algorithm >( TheAlgorithm ) ) );
  }

  // An algorithm can be selected by its short NLopt name without the prefix
  // giving the algorithm type, for instance "LBFGS" or "NELDERMEAD". An
  // invalid argument exception is thrown if the name is not one of the
  // algorithms above.

  static ID Parse( const std::string & ShortName );
};

}      // End name space Polyopt::NonLinear
#endif // POLYOPT_NON_LINEAR_ALGORITHMS
