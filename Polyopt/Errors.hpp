/*==============================================================================
Errors

The dispatch layer distinguishes between fatal conditions and conditions that
should only be reported. The fatal ones are exceptions derived from the
standard exception classes, so that they can be caught selectively or as a
group by catching the standard base class. The errors that can be detected
when a problem is combined with an optimizer are logic errors, whereas the
errors that can only be detected while the solver runs are runtime errors.

Conditions that are not fatal, like bounds that will be ignored or options
that the algorithm family cannot use, are warnings. A warning is not thrown
but delivered to a warning handler, which by default writes the warning to
the standard error stream. The handler can be replaced by the application,
for instance to collect the warnings or to turn them into exceptions.

Author and Copyright: Geir Horn, 2024
License: LGPL 3.0
==============================================================================*/

#ifndef POLYOPT_ERRORS
#define POLYOPT_ERRORS

#include <functional>                 // For the warning handler
#include <stdexcept>                  // For standard exceptions
#include <string>                     // For messages

namespace Polyopt
{
// -----------------------------------------------------------------------------
// Fatal errors
// -----------------------------------------------------------------------------
//
// A derivative based algorithm has been chosen for a problem that does not
// provide the gradient of the objective function.

class MissingDerivative : public std::logic_error
{
public:

  MissingDerivative( const std::string & ErrorMessage )
  : std::logic_error( ErrorMessage )
  {}

  MissingDerivative( void ) = delete;
};

// An algorithm handling nonlinear constraints requires the Jacobian of the
// constraint functions, and this error is thrown if it is not given.

class MissingConstraintDerivative : public std::logic_error
{
public:

  MissingConstraintDerivative( const std::string & ErrorMessage )
  : std::logic_error( ErrorMessage )
  {}

  MissingConstraintDerivative( void ) = delete;
};

// The user callback must decide whether the solver should halt or continue.
// If it returns an undecided value, the solve is aborted with this error.

class InvalidCallbackReturn : public std::runtime_error
{
public:

  InvalidCallbackReturn( const std::string & ErrorMessage )
  : std::runtime_error( ErrorMessage )
  {}

  InvalidCallbackReturn( void ) = delete;
};

// Parameters and initial values can only be given by name if the problem
// carries the symbolic system defining the names.

class UnsupportedSymbolicRemap : public std::invalid_argument
{
public:

  UnsupportedSymbolicRemap( const std::string & ErrorMessage )
  : std::invalid_argument( ErrorMessage )
  {}

  UnsupportedSymbolicRemap( void ) = delete;
};

// -----------------------------------------------------------------------------
// Warnings
// -----------------------------------------------------------------------------
//
// The warnings share a common base class carrying the explanation. It is
// polymorphic so that a handler can identify the type of warning by dynamic
// casts.

class Warning
{
private:

  const std::string Explanation;

public:

  inline std::string what( void ) const
  { return Explanation; }

  Warning( const std::string & Description )
  : Explanation( Description )
  {}

  Warning( void ) = delete;

  virtual ~Warning( void )
  {}
};

// Bounds were given for the problem, but the chosen algorithm is not able to
// respect them and they will be ignored.

class IncompatibleBoundsWarning : public Warning
{
public:

  IncompatibleBoundsWarning( const std::string & Description )
  : Warning( Description )
  {}

  IncompatibleBoundsWarning( void ) = delete;
};

// A generic option was set, but there is no corresponding option for the
// algorithm family, and the option is dropped.

class UnmappedOptionWarning : public Warning
{
public:

  UnmappedOptionWarning( const std::string & Description )
  : Warning( Description )
  {}

  UnmappedOptionWarning( void ) = delete;
};

// The handler is a function taking the warning. Setting a new handler returns
// the previous handler so that it can be restored. Passing an empty function
// restores the default handler printing to the standard error stream.

using WarningHandler = std::function< void( const Warning & ) >;

WarningHandler SetWarningHandler( WarningHandler NewHandler );

// Warnings are reported by the following function forwarding the warning to
// the current handler.

void ReportWarning( const Warning & TheWarning );

}      // End name space Polyopt
#endif // POLYOPT_ERRORS
