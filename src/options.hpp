#ifndef _options_hpp_INCLUDED
#define _options_hpp_INCLUDED

#include <cstddef>
#include <string>

/*------------------------------------------------------------------------*/

// Options sorted by name.  Unsorted entries are a fatal error on start-up.

#define OPTIONS \
\
/*      NAME         DEFAULT, LO, HI, USAGE */ \
\
OPTION( check,             0,  0,  1, "check store invariants every round") \
OPTION( declare,           0,  0,  1, "require predicate declarations") \
OPTION( incremental,       1,  0,  1, "skip pairs resolved in earlier rounds") \
LOGOPT( log,               0,  0,  1, "enable logging") \
QUTOPT( quiet,             0,  0,  1, "disable all messages") \
OPTION( rounds,            0,  0,2e9, "round limit (0=unlimited)") \
OPTION( seeds,             1,  0,  1, "trace seed clauses") \
OPTION( store,             0,  0,  1, "print final clause store") \
OPTION( trace,             1,  0,  1, "trace resolution steps") \
QUTOPT( verbose,           0,  0,  3, "more verbose messages") \

// Keep the empty line above (trailing '\' of the last entry).

/*------------------------------------------------------------------------*/

// 'log' only exists with 'LOGGING' and 'quiet' and 'verbose' not with
// 'QUIET'.

#ifdef LOGGING
#define LOGOPT OPTION
#else
#define LOGOPT(...) /**/
#endif

#ifdef QUIET
#define QUTOPT(...) /**/
#else
#define QUTOPT OPTION
#endif

/*------------------------------------------------------------------------*/

namespace Refuter {

using namespace std;

struct Internal;

/*------------------------------------------------------------------------*/

class Options;

// Static description of one option.  The value of an option lives in the
// 'Options' instance of each prover and is reached through 'field'.

struct Option {
  const char * name;
  int def, lo, hi;
  const char * description;
  int Options::* field;
  bool is_bool () const { return !lo && hi == 1; }
};

/*------------------------------------------------------------------------*/

class Options {

  Internal * internal;

  static const Option table[];
  static const size_t size;

  static const Option * find (const char * name);
  void set (const Option *, int val);   // Force to [lo,hi] interval.
  void read_environment (const Option *);

public:

  Options (Internal *);

  // Option values as members, e.g., 'int rounds', for direct access in the
  // saturation loop.
  //
# define OPTION(N,V,L,H,D) \
  int N;
  OPTIONS
# undef OPTION

  static bool has (const char * name) { return find (name) != 0; }

  bool set (const char * name, int);    // Returns 'false' if unknown.
  int  get (const char * name);         // Zero if unknown.

  void print ();             // Values in command line form.
  static void usage ();      // All options with range and default.

  // Parse '--<name>', '--<name>=<val>' and '--no-<name>' where '<val>' is
  // accepted by 'parse_int_str'.
  //
  static bool parse_long_option (const char *, string & name, int & val);
};

}

#endif
