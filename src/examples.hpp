#ifndef _examples_hpp_INCLUDED
#define _examples_hpp_INCLUDED

namespace Refuter {

class Prover;

// Built-in seed problems selected by name.

struct Examples {

  static bool has (const char *);

  // Add the seed clauses of the example to the prover.  Returns zero if
  // successful and otherwise an error message (unknown example or parse
  // error, which both should not happen for built-in examples).
  //
  static const char * add (Prover &, const char *);

  static const char * description (const char *);

  static void usage ();
};

}

#endif
