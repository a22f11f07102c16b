#ifndef _refuter_hpp_INCLUDED
#define _refuter_hpp_INCLUDED

#include <cstdio>
#include <cstdint>

#if defined(__GNUC__) || defined(__clang__)
#define REFUTER_ATTRIBUTE_FORMAT(FORMAT_POSITION, VARIADIC_ARGUMENT_POSITION) \
  __attribute__((format (printf, FORMAT_POSITION, VARIADIC_ARGUMENT_POSITION)))
#else
#define REFUTER_ATTRIBUTE_FORMAT(FORMAT_POSITION, VARIADIC_ARGUMENT_POSITION) \
  /* empty */
#endif

namespace Refuter {

/*========================================================================*/

// This provides the actual API of the refutation prover, which is
// implemented in the class 'Prover' below.  The prover saturates a set of
// first-order function-free clauses under binary resolution until either
// the empty clause is derived ('proved') or no new clause can be derived
// anymore ('not proved').

/*========================================================================*/

// [Example]
//
// Consider the following code (from 'test/api/socrates.cpp'):
//
//   Refuter::Prover * prover = new Refuter::Prover;
//
//   prover->clause ("~man(X) | mortal(X).");
//   prover->clause ("man(socrates).");
//   prover->clause ("~mortal(socrates).");     // Negated goal.
//
//   int res = prover->prove ();                // Saturate.
//   assert (res == 20);                        // Check it is 'PROVED'.
//
//   res = prover->derived ("mortal(socrates)");
//   assert (res);                              // Derived on the way.
//
//   delete prover;

/*========================================================================*/

// [Clause Syntax]
//
// Literals are atoms 'p(t1,...,tn)' or negated atoms '~p(t1,...,tn)' where
// terms are either constants (starting with a lower case letter or digit)
// or variables (starting with an upper case letter or '_').  Atoms without
// arguments are written without parentheses.  Literals of a clause are
// separated by '|' and every clause is terminated by '.', which can be
// omitted for single clauses and the last clause of a file.  The empty
// clause is written '[]'.  Comments start with '%'.  Predicates can be
// declared explicitly with 'pred <name>/<arity>.' and otherwise get the
// arity of their first occurrence.  Variables are local to their clause.

/*========================================================================*/

// [States and Transitions]
//
// We have the following transitions which are all synchronous except for
// the reentrant 'terminate' call:
//
//                         new
// INITIALIZING --------------------------> CONFIGURING
//
//                 set / trace / declare
//  CONFIGURING --------------------------> CONFIGURING
//
//                  clause / read / example
//        READY --------------------------> UNKNOWN (or PROVED)
//
//                        prove
//        READY --------------------------> PROVING
//
//                     (internal)
//      PROVING --------------------------> UNKNOWN | PROVED | SATURATED
//
//                        delete
//        VALID --------------------------> DELETING
//
// where
//
//        READY = CONFIGURING  | UNKNOWN | PROVED | SATURATED
//        VALID = READY
//      INVALID = INITIALIZING | DELETING
//
// Adding a clause in the 'SATURATED' state moves back to 'UNKNOWN' and the
// next 'prove' call continues saturation with the new clause.  Once the
// empty clause is derived the prover stays in the 'PROVED' state.  The
// 'PROVING' state is only visible from another thread, a signal handler or
// a connected tracer or terminator.  If any of these requirements is
// violated the prover aborts with an 'API contract violation' message.

/*========================================================================*/

// States are represented by a bit-set in order to combine them.

enum State
{
  INITIALIZING = 1,             // during initialization (invalid)
  CONFIGURING  = 2,             // configure options (with 'set')
  UNKNOWN      = 4,             // ready to call 'prove'
  PROVING      = 8,             // while saturating (within 'prove')
  PROVED       = 16,            // empty clause derived
  SATURATED    = 32,            // saturated without empty clause
  DELETING     = 64,            // during and after deletion (invalid)

  // These combined states are used to check contracts.

  READY   = CONFIGURING  | UNKNOWN | PROVED | SATURATED,
  VALID   = READY,
  INVALID = INITIALIZING | DELETING
};

/*------------------------------------------------------------------------*/

// Opaque classes declared in the same namespace needed in the API.

class File;
struct Internal;

/*------------------------------------------------------------------------*/

// Forward declaration of call-back classes. See bottom of this file.

class Tracer;
class Terminator;
class ClauseIterator;

/*------------------------------------------------------------------------*/

class Prover {

public:

  //   ensure (CONFIGURING)
  //
  Prover ();

  //   require (VALID)
  //   ensure (DELETING)
  //
  ~Prover ();

  static const char * signature ();     // name of this library
  static const char * version ();       // return version string

  //------------------------------------------------------------------------
  // Declare the arity of a predicate.  Predicates used in clauses without
  // declaration get the arity of their first occurrence (unless the option
  // 'declare' is set).  Redeclaring with the same arity is fine.
  //
  // Returns zero if successful and otherwise an error message.
  //
  //   require (READY)
  //   ensure (READY)
  //
  const char * declare (const char * predicate, int arity);

  // Parse and add one seed clause in the syntax described above.  A clause
  // with a literal which has the wrong number of arguments is malformed
  // and rejected.  Adding a clause which is alpha-equivalent to a stored
  // one is accepted but does not change the set of stored clauses.
  //
  // Returns zero if successful and otherwise an error message.
  //
  //   require (READY)
  //   ensure (UNKNOWN | PROVED)
  //
  const char * clause (const char * text);

  // Read seed clauses from a file.  Files with explicit path argument
  // support compressed input if the helper programs 'gzip', 'bzip2' or
  // 'xz' are available.  Options embedded as '% --<name>=<val>' comments
  // before the first clause are set if the prover is still in the
  // 'CONFIGURING' state.
  //
  // Returns zero if successful and otherwise an error message.
  //
  //   require (READY)
  //   ensure (READY)
  //
  const char * read (FILE * file, const char * name);
  const char * read (const char * path);

  // Add the seed clauses of one of the built-in examples ('socrates' or
  // 'nogoal', see 'examples.cpp').
  //
  //   require (READY)
  //   ensure (READY)
  //
  const char * example (const char * name);
  static bool is_valid_example (const char * name);

  //------------------------------------------------------------------------
  // Saturate the stored clauses.  Returns
  //
  //   20  if the empty clause has been derived ('proved'),
  //   10  if saturation completed without the empty clause ('not proved'),
  //    0  if interrupted or the round limit has been reached.
  //
  //   require (READY)
  //   ensure (UNKNOWN | PROVED | SATURATED)
  //
  int prove ();

  // Result of the last 'prove' call (same values as above).
  //
  //   require (VALID)
  //   ensure (VALID)
  //
  int status () const;

  // Number of stored (seed and derived) clauses.
  //
  //   require (VALID)
  //   ensure (VALID)
  //
  int64_t clauses () const;

  // Determine whether a clause alpha-equivalent to the given one (same
  // syntax as 'clause') is stored.  Unknown symbols yield 'false'.
  //
  //   require (VALID)
  //   ensure (VALID)
  //
  bool derived (const char * text);

  //------------------------------------------------------------------------
  // Force termination of 'prove' asynchronously.
  //
  //   require (PROVING | READY)
  //   ensure (UNKNOWN)           // actually not immediately (synchronously)
  //
  void terminate ();

  // Connected terminators are checked before every pair of clauses.
  //
  //   require (VALID)
  //   ensure (VALID)
  //
  void connect_terminator (Terminator * terminator);
  void disconnect_terminator ();

  //------------------------------------------------------------------------
  // Observe seed clauses, resolution steps and the final verdict.  Tracers
  // have to be connected before clauses are added.
  //
  //   require (CONFIGURING)
  //   ensure (CONFIGURING)
  //
  void connect_tracer (Tracer * tracer);

  //   require (VALID)
  //   ensure (VALID)
  //
  bool disconnect_tracer (Tracer * tracer);

  // Write the textual trace of resolution steps to a file and return
  // 'true' if successfully opened for writing.
  //
  //   require (CONFIGURING)
  //   ensure (CONFIGURING)
  //
  bool trace (FILE * file, const char * name);
  bool trace (const char * path);

  // Flush or close textual traces early.
  //
  //   require (VALID)
  //   ensure (VALID)
  //
  void flush_trace ();
  void close_trace ();

  //------------------------------------------------------------------------
  // Traverse all stored clauses in the order of their insertion.  The
  // return value is false if traversal is aborted early due to the
  // iterator returning false.
  //
  //   require (VALID)
  //   ensure (VALID)
  //
  bool traverse_clauses (ClauseIterator &) const;

  //------------------------------------------------------------------------
  // Options are set and queried by name (see 'options.hpp').  Values out
  // of the range of an option are clamped.
  //
  //   require (VALID)
  //   ensure (VALID)
  //
  static bool is_valid_option (const char * name);
  static bool is_valid_long_option (const char * arg);
  int get (const char * name);

  // Only in the 'CONFIGURING' state options can be set.
  //
  //   require (CONFIGURING)
  //   ensure (CONFIGURING)
  //
  bool set (const char * name, int val);

  // Parse '--<name>', '--<name>=<val>' or '--no-<name>' and set option.
  //
  //   require (CONFIGURING)
  //   ensure (CONFIGURING)
  //
  bool set_long_option (const char * arg);

  // Prefix of all verbose messages (default 'c ').
  //
  //   require (VALID)
  //   ensure (VALID)
  //
  void prefix (const char * verbose_message_prefix);

  //------------------------------------------------------------------------

  static void usage ();   // print usage information for long options
  static void examples (); // print built-in examples

  //   require (!DELETING)
  //   ensure (!DELETING)
  //
  void statistics ();   // print statistics
  void resources ();    // print resource usage (time and memory)

  //   require (VALID)
  //   ensure (VALID)
  //
  void options ();      // print current option and value list
  void store ();        // print stored clauses

  const State & state () const { return _state; }

private:

  State _state;            // API states as discussed above.

  // The 'Prover' class is a 'facade' object for 'Internal'.  It exposes
  // the public API but hides everything else.  This decouples the library
  // header (this file) from all internal data structures.

  Internal * internal;     // Hidden internal prover.

  void transition_to_unknown_state ();

  //------------------------------------------------------------------------
  // Used in the stand alone prover application 'App' and the 'Parser'.

  friend class App;
  friend class Parser;

  // Messages in a common style.
  //
  //   require (VALID | DELETING)
  //   ensure (VALID | DELETING)
  //
  void section (const char *);          // print section header
  void message (const char *, ...)      // ordinary message
    REFUTER_ATTRIBUTE_FORMAT (2, 3);
  void message ();                      // empty line - only prefix
  void error (const char *, ...)        // produce error message
    REFUTER_ATTRIBUTE_FORMAT (2, 3);

  // Explicit verbose level ('section' and 'message' use '0').
  //
  //   require (VALID | DELETING)
  //   ensure (VALID | DELETING)
  //
  void verbose (int level, const char *, ...)
    REFUTER_ATTRIBUTE_FORMAT (3, 4);

  // Factoring out common code to both 'read' functions above.
  //
  const char * read (File *);
};

/*========================================================================*/

// Connected tracers observe the derivation.  Clause texts are given in the
// clause syntax with canonical variable names ('X', 'Y', ...) and the
// empty clause as '[]'.  Seed clauses have no antecedents.  Only clauses
// which are actually stored are reported (duplicates are not), in the
// order in which they are stored.

class Tracer {
public:
  Tracer () { }
  virtual ~Tracer () { }

  // Notify the tracer that a seed clause has been stored.
  //
  virtual void add_seed_clause (uint64_t, const char *) { }

  // Notify the tracer that a resolvent of the two antecedent clauses
  // (given by their identifiers) has been stored.
  //
  virtual void add_derived_clause (uint64_t, const char *,
                                   uint64_t, uint64_t) { }

  // Notify the tracer that 'prove' concluded with the given status.
  //
  virtual void conclude (int) { }
};

/*------------------------------------------------------------------------*/

// Connected terminators are checked for termination regularly.  If the
// 'terminate' function of the terminator returns true the prover is
// terminated synchronously as soon it calls this function.

class Terminator {
public:
  virtual ~Terminator () { }
  virtual bool terminate () = 0;
};

// Allows to traverse all stored clauses in insertion order.

class ClauseIterator {
public:
  virtual ~ClauseIterator () { }
  virtual bool clause (uint64_t id, const char * text) = 0;
};

}

#endif
