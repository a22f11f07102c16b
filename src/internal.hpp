#ifndef _internal_hpp_INCLUDED
#define _internal_hpp_INCLUDED

/*------------------------------------------------------------------------*/

// Common 'C' headers.

#include <cassert>
#include <cctype>
#include <cinttypes>
#include <climits>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

/*------------------------------------------------------------------------*/

// Common 'C++' headers.

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

/*------------------------------------------------------------------------*/

// All internal headers are included here.  This gives a nice overview on
// what is needed altogether.  The 'Internal' struct needs almost all the
// headers anyhow and most implementation files need to see its definition
// too.  Thus '.cpp' files only need to include this header.

#include "refuter.hpp"

#include "clause.hpp"
#include "contract.hpp"
#include "examples.hpp"
#include "file.hpp"
#include "format.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "options.hpp"
#include "parse.hpp"
#include "resources.hpp"
#include "signature.hpp"
#include "stats.hpp"
#include "store.hpp"
#include "term.hpp"
#include "terminal.hpp"
#include "tracer.hpp"
#include "texttracer.hpp"
#include "unify.hpp"
#include "util.hpp"
#include "version.hpp"

/*------------------------------------------------------------------------*/

namespace Refuter {

using namespace std;

struct Internal {

  /*----------------------------------------------------------------------*/

  int status;                   // 0 = unknown, 10 = saturated, 20 = proved
  bool terminated;              // cached termination status
  volatile bool termination_forced; // forced to terminate asynchronously
  size_t resolved;              // store size at end of last round

  Options opts;                 // run-time options
  Stats stats;                  // statistics
  Signature signature;          // predicate and constant names
  Store store;                  // all seed and derived clauses
  Unifier unifier;              // complementary literal matching
  Substitution subst;           // unifier of current literal pair
  vector<Literal> resolvent;    // temporary resolvent literals

  vector<Tracer *> tracers;           // proof tracing observers
  vector<FileTracer *> file_tracers;  // owned text tracers
  Terminator * terminator;            // connected terminator (or zero)

  Format error_message;         // provide persistent error message
  string prefix;                // verbose messages prefix

  Internal * internal;          // proxy to 'this' in macros

  Internal ();
  ~Internal ();

  /*----------------------------------------------------------------------*/

  // Allocate a new clause in canonical form from the given literals which
  // are consumed ('clause.cpp').
  //
  Clause * new_clause (vector<Literal> &, uint64_t = 0, uint64_t = 0);

  // Clause and literal printing in the syntax of the parser.
  //
  string text (const Literal &) const;
  string text (const vector<Literal> &) const;
  string text (const Clause *) const;

  // Explicit declaration of predicate arities.
  //
  const char * declare (const char * name, int arity);

  // Seed clauses from the parser, the API and built-in examples.  Returns
  // 'false' if an alpha-equivalent clause is already stored.
  //
  bool add_seed (vector<Literal> &);

  // Is an alpha-equivalent clause stored?
  //
  bool derived (vector<Literal> &);

  /*----------------------------------------------------------------------*/

  // Resolution and saturation ('resolve.cpp' and 'saturate.cpp').
  //
  Clause * resolve (Clause *, int, Clause *, int, const Substitution &);
  int resolve_pair (Clause *, Clause *);
  void round ();
  int saturate ();

  bool terminating ();
  bool limit_reached ();

  void check_store ();

  /*----------------------------------------------------------------------*/

  // Forward seed clauses, resolution steps and the verdict to the
  // connected tracers ('tracer.cpp').
  //
  void connect_tracer (Tracer *);
  bool disconnect_tracer (Tracer *);
  void connect_text_tracer (File *);
  void flush_trace ();
  void close_trace ();

  void trace_seed_clause (const Clause *);
  void trace_derived_clause (const Clause *);
  void trace_conclusion ();

  /*----------------------------------------------------------------------*/

  double process_time ();       // since prover was initialized
  double real_time ();          // since prover was initialized

  void print_statistics ();
  void print_resource_usage ();
  void print_store ();

  /*----------------------------------------------------------------------*/

#ifndef QUIET

  bool silent (int level) const;
  void print_prefix ();
  void print_line (const char * head, const char * fmt, va_list *);

  // Printed unless 'quiet' is set (or 'QUIET' defined at compile-time).
  //
  void vmessage (const char *, va_list &);
  void message (const char *, ...)
                REFUTER_ATTRIBUTE_FORMAT (2, 3);
  void message ();                              // empty line

  // Printed if 'level' does not exceed 'opts.verbose'.
  //
  void vverbose (int level, const char * fmt, va_list &);
  void verbose (int level, const char * fmt, ...)
                REFUTER_ATTRIBUTE_FORMAT (3, 4);
  void verbose (int level);

  // Section headers '--- [ <title> ] ----'.
  //
  void section (const char * title);

  // Messages prefixed by '[<phase>]' if 'opts.verbose > 1'.
  void phase (const char * phase, const char *, ...)
              REFUTER_ATTRIBUTE_FORMAT (3, 4);

  // Prefixed by '[<phase>-<count>]'.
  void phase (const char * phase, int64_t count, const char *, ...)
              REFUTER_ATTRIBUTE_FORMAT (4, 5);
#endif

  // Errors are always printed and exit with status '1'.
  //
  void error_message_end ();
  void verror (const char *, va_list &);
  void error (const char *, ...)
              REFUTER_ATTRIBUTE_FORMAT (2, 3);
  void error_message_start ();

  // Warning messages.
  //
  void warning (const char *, ...)
                REFUTER_ATTRIBUTE_FORMAT (2, 3);
};

// Fatal internal error which leads to abort.
//
void fatal_message_start ();
void fatal_message_end ();
void fatal (const char *, ...)
            REFUTER_ATTRIBUTE_FORMAT (1, 2);

}

#endif
