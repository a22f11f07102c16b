#ifndef _signature_hpp_INCLUDED
#define _signature_hpp_INCLUDED

#include <string>
#include <unordered_map>
#include <vector>

namespace Refuter {

using namespace std;

// The signature interns the names of predicates and constants.  Indices
// start at '1' for both, since a zero 'Term' means 'unbound'.  Each
// predicate has exactly one arity, which is either declared explicitly
// ('pred man/1.' in the clause syntax or 'Prover::declare') or implicitly
// fixed by its first occurrence.

struct Predicate {
  string name;
  int arity;
  bool declared;        // explicitly declared
};

class Signature {

  vector<Predicate> predicates;
  vector<string> constants;

  unordered_map<string, int> predicate_table;
  unordered_map<string, int> constant_table;

public:

  Signature ();

  // Return index of a predicate or constant or zero if not found.
  //
  int find_predicate (const string &) const;
  int find_constant (const string &) const;

  // Find or add (the arity of a new predicate is fixed here).
  //
  int predicate (const string &, int arity, bool declared = false);
  int constant (const string &);

  int arity (int p) const { return predicates[p].arity; }
  bool declared (int p) const { return predicates[p].declared; }
  void declare (int p) { predicates[p].declared = true; }

  const string & predicate_name (int p) const { return predicates[p].name; }
  const string & constant_name (int c) const { return constants[c]; }

  // New symbols are only appended.  Backtracking to a mark removes the
  // symbols of a clause which failed to parse.
  //
  struct Mark { size_t predicates, constants; };
  Mark mark () const { return Mark { predicates.size (), constants.size () }; }
  void backtrack (const Mark &);

  size_t size_predicates () const { return predicates.size () - 1; }
  size_t size_constants () const { return constants.size () - 1; }
};

}

#endif
