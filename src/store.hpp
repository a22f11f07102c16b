#ifndef _store_hpp_INCLUDED
#define _store_hpp_INCLUDED

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace Refuter {

using namespace std;

struct Clause;

// The working set of clauses of one proof attempt.  Clauses are only
// added, never removed, and no two stored clauses are alpha-equivalent.
// The insertion order is the order in which the saturation loop visits
// clause pairs.  Clauses are hashed by their shape (variables ignored) and
// candidates with the same hash are compared by 'alpha_equivalent'.

class Store {

  vector<Clause *> clauses;                         // in insertion order
  unordered_map<uint64_t, vector<Clause *>> table;  // shape hash buckets
  Clause * _empty_clause;                           // if stored

public:

  Store () : _empty_clause (0) { }
  ~Store ();                            // Deletes all stored clauses.

  // Returns the stored clause alpha-equivalent to the given one or zero.
  //
  Clause * find (const Clause *) const;
  bool contains (const Clause * c) const { return find (c) != 0; }

  // Takes over ownership and assigns the next 'id' if the clause is new.
  // Otherwise returns 'false' and the caller still owns the clause.
  //
  bool insert (Clause *);

  // A copy of the current clause sequence.  Clauses added while iterating
  // over the snapshot are not part of it.
  //
  vector<Clause *> all () const { return clauses; }

  size_t size () const { return clauses.size (); }
  Clause * operator [] (size_t i) const { return clauses[i]; }

  Clause * empty_clause () const { return _empty_clause; }

  typedef vector<Clause *>::const_iterator const_iterator;
  const_iterator begin () const { return clauses.begin (); }
  const_iterator end () const { return clauses.end (); }
};

// Structural equality up to a bijective renaming of variables.

bool alpha_equivalent (const Clause *, const Clause *);

}

#endif
