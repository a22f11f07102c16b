#ifndef _clause_hpp_INCLUDED
#define _clause_hpp_INCLUDED

#include "term.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace Refuter {

using namespace std;

/*------------------------------------------------------------------------*/

// A clause is a set of literals (a disjunction) kept in canonical form,
// i.e., literals are sorted with 'literal_less_than', without duplicates,
// and the clause local variables are renamed to '0..vars-1' by their first
// occurrence.  The empty clause is the (unique) clause without literals.
//
// Clauses are allocated in 'Internal::new_clause' and owned by the 'Store'
// after they have been inserted successfully.

typedef vector<Literal>::iterator literal_iterator;
typedef vector<Literal>::const_iterator const_literal_iterator;

struct Clause {

  uint64_t id;                  // position in 'Store' starting at '1'
  uint64_t antecedents[2];      // resolved clauses (zero for seeds)
  int64_t generation;           // round in which it was derived
  uint64_t hash;                // shape hash (see 'shape_hash')
  int vars;                     // number of variables

  vector<Literal> literals;

  bool seed () const { return !antecedents[0]; }
  bool empty () const { return literals.empty (); }
  int size () const { return (int) literals.size (); }

  // Supports simple range based for loops over clauses.

  literal_iterator begin () { return literals.begin (); }
  literal_iterator end () { return literals.end (); }

  const_literal_iterator begin () const { return literals.begin (); }
  const_literal_iterator end () const { return literals.end (); }
};

/*------------------------------------------------------------------------*/

// Sort, remove duplicates and rename variables in first occurrence order.
// Returns the number of variables.

int canonicalize (vector<Literal> &);

// Hash of the sequence of literal shapes, where variables are ignored.
// Alpha-equivalent canonical clauses have the same shape hash.

uint64_t shape_hash (const vector<Literal> &);

// Variables are printed as 'X', 'Y', 'Z', 'U', 'V', 'W', then 'X6', 'X7'...

string variable_name (int idx);

}

#endif
