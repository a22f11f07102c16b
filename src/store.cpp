#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

// Canonical forms already agree on alpha-equivalent clauses in almost all
// cases, but literals of the same shape can still end up in different
// order (for instance 'p(X,Y) | p(Y,X)').  Thus we search for a variable
// bijection mapping the literals of one clause to those of the other one.
// Clauses are small, so simple backtracking is good enough.

struct AlphaMatcher {

  const Clause * a, * b;
  vector<int> forward, backward;        // variable bijection
  vector<bool> used;                    // literals of 'b' already matched
  vector<int> trail;                    // bound variables of 'a'

  AlphaMatcher (const Clause * c, const Clause * d) :
    a (c), b (d),
    forward (c->vars, -1), backward (d->vars, -1),
    used (d->literals.size (), false)
  { }

  void undo (size_t level) {
    while (trail.size () > level) {
      const int x = trail.back ();
      trail.pop_back ();
      backward[forward[x]] = -1;
      forward[x] = -1;
    }
  }

  bool match (const Literal & l, const Literal & k) {
    if (l.predicate != k.predicate) return false;
    if (l.negative != k.negative) return false;
    if (l.args.size () != k.args.size ()) return false;
    for (size_t i = 0; i < l.args.size (); i++) {
      const Term s = l.args[i], t = k.args[i];
      if (is_variable (s) != is_variable (t)) return false;
      if (!is_variable (s)) {
        if (s != t) return false;
        continue;
      }
      const int x = variable_index (s), y = variable_index (t);
      if (forward[x] < 0 && backward[y] < 0) {
        forward[x] = y, backward[y] = x;
        trail.push_back (x);
      } else if (forward[x] != y) return false;
    }
    return true;
  }

  bool match (size_t i) {
    if (i == a->literals.size ()) return true;
    const Literal & l = a->literals[i];
    for (size_t j = 0; j < b->literals.size (); j++) {
      if (used[j]) continue;
      const size_t level = trail.size ();
      if (match (l, b->literals[j])) {
        used[j] = true;
        if (match (i + 1)) return true;
        used[j] = false;
      }
      undo (level);
    }
    return false;
  }
};

bool alpha_equivalent (const Clause * a, const Clause * b) {
  if (a->hash != b->hash) return false;
  if (a->size () != b->size ()) return false;
  if (a->vars != b->vars) return false;
  if (a->literals == b->literals) return true;
  AlphaMatcher matcher (a, b);
  return matcher.match (0);
}

/*------------------------------------------------------------------------*/

Clause * Store::find (const Clause * c) const {
  auto it = table.find (c->hash);
  if (it == table.end ()) return 0;
  for (const auto & d : it->second)
    if (alpha_equivalent (c, d))
      return d;
  return 0;
}

bool Store::insert (Clause * c) {
  assert (!c->id);
  if (contains (c)) return false;
  clauses.push_back (c);
  c->id = clauses.size ();
  table[c->hash].push_back (c);
  if (c->empty () && !_empty_clause) _empty_clause = c;
  return true;
}

Store::~Store () {
  for (const auto & c : clauses)
    delete c;
}

}
