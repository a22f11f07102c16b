#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

// The saturation loop works in rounds (generations).  Each round takes a
// snapshot of the store and resolves all pairs of distinct clauses in the
// snapshot in the order of their insertion (outer 'i', inner 'j > i').
// Resolvents found during the round are inserted immediately but are only
// visited in the next round.  The loop stops as soon as the empty clause
// is derived (status '20') or after a round without any new clause
// (status '10').  A round limit or a termination request leaves the status
// at zero.
//
// If 'opts.incremental' is set we skip pairs of clauses which both were
// already part of the snapshot of the previous round, since all their
// resolvents are stored already.

/*------------------------------------------------------------------------*/

bool Internal::terminating () {
  if (terminated) return true;
  if (termination_forced) {
    MSG ("termination forced");
    terminated = true;
  } else if (terminator && terminator->terminate ()) {
    MSG ("connected terminator forces termination");
    terminated = true;
  }
  return terminated;
}

bool Internal::limit_reached () {
  if (!opts.rounds || stats.rounds < opts.rounds) return false;
  MSG ("round limit %d reached", opts.rounds);
  return true;
}

/*------------------------------------------------------------------------*/

// Try all literal pairs of 'c' and 'd' and return the number of new
// clauses added to the store.

int Internal::resolve_pair (Clause * c, Clause * d) {
  assert (c != d);
  stats.pairs++;
  int added = 0;
  for (int i = 0; !status && i < c->size (); i++) {
    for (int j = 0; !status && j < d->size (); j++) {
      stats.tried++;
      subst.reset (c->vars + d->vars);
      if (!unifier.match_complementary (c->literals[i], 0,
                                        d->literals[j], c->vars, subst))
        continue;
      stats.unified++;
      Clause * r = resolve (c, i, d, j, subst);
      if (!store.insert (r)) {
        stats.duplicates++;
        LOG (r, "duplicate");
        delete r;
        continue;
      }
      stats.added++;
      added++;
      LOG (r, "added");
      trace_derived_clause (r);
      if (r->empty ()) {
        stats.empty++;
        MSG ("derived empty clause[%" PRIu64 "] "
          "from clause[%" PRIu64 "] and clause[%" PRIu64 "]",
          r->id, c->id, d->id);
        status = 20;
      }
    }
  }
  return added;
}

/*------------------------------------------------------------------------*/

void Internal::round () {

  const vector<Clause *> snapshot = store.all ();
  const size_t size = snapshot.size ();
  const size_t old = opts.incremental ? resolved : 0;

  stats.rounds++;
  PHASE ("round", stats.rounds,
    "resolving %zu clauses (%zu new)", size, size - resolved);

  int64_t added = 0;
  for (size_t i = 0; !status && i < size; i++) {
    for (size_t j = i + 1; !status && j < size; j++) {
      if (j < old) continue;
      if (terminating ()) return;
      added += resolve_pair (snapshot[i], snapshot[j]);
    }
  }

  resolved = size;

  if (opts.check) check_store ();

  VERBOSE (1, "round %" PRId64 " added %" PRId64 " clauses to %zu",
    stats.rounds, added, store.size ());

  if (!status && !added) {
    MSG ("saturated after %" PRId64 " rounds with %zu clauses",
      stats.rounds, store.size ());
    status = 10;
  }
}

/*------------------------------------------------------------------------*/

int Internal::saturate () {
  if (!status && store.empty_clause ()) {
    MSG ("empty clause among seed clauses");
    status = 20;
  }
  while (!status && !terminating () && !limit_reached ())
    round ();
  trace_conclusion ();
  return status;
}

/*------------------------------------------------------------------------*/

// Checks the store invariants with '--check'.  A violation is an internal
// error and aborts the process.

void Internal::check_store () {
  const size_t size = store.size ();
  for (size_t i = 0; i < size; i++) {
    const Clause * c = store[i];
    if (c->id != i + 1)
      FATAL ("clause[%" PRIu64 "] stored at position %zu", c->id, i + 1);
    if (store.find (c) != c)
      FATAL ("stored clause[%" PRIu64 "] not found", c->id);
    vector<Literal> copy = c->literals;
    const int vars = canonicalize (copy);
    if (vars != c->vars || copy.size () != c->literals.size ())
      FATAL ("clause[%" PRIu64 "] not in canonical form", c->id);
    if (c->antecedents[0] >= c->id || c->antecedents[1] >= c->id)
      FATAL ("clause[%" PRIu64 "] derived from later clause", c->id);
  }
  for (size_t i = 0; i < size; i++)
    for (size_t j = i + 1; j < size; j++)
      if (alpha_equivalent (store[i], store[j]))
        FATAL ("clause[%" PRIu64 "] and clause[%" PRIu64 "] "
          "alpha-equivalent", store[i]->id, store[j]->id);
  VERBOSE (2, "checked %zu stored clauses", size);
}

}
