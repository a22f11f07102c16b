#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

// Binary resolution of the clauses 'c' and 'd' on their literals at
// position 'i' and 'j', which have to be complementary under 'subst'.  The
// variables of 'd' are standardized apart by 'c->vars' (see 'unify.hpp').
// Exactly the resolved occurrence is removed from each side.  No factoring
// is applied, thus other literals which became equal to the resolved one
// under the substitution are kept (and merged by 'canonicalize').

Clause * Internal::resolve (Clause * c, int i, Clause * d, int j,
                            const Substitution & subst) {
  if (c == d)
    FATAL ("can not resolve clause[%" PRIu64 "] with itself", c->id);
  assert (0 <= i && i < c->size ());
  assert (0 <= j && j < d->size ());
  assert (c->literals[i].predicate == d->literals[j].predicate);
  assert (c->literals[i].negative != d->literals[j].negative);

  stats.resolvents++;

  assert (resolvent.empty ());
  for (int k = 0; k < c->size (); k++)
    if (k != i) subst.apply (c->literals[k], 0, resolvent);
  for (int k = 0; k < d->size (); k++)
    if (k != j) subst.apply (d->literals[k], c->vars, resolvent);

  LOG (resolvent, "resolved clause[%" PRIu64 "] and clause[%" PRIu64 "] to",
    c->id, d->id);

  return new_clause (resolvent, c->id, d->id);
}

}
