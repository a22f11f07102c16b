#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>

// This is the example from the header file.

int main () {

  Refuter::Prover * prover = new Refuter::Prover;

  prover->clause ("~man(X) | mortal(X).");
  prover->clause ("man(socrates).");
  prover->clause ("~mortal(socrates).");     // Negated goal.

  int res = prover->prove ();                // Saturate.
  assert (res == 20);                        // Check it is 'PROVED'.

  res = prover->derived ("mortal(socrates)");
  assert (res);                              // Derived on the way.

  delete prover;

  // Now the full knowledge base with the philosopher clauses, which do not
  // contribute to the refutation.

  prover = new Refuter::Prover;
  assert (prover->state () == Refuter::CONFIGURING);

  const char * err = prover->example ("socrates");
  assert (!err);
  assert (prover->state () == Refuter::UNKNOWN);
  assert (prover->clauses () == 6);
  assert (!prover->derived ("[]"));

  res = prover->prove ();
  assert (res == 20);
  assert (prover->status () == 20);
  assert (prover->state () == Refuter::PROVED);

  // Round 1 adds 4 and round 2 the other 3 clauses (the last is empty).

  assert (prover->clauses () == 13);
  assert (prover->derived ("[]"));
  assert (prover->derived ("man(socrates)"));
  assert (prover->derived ("mortal(socrates)"));
  assert (prover->derived ("~man(socrates)"));
  assert (prover->derived ("~greek(socrates)"));
  assert (prover->derived ("thinker(socrates)"));
  assert (prover->derived ("mortal(Y) | ~greek(Y)"));
  assert (!prover->derived ("mortal(plato)"));
  assert (!prover->derived ("wise(socrates)"));

  // Proving again does not change anything.

  res = prover->prove ();
  assert (res == 20);
  assert (prover->clauses () == 13);

  prover->statistics ();
  delete prover;

  return 0;
}
