#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>

// Without the negated goal the knowledge base saturates and the empty
// clause is never derived.  Adding the negated goal afterwards continues
// saturation and finds the refutation.

int main () {

  Refuter::Prover prover;

  const char * err = prover.example ("nogoal");
  assert (!err);
  assert (prover.clauses () == 5);

  int res = prover.prove ();
  assert (res == 10);
  assert (prover.state () == Refuter::SATURATED);
  assert (!prover.derived ("[]"));

  // Three rounds: 3 new, 1 new, nothing new.

  assert (prover.clauses () == 9);
  assert (prover.derived ("man(socrates)"));
  assert (prover.derived ("mortal(socrates)"));
  assert (prover.derived ("thinker(socrates)"));

  res = prover.prove ();
  assert (res == 10);
  assert (prover.clauses () == 9);

  err = prover.clause ("~mortal(socrates)");
  assert (!err);
  assert (prover.state () == Refuter::UNKNOWN);
  assert (!prover.status ());

  res = prover.prove ();
  assert (res == 20);
  assert (prover.derived ("[]"));

  return 0;
}
