#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>

using namespace Refuter;

// The empty clause of the 'socrates' example is derived in round two.

int main () {

  {
    Prover prover;
    prover.set ("rounds", 1);
    assert (!prover.example ("socrates"));
    int res = prover.prove ();
    assert (!res);
    assert (prover.state () == UNKNOWN);
    assert (prover.clauses () == 10);
    assert (prover.derived ("man(socrates)"));
    assert (!prover.derived ("mortal(socrates)"));

    // The limit covers all rounds of all 'prove' calls.

    res = prover.prove ();
    assert (!res);
    assert (prover.clauses () == 10);
  }

  {
    Prover prover;
    prover.set ("rounds", 2);
    assert (!prover.example ("socrates"));
    int res = prover.prove ();
    assert (res == 20);
  }

  {
    // An empty seed clause is a trivial refutation.

    Prover prover;
    assert (!prover.clause ("p(a)."));
    assert (!prover.clause ("[]"));
    assert (prover.state () == PROVED);
    int res = prover.prove ();
    assert (res == 20);
    assert (prover.clauses () == 2);
  }

  {
    // Nothing to resolve at all.

    Prover prover;
    int res = prover.prove ();
    assert (res == 10);
    assert (!prover.clauses ());
  }

  return 0;
}
