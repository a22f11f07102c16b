#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>

using namespace Refuter;

// Terminates after the given number of checks, which happen before every
// pair of clauses.

class Countdown : public Terminator {
  int remaining;
public:
  int checked;
  Countdown (int n) : remaining (n), checked (0) { }
  bool terminate () {
    checked++;
    if (!remaining) return true;
    remaining--;
    return false;
  }
};

int main () {

  {
    Prover prover;
    Countdown countdown (0);
    prover.connect_terminator (&countdown);
    assert (!prover.example ("socrates"));
    int res = prover.prove ();
    assert (!res);
    assert (countdown.checked == 1);
    assert (prover.clauses () == 6);
    assert (prover.state () == UNKNOWN);

    prover.disconnect_terminator ();
    res = prover.prove ();
    assert (res == 20);
  }

  {
    // Forced termination before 'prove' applies to the next call only.

    Prover prover;
    assert (!prover.example ("socrates"));
    prover.terminate ();
    int res = prover.prove ();
    assert (!res);
    assert (prover.clauses () == 6);
    res = prover.prove ();
    assert (res == 20);
  }

  {
    // Interrupting the first round in the middle and continuing.

    Prover prover;
    Countdown countdown (2);
    prover.connect_terminator (&countdown);
    assert (!prover.example ("socrates"));
    int res = prover.prove ();
    assert (!res);
    assert (prover.clauses () == 7);   // only pair (1,2) resolved
    prover.disconnect_terminator ();
    res = prover.prove ();
    assert (res == 20);
    assert (prover.clauses () == 13);
  }

  return 0;
}
