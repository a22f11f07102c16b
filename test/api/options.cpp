#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>

using namespace Refuter;

int main () {

  assert (Prover::is_valid_option ("rounds"));
  assert (Prover::is_valid_option ("incremental"));
  assert (!Prover::is_valid_option ("conflicts"));

  assert (Prover::is_valid_long_option ("--rounds=1e3"));
  assert (Prover::is_valid_long_option ("--no-trace"));
  assert (Prover::is_valid_long_option ("--check"));
  assert (Prover::is_valid_long_option ("--store=true"));
  assert (!Prover::is_valid_long_option ("--rounds=ten"));
  assert (!Prover::is_valid_long_option ("--unknown"));

  Prover prover;

  assert (prover.get ("rounds") == 0);
  assert (prover.get ("incremental") == 1);
  assert (prover.get ("trace") == 1);
  assert (!prover.get ("no-such-option"));

  assert (prover.set ("rounds", 3));
  assert (prover.get ("rounds") == 3);
  assert (prover.set ("rounds", -1));
  assert (prover.get ("rounds") == 0);          // clamped to minimum
  assert (prover.set ("incremental", 7));
  assert (prover.get ("incremental") == 1);     // clamped to maximum
  assert (!prover.set ("no-such-option", 1));

  assert (prover.set_long_option ("--rounds=1e3"));
  assert (prover.get ("rounds") == 1000);
  assert (prover.set_long_option ("--no-trace"));
  assert (!prover.get ("trace"));
  assert (prover.set_long_option ("--check"));
  assert (prover.get ("check") == 1);
  assert (prover.set_long_option ("--check=false"));
  assert (!prover.get ("check"));
  assert (!prover.set_long_option ("rounds=3"));
  assert (!prover.set_long_option ("--rounds="));
  assert (prover.get ("rounds") == 1000);

  prover.prefix ("test ");
  prover.options ();

  // Running with all invariant checks enabled.

  assert (prover.set ("check", 1));
  assert (!prover.example ("socrates"));
  assert (prover.prove () == 20);
  assert (prover.clauses () == 13);

  return 0;
}
