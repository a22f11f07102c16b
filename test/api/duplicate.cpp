#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>

// Clauses are sets of literals and stored only once modulo renaming of
// their variables (alpha-equivalence).

int main () {

  Refuter::Prover prover;

  assert (!prover.clause ("~man(X) | mortal(X)."));
  assert (prover.clauses () == 1);

  assert (!prover.clause ("~man(Y) | mortal(Y)."));
  assert (!prover.clause ("mortal(Z) | ~man(Z)."));
  assert (!prover.clause ("mortal(_Z) | ~man(_Z) | mortal(_Z)."));
  assert (prover.clauses () == 1);

  // Different variable pattern.

  assert (!prover.clause ("~man(X) | mortal(Y)."));
  assert (prover.clauses () == 2);
  assert (!prover.clause ("mortal(A) | ~man(B)."));
  assert (prover.clauses () == 2);

  // Renaming has to be a bijection.

  assert (!prover.clause ("p(X,Y)."));
  assert (!prover.clause ("p(Y,X)."));
  assert (prover.clauses () == 3);
  assert (!prover.clause ("p(X,X)."));
  assert (prover.clauses () == 4);

  assert (!prover.clause ("p(X,Y) | q(Y)."));
  assert (!prover.clause ("q(A) | p(B,A)."));
  assert (prover.clauses () == 5);
  assert (!prover.clause ("q(A) | p(A,B)."));
  assert (prover.clauses () == 6);

  // Ground duplicates and duplicated literals.

  assert (!prover.clause ("man(socrates)."));
  assert (!prover.clause ("man(socrates) | man(socrates)."));
  assert (prover.clauses () == 7);

  assert (prover.derived ("mortal(V) | ~man(V)"));
  assert (prover.derived ("p(U,U)"));
  assert (!prover.derived ("p(socrates,U)"));

  return 0;
}
