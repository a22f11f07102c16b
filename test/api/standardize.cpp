#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>

// Variables are local to their clause.  Resolution has to rename them
// apart, otherwise 'p(X,a)' and '~p(b,X)' would not be complementary.

int main () {

  {
    Refuter::Prover prover;
    assert (!prover.clause ("p(X,a)."));
    assert (!prover.clause ("~p(b,X)."));
    int res = prover.prove ();
    assert (res == 20);
    assert (prover.clauses () == 3);
  }

  {
    // Symmetry of 'r' used with a shared variable name in both clauses.

    Refuter::Prover prover;
    assert (!prover.clause ("~r(X,Y) | r(Y,X)."));
    assert (!prover.clause ("r(a,b)."));
    assert (!prover.clause ("~r(b,a)."));
    int res = prover.prove ();
    assert (res == 20);
    assert (prover.derived ("r(b,a)"));
    assert (prover.derived ("~r(a,b)"));
  }

  {
    // Transitivity chain over three constants.

    Refuter::Prover prover;
    assert (!prover.clause ("~less(X,Y) | ~less(Y,Z) | less(X,Z)."));
    assert (!prover.clause ("less(a,b)."));
    assert (!prover.clause ("less(b,c)."));
    assert (!prover.clause ("~less(a,c)."));
    int res = prover.prove ();
    assert (res == 20);
  }

  return 0;
}
