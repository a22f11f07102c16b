#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>

using namespace Refuter;

// Counts resolution steps.  Pairs without complementary literals never
// produce a resolvent.

class Counter : public Tracer {
public:
  int derived;
  Counter () : derived (0) { }
  void add_derived_clause (uint64_t, const char *, uint64_t, uint64_t) {
    derived++;
  }
};

static void saturates_immediately (const char * c, const char * d) {
  Prover prover;
  Counter counter;
  prover.connect_tracer (&counter);
  assert (!prover.clause (c));
  assert (!prover.clause (d));
  int res = prover.prove ();
  assert (res == 10);
  assert (prover.clauses () == 2);
  assert (!counter.derived);
}

int main () {
  saturates_immediately ("p(a).", "q(a).");            // different predicate
  saturates_immediately ("p(X).", "p(a).");            // same polarity
  saturates_immediately ("p(a).", "~p(b).");           // constant clash
  saturates_immediately ("p(X,X).", "~p(a,b).");       // X=a and X=b
  saturates_immediately ("~p(X,a) | q.", "p(Y,b) | r.");
  return 0;
}
