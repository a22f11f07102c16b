#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <string>
#include <vector>

using namespace std;
using namespace Refuter;

// Records all resolution steps reported by the prover.

struct Step {
  uint64_t id, a, b;
  string text;
};

class StepTracer : public Tracer {
public:
  vector<Step> steps;
  int seeds, concluded;
  StepTracer () : seeds (0), concluded (-1) { }
  void add_seed_clause (uint64_t, const char *) { seeds++; }
  void add_derived_clause (uint64_t id, const char * text,
                           uint64_t a, uint64_t b) {
    Step step;
    step.id = id, step.a = a, step.b = b, step.text = text;
    steps.push_back (step);
  }
  void conclude (int status) { concluded = status; }
};

static void resolve_two (const char * c, const char * d,
                         const char * expected, int status) {
  Prover prover;
  StepTracer tracer;
  prover.connect_tracer (&tracer);
  assert (!prover.clause (c));
  assert (!prover.clause (d));
  assert (tracer.seeds == 2);
  int res = prover.prove ();
  assert (res == status);
  assert (tracer.concluded == status);
  assert (tracer.steps.size () == 1);
  const Step & step = tracer.steps[0];
  assert (step.id == 3);
  assert (step.a == 1);
  assert (step.b == 2);
  assert (step.text == expected);
  prover.disconnect_tracer (&tracer);
}

int main () {

  resolve_two ("~greek(X) | man(X).", "greek(socrates).",
               "man(socrates)", 10);

  resolve_two ("~man(X) | mortal(X).", "man(socrates).",
               "mortal(socrates)", 10);

  resolve_two ("mortal(socrates).", "~mortal(socrates).", "[]", 20);

  // Variables of the resolvent are renamed canonically.

  resolve_two ("~r(A,B) | s(B,C).", "r(a,D) | t(D).",
               "s(X,Y) | t(X)", 10);

  return 0;
}
