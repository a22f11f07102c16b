#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <string>
#include <vector>

using namespace std;
using namespace Refuter;

class Collector : public ClauseIterator {
public:
  vector<uint64_t> ids;
  vector<string> texts;
  size_t limit;
  Collector (size_t l = ~(size_t) 0) : limit (l) { }
  bool clause (uint64_t id, const char * text) {
    ids.push_back (id);
    texts.push_back (text);
    return ids.size () < limit;
  }
};

int main () {

  Prover prover;
  assert (!prover.example ("nogoal"));

  Collector seeds;
  bool res = prover.traverse_clauses (seeds);
  assert (res);
  assert (seeds.ids.size () == 5);
  for (size_t i = 0; i < seeds.ids.size (); i++)
    assert (seeds.ids[i] == i + 1);
  assert (seeds.texts[0] == "~man(X) | mortal(X)");
  assert (seeds.texts[3] == "greek(socrates)");

  assert (prover.prove () == 10);

  Collector all;
  res = prover.traverse_clauses (all);
  assert (res);
  assert (all.ids.size () == 9);
  assert (all.texts[8] == "mortal(socrates)");

  Collector some (3);
  res = prover.traverse_clauses (some);
  assert (!res);
  assert (some.ids.size () == 3);

  prover.store ();

  return 0;
}
