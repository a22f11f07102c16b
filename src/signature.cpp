#include "internal.hpp"

namespace Refuter {

Signature::Signature () {
  predicates.push_back (Predicate { "", -1, false });
  constants.push_back ("");
}

int Signature::find_predicate (const string & name) const {
  auto it = predicate_table.find (name);
  return it == predicate_table.end () ? 0 : it->second;
}

int Signature::find_constant (const string & name) const {
  auto it = constant_table.find (name);
  return it == constant_table.end () ? 0 : it->second;
}

int Signature::predicate (const string & name, int arity, bool declared) {
  int res = find_predicate (name);
  if (res) {
    assert (predicates[res].arity == arity);
    if (declared) predicates[res].declared = true;
    return res;
  }
  assert (arity >= 0);
  res = (int) predicates.size ();
  predicates.push_back (Predicate { name, arity, declared });
  predicate_table[name] = res;
  return res;
}

int Signature::constant (const string & name) {
  int res = find_constant (name);
  if (res) return res;
  res = (int) constants.size ();
  constants.push_back (name);
  constant_table[name] = res;
  return res;
}

void Signature::backtrack (const Mark & mark) {
  assert (mark.predicates <= predicates.size ());
  assert (mark.constants <= constants.size ());
  while (predicates.size () > mark.predicates) {
    predicate_table.erase (predicates.back ().name);
    predicates.pop_back ();
  }
  while (constants.size () > mark.constants) {
    constant_table.erase (constants.back ());
    constants.pop_back ();
  }
}

}
