#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

int canonicalize (vector<Literal> & literals) {

  sort (literals.begin (), literals.end (), literal_less_than ());
  literals.erase (unique (literals.begin (), literals.end ()),
                  literals.end ());

  // Renaming is a bijection on variables and thus can not produce new
  // duplicates, but it might change the order of literals of the same
  // shape, which requires to sort once more.

  vector<int> renamed;
  int vars = 0;
  for (auto & lit : literals)
    for (auto & arg : lit.args) {
      if (!is_variable (arg)) continue;
      const int idx = variable_index (arg);
      if ((size_t) idx >= renamed.size ())
        renamed.resize (idx + 1, -1);
      if (renamed[idx] < 0) renamed[idx] = vars++;
      arg = variable_term (renamed[idx]);
    }

  sort (literals.begin (), literals.end (), literal_less_than ());

  return vars;
}

uint64_t shape_hash (const vector<Literal> & literals) {
  uint64_t res = literals.size ();
  for (const auto & lit : literals) {
    res = hash_mix (res, 2u * (uint64_t) lit.predicate + lit.negative);
    for (const auto & arg : lit.args)
      res = hash_mix (res, is_variable (arg) ? 0 : (uint64_t) arg);
  }
  return res;
}

string variable_name (int idx) {
  static const char * names = "XYZUVW";
  assert (idx >= 0);
  string res;
  if (idx < 6) res.push_back (names[idx]);
  else res = "X" + to_string (idx);
  return res;
}

/*------------------------------------------------------------------------*/

Clause * Internal::new_clause (vector<Literal> & literals,
                               uint64_t a, uint64_t b) {
  assert (!a == !b);
  Clause * c = new Clause;
  c->id = 0;
  c->antecedents[0] = a;
  c->antecedents[1] = b;
  c->generation = stats.rounds;
  c->vars = canonicalize (literals);
  c->hash = shape_hash (literals);
  c->literals.swap (literals);
  literals.clear ();
  if (c->size () > stats.maxsize) stats.maxsize = c->size ();
  if (c->vars > stats.maxvars) stats.maxvars = c->vars;
  LOG (c, "new");
  return c;
}

/*------------------------------------------------------------------------*/

// Printing literals and clauses in the syntax of the parser.

string Internal::text (const Literal & lit) const {
  string res;
  if (lit.negative) res.push_back ('~');
  res += signature.predicate_name (lit.predicate);
  if (lit.args.empty ()) return res;
  res.push_back ('(');
  bool first = true;
  for (const auto & arg : lit.args) {
    if (!first) res.push_back (',');
    if (is_variable (arg)) res += variable_name (variable_index (arg));
    else res += signature.constant_name (arg);
    first = false;
  }
  res.push_back (')');
  return res;
}

string Internal::text (const vector<Literal> & literals) const {
  if (literals.empty ()) return "[]";
  string res;
  for (const auto & lit : literals) {
    if (!res.empty ()) res += " | ";
    res += text (lit);
  }
  return res;
}

string Internal::text (const Clause * c) const {
  return text (c->literals);
}

}
