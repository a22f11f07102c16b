#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

void Substitution::apply (const Literal & lit, int offset,
                          vector<Literal> & res) const {
  res.push_back (Literal (lit.predicate, lit.negative));
  Literal & applied = res.back ();
  applied.args.reserve (lit.args.size ());
  for (const auto & arg : lit.args)
    applied.args.push_back (deref (standardize (arg, offset)));
}

/*------------------------------------------------------------------------*/

bool Unifier::unify (Substitution & subst, Term s, Term t) {
  s = subst.deref (s);
  t = subst.deref (t);
  if (s == t) return true;
  if (is_variable (s)) subst.bind (s, t);
  else if (is_variable (t)) subst.bind (t, s);
  else return false;                    // clashing constants
  return true;
}

bool Unifier::match_complementary (const Literal & l, int offset1,
                                   const Literal & k, int offset2,
                                   Substitution & subst) {
  if (l.predicate != k.predicate) return false;
  if (l.negative == k.negative) return false;
  if (l.args.size () != k.args.size ()) return false;
  for (size_t i = 0; i < l.args.size (); i++) {
    const Term s = standardize (l.args[i], offset1);
    const Term t = standardize (k.args[i], offset2);
    if (!unify (subst, s, t)) {
      LOG ("argument %d clashes", (int) i + 1);
      return false;
    }
  }
  return true;
}

}
