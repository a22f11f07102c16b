#ifndef _unify_hpp_INCLUDED
#define _unify_hpp_INCLUDED

#include "term.hpp"

namespace Refuter {

struct Internal;

/*------------------------------------------------------------------------*/

// Two clauses are standardized apart by shifting the variables of the
// second clause by the number of variables of the first clause.  Then the
// two sets of variable names are disjoint and a single substitution over
// 'first->vars + second->vars' variables covers both clauses.

inline Term standardize (Term t, int offset) {
  if (!is_variable (t)) return t;
  return variable_term (variable_index (t) + offset);
}

/*------------------------------------------------------------------------*/

// A substitution maps variables to terms.  Since there are no function
// symbols a variable is bound either to a constant or to another variable
// and binding chains are followed by 'deref'.  Only unbound variables are
// ever bound, which excludes cycles.

struct Substitution {

  vector<Term> bindings;        // zero if unbound

  void reset (int vars) { bindings.assign (vars, 0); }

  Term deref (Term t) const {
    while (is_variable (t)) {
      const Term u = bindings[variable_index (t)];
      if (!u) break;
      t = u;
    }
    return t;
  }

  void bind (Term var, Term t) {
    assert (is_variable (var));
    assert (!bindings[variable_index (var)]);
    assert (var != t);
    bindings[variable_index (var)] = t;
  }

  // Apply substitution to a literal of a clause standardized apart by
  // 'offset' and append the result to 'res'.
  //
  void apply (const Literal &, int offset, vector<Literal> & res) const;
};

/*------------------------------------------------------------------------*/

class Unifier {

  Internal * internal;

  bool unify (Substitution &, Term, Term);

public:

  Unifier (Internal * i) : internal (i) { }

  // Determine whether the two literals are complementary, i.e., have the
  // same predicate, opposite polarity and unifiable arguments, where the
  // variables of the first literal are standardized apart with 'offset1'
  // and those of the second with 'offset2'.  The unifier is returned in
  // 'subst' which has to be reset to the combined number of variables.
  //
  bool match_complementary (const Literal &, int offset1,
                            const Literal &, int offset2,
                            Substitution & subst);
};

}

#endif
