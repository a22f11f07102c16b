#ifndef _term_hpp_INCLUDED
#define _term_hpp_INCLUDED

#include <cassert>
#include <vector>

namespace Refuter {

using namespace std;

/*------------------------------------------------------------------------*/

// The vocabulary is function-free.  Thus an argument of a literal is
// either a constant or a variable and fits into a single 'int'.  Positive
// values are indices of constants in the 'Signature' while negative values
// encode clause local variables with variable index 'idx' as '-idx-1'.  The
// value zero is not a valid term and is used as 'unbound' marker in
// substitutions.

typedef int Term;

inline bool is_constant (Term t) { return t > 0; }
inline bool is_variable (Term t) { return t < 0; }

inline int variable_index (Term t) {
  assert (is_variable (t));
  return -t - 1;
}

inline Term variable_term (int idx) {
  assert (idx >= 0);
  return -idx - 1;
}

/*------------------------------------------------------------------------*/

struct Literal {

  int predicate;        // index in 'Signature'
  bool negative;        // polarity
  vector<Term> args;    // arity many arguments

  Literal () : predicate (0), negative (false) { }
  Literal (int p, bool n) : predicate (p), negative (n) { }

  int arity () const { return (int) args.size (); }

  bool operator == (const Literal & other) const {
    return predicate == other.predicate &&
           negative == other.negative &&
           args == other.args;
  }
  bool operator != (const Literal & other) const {
    return !(*this == other);
  }
};

// Literals are sorted first by their 'shape', where all variables are
// considered to be equal, and only then by the actual variables.  This
// keeps alpha-equivalent clauses close to each other after sorting, which
// is what 'canonicalize' and the shape hash in 'Store' rely on.

inline int compare_shape (Term a, Term b) {
  if (is_variable (a) && is_variable (b)) return 0;
  if (is_variable (a)) return -1;
  if (is_variable (b)) return 1;
  return (a > b) - (a < b);
}

struct literal_shape_less_than {
  bool operator () (const Literal & a, const Literal & b) const {
    if (a.predicate != b.predicate) return a.predicate < b.predicate;
    if (a.negative != b.negative) return a.negative < b.negative;
    if (a.args.size () != b.args.size ())
      return a.args.size () < b.args.size ();
    for (size_t i = 0; i < a.args.size (); i++) {
      const int tmp = compare_shape (a.args[i], b.args[i]);
      if (tmp) return tmp < 0;
    }
    return false;
  }
};

struct literal_less_than {
  bool operator () (const Literal & a, const Literal & b) const {
    literal_shape_less_than shape;
    if (shape (a, b)) return true;
    if (shape (b, a)) return false;
    // Same shape thus same arity and variables at the same positions.
    for (size_t i = 0; i < a.args.size (); i++)
      if (a.args[i] != b.args[i])
        return a.args[i] > b.args[i];   // 'X' (-1) before 'Y' (-2)
    return false;
  }
};

}

#endif
