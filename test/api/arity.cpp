#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <cstring>

// Every predicate has exactly one arity.  Clauses violating this or not
// following the clause syntax are rejected with an error message and do
// not change the set of stored clauses.

static void expect (const char * err, const char * expected) {
  assert (err);
  assert (!strcmp (err, expected));
}

int main () {

  {
    Refuter::Prover prover;

    assert (!prover.clause ("p(a)."));
    expect (prover.clause ("p(a,b)."),
      "<clause>:1: parse error: "
      "predicate 'p' of arity 1 used with 2 arguments");
    expect (prover.clause ("~p."),
      "<clause>:1: parse error: "
      "predicate 'p' of arity 1 used with 0 arguments");
    assert (prover.clauses () == 1);

    assert (!prover.declare ("q", 2));
    assert (!prover.declare ("q", 2));
    expect (prover.declare ("q", 3),
      "predicate 'q' of arity 2 redeclared with arity 3");
    expect (prover.declare ("Q", 1),
      "predicate name 'Q' starts like a variable");
    expect (prover.clause ("q(a) | r."),
      "<clause>:1: parse error: "
      "predicate 'q' of arity 2 used with 1 arguments");
    assert (!prover.clause ("q(a,X) | r."));
    assert (prover.clauses () == 2);

    expect (prover.clause ("X(a)."),
      "<clause>:1: parse error: expected predicate but got variable 'X'");
    expect (prover.clause ("p(a) p(b)."),
      "<clause>:1: parse error: expected '|' or '.' after literal 'p'");
    expect (prover.clause ("p(a). p(b)."),
      "<clause>:1: parse error: unexpected text after clause");
    expect (prover.clause ("p(a,"),
      "<clause>:1: parse error: "
      "unexpected end-of-file (expected argument)");
    expect (prover.clause ("p(a)\n|\n*"),
      "<clause>:3: parse error: "
      "unexpected character '*' (expected literal)");
    expect (prover.clause ("pred s/1."),
      "<clause>:1: parse error: declarations only allowed in files");
    expect (prover.clause ("  % only a comment"),
      "<clause>:1: parse error: expected clause");
    assert (prover.clauses () == 2);
  }

  {
    // A rejected clause does not fix the arity of its new predicates.

    Refuter::Prover prover;
    assert (!prover.clause ("q(a,b)."));
    expect (prover.clause ("s(a) | q(b)."),
      "<clause>:1: parse error: "
      "predicate 'q' of arity 2 used with 1 arguments");
    expect (prover.clause ("s(a) | t(b) | u(c) d."),
      "<clause>:1: parse error: expected '|' or '.' after literal 'u'");
    assert (prover.clauses () == 1);
    assert (!prover.clause ("s(a,b)."));
    assert (!prover.clause ("t(a,b,c)."));
    assert (!prover.clause ("u."));
    assert (prover.clauses () == 4);
    assert (prover.derived ("s(a,b)"));
  }

  {
    // Require explicit declarations.

    Refuter::Prover prover;
    assert (prover.set ("declare", 1));
    expect (prover.clause ("man(socrates)."),
      "<clause>:1: parse error: undeclared predicate 'man'");
    assert (!prover.declare ("man", 1));
    assert (!prover.clause ("man(socrates)."));
    assert (prover.clauses () == 1);
  }

  return 0;
}
