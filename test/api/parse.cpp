#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace std;
using namespace Refuter;

static string path (const char * suffix) {
  const char * prefix = getenv ("REFUTERBUILD");
  string res = prefix ? prefix : ".";
  res += "/test-api-parse.";
  res += suffix;
  return res;
}

static void write (const string & name, const char * content) {
  FILE * file = fopen (name.c_str (), "w");
  assert (file);
  fputs (content, file);
  fclose (file);
}

int main () {

  const string good = path ("good.txt");
  const string bad = path ("bad.txt");
  const string redeclared = path ("redeclared.txt");
  const string late = path ("late.txt");

  write (good,
"% --rounds=5\n"
"%   --no-seeds   \n"
"% knowledge base\n"
"pred man/1.\n"
"pred mortal / 1 .\n"
"\n"
"~man(X) | mortal(X).    % all men are mortal\n"
"man(socrates).\n"
"\n"
"-mortal(socrates)\n");

  write (bad,
"p(a).\n"
"q(b).\n"
"r(c) | p(a,\n"
"  b).\n");

  write (redeclared,
"pred p/2.\n");

  write (late,
"% --rounds=7\n"
"[].\n");

  Prover prover;

  const char * err = prover.read (good.c_str ());
  assert (!err);
  assert (prover.get ("rounds") == 5);
  assert (!prover.get ("seeds"));
  assert (prover.clauses () == 3);
  assert (prover.state () == UNKNOWN);

  err = prover.read (bad.c_str ());
  assert (err);
  string expected = bad;
  expected += ":4: parse error: ";
  expected += "predicate 'p' of arity 1 used with 2 arguments";
  assert (expected == err);
  assert (prover.clauses () == 5);   // 'p(a)' and 'q(b)' are kept
  assert (!prover.clause ("r(a,b)."));  // 'r/1' was not kept
  assert (prover.clauses () == 6);

  err = prover.read (redeclared.c_str ());
  assert (err);
  expected = redeclared;
  expected += ":1: parse error: ";
  expected += "predicate 'p' of arity 1 redeclared with arity 2";
  assert (expected == err);

  // Embedded options are ignored after configuration.

  err = prover.read (late.c_str ());
  assert (!err);
  assert (prover.get ("rounds") == 5);
  assert (prover.state () == PROVED);
  assert (prover.derived ("[]"));
  assert (prover.prove () == 20);

  const string missing = path ("missing.txt");
  (void) remove (missing.c_str ());
  err = prover.read (missing.c_str ());
  assert (err);
  expected = "failed to read clause file '" + missing + "'";
  assert (expected == err);

  (void) remove (good.c_str ());
  (void) remove (bad.c_str ());
  (void) remove (redeclared.c_str ());
  (void) remove (late.c_str ());

  return 0;
}
