#include "../../src/refuter.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <string>

using namespace std;
using namespace Refuter;

static string path (const char * suffix) {
  const char * prefix = getenv ("REFUTERBUILD");
  string res = prefix ? prefix : ".";
  res += "/test-api-trace.";
  res += suffix;
  return res;
}

static string slurp (const string & name) {
  FILE * file = fopen (name.c_str (), "r");
  assert (file);
  string res;
  int ch;
  while ((ch = getc (file)) != EOF) res.push_back (ch);
  fclose (file);
  return res;
}

static const char * seeds =
"seed [1] ~man(X) | mortal(X)\n"
"seed [2] man(X) | ~greek(X)\n"
"seed [3] ~philosopher(X) | thinker(X)\n"
"seed [4] greek(socrates)\n"
"seed [5] philosopher(socrates)\n"
"seed [6] ~mortal(socrates)\n";

static const char * steps =
"resolved [1] ~man(X) | mortal(X) and [2] man(X) | ~greek(X)"
" => [7] mortal(X) | ~greek(X)\n"
"resolved [1] ~man(X) | mortal(X) and [6] ~mortal(socrates)"
" => [8] ~man(socrates)\n"
"resolved [2] man(X) | ~greek(X) and [4] greek(socrates)"
" => [9] man(socrates)\n"
"resolved [3] ~philosopher(X) | thinker(X) and [5] philosopher(socrates)"
" => [10] thinker(socrates)\n"
"resolved [1] ~man(X) | mortal(X) and [9] man(socrates)"
" => [11] mortal(socrates)\n"
"resolved [2] man(X) | ~greek(X) and [8] ~man(socrates)"
" => [12] ~greek(socrates)\n"
"resolved [8] ~man(socrates) and [9] man(socrates)"
" => [13] empty clause derived\n";

static string run (const char * suffix, int incremental, int trace_seeds) {
  const string name = path (suffix);
  Prover prover;
  prover.set ("incremental", incremental);
  prover.set ("seeds", trace_seeds);
  bool ok = prover.trace (name.c_str ());
  assert (ok);
  assert (!prover.example ("socrates"));
  int res = prover.prove ();
  assert (res == 20);
  prover.close_trace ();
  string res_trace = slurp (name);
  (void) remove (name.c_str ());
  return res_trace;
}

int main () {

  const string expected = string (seeds) + steps;

  // Only newly stored clauses are traced, thus the trace does not depend
  // on skipping pairs of earlier rounds.

  assert (run ("incremental", 1, 1) == expected);
  assert (run ("full", 0, 1) == expected);
  assert (run ("noseeds", 1, 0) == steps);

  return 0;
}
