#ifndef _stats_hpp_INCLUDED
#define _stats_hpp_INCLUDED

#include <cstdint>

namespace Refuter {

struct Internal;

struct Stats {

  int64_t rounds;       // completed or started saturation rounds
  int64_t pairs;        // clause pairs resolved
  int64_t tried;        // literal pairs tried
  int64_t unified;      // complementary literal pairs
  int64_t resolvents;   // computed resolvents
  int64_t duplicates;   // alpha-equivalent resolvents discarded
  int64_t added;        // new resolvents stored
  int64_t empty;        // derived empty clauses

  struct {
    int64_t parsed;     // parsed seed clauses
    int64_t added;      // stored seed clauses
    int64_t duplicates; // alpha-equivalent seed clauses
  } seeds;

  int64_t declared;     // explicitly declared predicates

  int maxsize;          // maximum clause size
  int maxvars;          // maximum number of clause variables

  struct {
    double real;        // real time at initialization
    double process;     // process time at initialization
  } time;

  int64_t sections;     // number of printed sections

  Stats ();

  void print (Internal *);
};

}

#endif
