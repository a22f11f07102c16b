// vim: set tw=300: set VIM text width to 300 characters for this file.

#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

Stats::Stats () {
  memset (this, 0, sizeof *this);
  time.real = absolute_real_time ();
  time.process = absolute_process_time ();
}

/*------------------------------------------------------------------------*/

#define PRT(FMT,...) \
do { \
  if (FMT[0] == ' ' && !all) break; \
  MSG (FMT, __VA_ARGS__); \
} while (0)

/*------------------------------------------------------------------------*/

void Stats::print (Internal * internal) {

#ifdef QUIET
  (void) internal;
#else

  Stats & stats = internal->stats;

  int all = internal->opts.verbose > 0;
#ifdef LOGGING
  if (internal->opts.log) all = true;
#endif // ifdef LOGGING

  const double t = internal->process_time ();
  const int64_t clauses = internal->store.size ();

  SECTION ("statistics");

  PRT ("rounds:          %15" PRId64 "   %10.2f    per second", stats.rounds, relative (stats.rounds, t));
  PRT ("pairs:           %15" PRId64 "   %10.2f    per round", stats.pairs, relative (stats.pairs, stats.rounds));
  PRT ("  tried:         %15" PRId64 "   %10.2f    per pair", stats.tried, relative (stats.tried, stats.pairs));
  PRT ("  unified:       %15" PRId64 "   %10.2f %%  of tried", stats.unified, percent (stats.unified, stats.tried));
  PRT ("resolvents:      %15" PRId64 "   %10.2f    per second", stats.resolvents, relative (stats.resolvents, t));
  PRT ("  added:         %15" PRId64 "   %10.2f %%  of resolvents", stats.added, percent (stats.added, stats.resolvents));
  PRT ("  duplicates:    %15" PRId64 "   %10.2f %%  of resolvents", stats.duplicates, percent (stats.duplicates, stats.resolvents));
  PRT ("  empty:         %15" PRId64 "   %10.2f %%  of added", stats.empty, percent (stats.empty, stats.added));
  PRT ("seeds:           %15" PRId64 "   %10.2f %%  of clauses", stats.seeds.added, percent (stats.seeds.added, clauses));
  PRT ("  parsed:        %15" PRId64 "   %10.2f    per seed", stats.seeds.parsed, relative (stats.seeds.parsed, stats.seeds.added));
  PRT ("  duplicates:    %15" PRId64 "   %10.2f %%  of parsed", stats.seeds.duplicates, percent (stats.seeds.duplicates, stats.seeds.parsed));
  PRT ("clauses:         %15" PRId64 "   %10.2f    per round", clauses, relative (clauses, stats.rounds));
  PRT ("  maxsize:       %15d   %10.2f    literals", stats.maxsize, (double) stats.maxsize);
  PRT ("  maxvars:       %15d   %10.2f    variables", stats.maxvars, (double) stats.maxvars);
  PRT ("symbols:         %15" PRId64 "   %10.2f %%  predicates", (int64_t) (internal->signature.size_predicates () + internal->signature.size_constants ()), percent (internal->signature.size_predicates (), internal->signature.size_predicates () + internal->signature.size_constants ()));
  PRT ("  declared:      %15" PRId64 "   %10.2f %%  of predicates", stats.declared, percent (stats.declared, internal->signature.size_predicates ()));

  for (const auto & tracer : internal->file_tracers)
    tracer->print_statistics ();

  MSG ("%sseconds are measured in process time for proving%s",
    tout.magenta_code (), tout.normal_code ());

#endif // ifndef QUIET
}

}
