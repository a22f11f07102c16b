#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

Internal::Internal ()
:
  status (0),
  terminated (false),
  termination_forced (false),
  resolved (0),
  opts (this),
  unifier (this),
  terminator (0),
  prefix ("c "),
  internal (this)
{
}

Internal::~Internal () {
  for (const auto & tracer : file_tracers)
    delete tracer;
}

/*------------------------------------------------------------------------*/

const char * Internal::declare (const char * name, int arity) {
  if (!is_identifier_char (*name))
    return error_message.init ("invalid predicate name '%s'", name);
  for (const char * p = name; *p; p++)
    if (!is_identifier_char (*p))
      return error_message.init ("invalid predicate name '%s'", name);
  if (is_variable_name (name))
    return error_message.init (
      "predicate name '%s' starts like a variable", name);
  if (arity < 0)
    return error_message.init ("negative arity %d of predicate '%s'",
      arity, name);
  int p = signature.find_predicate (name);
  if (p) {
    const int old = signature.arity (p);
    if (old != arity)
      return error_message.init (
        "predicate '%s' of arity %d redeclared with arity %d",
        name, old, arity);
    if (!signature.declared (p)) {
      signature.declare (p);
      stats.declared++;
    }
    LOG ("redeclared predicate '%s' of arity %d", name, arity);
  } else {
    p = signature.predicate (name, arity, true);
    stats.declared++;
    LOG ("declared predicate '%s' of arity %d", name, arity);
  }
  return 0;
}

/*------------------------------------------------------------------------*/

bool Internal::add_seed (vector<Literal> & literals) {
  stats.seeds.parsed++;
  Clause * c = new_clause (literals);
  if (!store.insert (c)) {
    stats.seeds.duplicates++;
    LOG (c, "duplicated seed");
    delete c;
    return false;
  }
  stats.seeds.added++;
  LOG (c, "added seed");
  trace_seed_clause (c);
  if (c->empty () && status != 20) {
    MSG ("empty seed clause[%" PRIu64 "]", c->id);
    status = 20;
  } else if (status == 10) {
    LOG ("new seed clause invalidates saturation");
    status = 0;
  }
  return true;
}

bool Internal::derived (vector<Literal> & literals) {
  vector<Literal> copy = literals;
  Clause tmp;
  tmp.id = 0;
  tmp.antecedents[0] = tmp.antecedents[1] = 0;
  tmp.generation = 0;
  tmp.vars = canonicalize (copy);
  tmp.hash = shape_hash (copy);
  tmp.literals.swap (copy);
  literals.clear ();
  return store.contains (&tmp);
}

/*------------------------------------------------------------------------*/

void Internal::print_statistics () {
  stats.print (this);
}

void Internal::print_store () {
#ifndef QUIET
  SECTION ("store");
  for (const auto & c : store) {
    if (c->seed ())
      MSG ("[%" PRIu64 "] %s (seed)", c->id, text (c).c_str ());
    else
      MSG ("[%" PRIu64 "] %s (from %" PRIu64 " and %" PRIu64
        " in round %" PRId64 ")", c->id, text (c).c_str (),
        c->antecedents[0], c->antecedents[1], c->generation);
  }
#endif
}

}
