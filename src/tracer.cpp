#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

void Internal::connect_tracer (Tracer * tracer) {
  assert (tracer);
  LOG ("connecting tracer");
  tracers.push_back (tracer);
}

bool Internal::disconnect_tracer (Tracer * tracer) {
  auto it = find (tracers.begin (), tracers.end (), tracer);
  if (it == tracers.end ()) return false;
  LOG ("disconnecting tracer");
  tracers.erase (it);
  auto jt = find (file_tracers.begin (), file_tracers.end (), tracer);
  if (jt != file_tracers.end ()) {
    delete *jt;
    file_tracers.erase (jt);
  }
  return true;
}

// Text tracers are owned by the prover and deleted with it.

void Internal::connect_text_tracer (File * file) {
  TextTracer * tracer = new TextTracer (this, file);
  file_tracers.push_back (tracer);
  connect_tracer (tracer);
}

void Internal::flush_trace () {
  for (const auto & tracer : file_tracers)
    if (!tracer->closed ())
      tracer->flush ();
}

void Internal::close_trace () {
  for (const auto & tracer : file_tracers)
    if (!tracer->closed ())
      tracer->close ();
}

/*------------------------------------------------------------------------*/

void Internal::trace_seed_clause (const Clause * c) {
  if (tracers.empty ()) return;
  assert (c->seed ());
  const string str = text (c);
  for (const auto & tracer : tracers)
    tracer->add_seed_clause (c->id, str.c_str ());
}

void Internal::trace_derived_clause (const Clause * c) {
  if (tracers.empty ()) return;
  assert (!c->seed ());
  const string str = text (c);
  for (const auto & tracer : tracers)
    tracer->add_derived_clause (c->id, str.c_str (),
                                c->antecedents[0], c->antecedents[1]);
}

void Internal::trace_conclusion () {
  for (const auto & tracer : tracers)
    tracer->conclude (status);
}

}
