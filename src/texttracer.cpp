#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

TextTracer::TextTracer (Internal * i, File * f) :
  internal (i), file (f)
#ifndef QUIET
  , seeds (0), derived (0)
#endif
{
  (void) internal;
}

TextTracer::~TextTracer () {
  LOG ("TEXT TRACER delete");
  delete file;
}

/*------------------------------------------------------------------------*/

void TextTracer::store (uint64_t id, const char * text) {
  assert (id);
  if (texts.size () <= id) texts.resize (id + 1);
  texts[id] = text;
}

void TextTracer::add_seed_clause (uint64_t id, const char * text) {
  if (file->closed ()) return;
  store (id, text);
  if (!internal->opts.seeds) return;
  file->put ("seed [");
  file->put (id);
  file->put ("] ");
  file->put (text);
  file->put ('\n');
#ifndef QUIET
  seeds++;
#endif
}

void TextTracer::add_derived_clause (uint64_t id, const char * text,
                                     uint64_t a, uint64_t b) {
  if (file->closed ()) return;
  assert (a < texts.size ()), assert (b < texts.size ());
  store (id, text);
  file->put ("resolved [");
  file->put (a);
  file->put ("] ");
  file->put (texts[a]);
  file->put (" and [");
  file->put (b);
  file->put ("] ");
  file->put (texts[b]);
  file->put (" => [");
  file->put (id);
  file->put ("] ");
  if (*text == '[') file->put ("empty clause derived");
  else file->put (text);
  file->put ('\n');
#ifndef QUIET
  derived++;
#endif
}

void TextTracer::conclude (int status) {
  if (file->closed ()) return;
  LOG ("TEXT TRACER conclude %d", status);
  (void) status;
  file->flush ();
}

/*------------------------------------------------------------------------*/

bool TextTracer::closed () { return file->closed (); }

void TextTracer::close () {
  assert (!closed ());
  file->close ();
}

void TextTracer::flush () {
  assert (!closed ());
  file->flush ();
  MSG ("traced %" PRIu64 " seed and %" PRIu64 " derived clauses",
    seeds, derived);
}

#ifndef QUIET

void TextTracer::print_statistics () {
  uint64_t bytes = file->bytes ();
  uint64_t total = seeds + derived;
  MSG ("trace %" PRIu64 " seed %.0f%%, %" PRIu64 " derived %.0f%%",
    seeds, percent (seeds, total), derived, percent (derived, total));
  MSG ("trace %" PRIu64 " bytes (%.2f MB)", bytes, bytes / (double)(1<<20));
}

#endif

}
