#ifdef LOGGING

#include "internal.hpp"

namespace Refuter {

//   LOG <round> <message> [<clause or literals>]

void Logger::begin (Internal * internal, const char * fmt, va_list & ap) {
  internal->print_prefix ();
  tout.magenta ();
  fputs ("LOG ", stdout);
  tout.magenta (true);
  printf ("%" PRId64 " ", internal->stats.rounds);
  tout.normal ();
  tout.magenta ();
  vprintf (fmt, ap);
}

void Logger::end () {
  tout.normal ();
  fputc ('\n', stdout);
  fflush (stdout);
}

void Logger::log (Internal * internal, const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  begin (internal, fmt, ap);
  va_end (ap);
  end ();
}

void Logger::log (Internal * internal, const Clause * c,
                  const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  begin (internal, fmt, ap);
  va_end (ap);
  if (c->seed ()) fputs (" seed", stdout);
  else printf (" resolvent of [%" PRIu64 "] and [%" PRIu64 "]",
         c->antecedents[0], c->antecedents[1]);
  printf (" [%" PRIu64 "] %s", c->id, internal->text (c).c_str ());
  end ();
}

void Logger::log (Internal * internal, const vector<Literal> & literals,
                  const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  begin (internal, fmt, ap);
  va_end (ap);
  printf (" literals %s", internal->text (literals).c_str ());
  end ();
}

}

#endif
