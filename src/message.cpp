#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/
#ifndef QUIET
/*------------------------------------------------------------------------*/

// With 'log' set all messages are printed, even with 'quiet'.

bool Internal::silent (int level) const {
#ifdef LOGGING
  if (opts.log) return false;
#endif
  return opts.quiet || level > opts.verbose;
}

void Internal::print_prefix () {
  fputs (prefix.c_str (), stdout);
}

void Internal::print_line (const char * head, const char * fmt,
                           va_list * ap) {
  print_prefix ();
  if (head) fputs (head, stdout);
  if (fmt) vprintf (fmt, *ap);
  fputc ('\n', stdout);
  fflush (stdout);
}

void Internal::vmessage (const char * fmt, va_list & ap) {
  if (!silent (0)) print_line (0, fmt, &ap);
}

void Internal::message (const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  vmessage (fmt, ap);
  va_end (ap);
}

void Internal::message () {
  if (!silent (0)) print_line (0, 0, 0);
}

void Internal::vverbose (int level, const char * fmt, va_list & ap) {
  if (!silent (level)) print_line (0, fmt, &ap);
}

void Internal::verbose (int level, const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  vverbose (level, fmt, ap);
  va_end (ap);
}

void Internal::verbose (int level) {
  if (!silent (level)) print_line (0, 0, 0);
}

/*------------------------------------------------------------------------*/

//   c --- [ <title> ] -------------------------------------------------

void Internal::section (const char * title) {
  if (silent (0)) return;
  if (stats.sections++) MSG ();
  print_prefix ();
  tout.blue ();
  fputs ("--- [ ", stdout);
  tout.blue (true);
  fputs (title, stdout);
  tout.blue ();
  fputs (" ] ", stdout);
  const size_t used = prefix.size () + strlen (title) + 9;
  if (used < 78) fputs (string (78 - used, '-').c_str (), stdout);
  tout.normal ();
  fputc ('\n', stdout);
  MSG ();
}

// Phase messages need 'verbose' at least '2'.

void Internal::phase (const char * phase, const char * fmt, ...) {
  if (silent (2)) return;
  const string head = string ("[") + phase + "] ";
  va_list ap;
  va_start (ap, fmt);
  print_line (head.c_str (), fmt, &ap);
  va_end (ap);
}

void Internal::phase (const char * phase, int64_t count,
                      const char * fmt, ...) {
  if (silent (2)) return;
  const string head =
    string ("[") + phase + "-" + std::to_string (count) + "] ";
  va_list ap;
  va_start (ap, fmt);
  print_line (head.c_str (), fmt, &ap);
  va_end (ap);
}

/*------------------------------------------------------------------------*/
#endif // ifndef QUIET
/*------------------------------------------------------------------------*/

void Internal::warning (const char * fmt, ...) {
  fflush (stdout);
  terr.bold ();
  fputs ("refuter: ", stderr);
  terr.red (1);
  fputs ("warning:", stderr);
  terr.normal ();
  fputc (' ', stderr);
  va_list ap;
  va_start (ap, fmt);
  vfprintf (stderr, fmt, ap);
  va_end (ap);
  fputc ('\n', stderr);
  fflush (stderr);
}

/*------------------------------------------------------------------------*/

void Internal::error_message_start () {
  fflush (stdout);
  terr.red (1);
  fputs ("*** refuter error:", stderr);
  terr.normal ();
  fputc (' ', stderr);
}

void Internal::error_message_end () {
  fputc ('\n', stderr);
  fflush (stderr);
  exit (1);
}

void Internal::verror (const char * fmt, va_list & ap) {
  error_message_start ();
  vfprintf (stderr, fmt, ap);
  error_message_end ();
}

void Internal::error (const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  verror (fmt, ap);
  va_end (ap);          // unreachable
}

/*------------------------------------------------------------------------*/

void fatal_message_start () {
  fflush (stdout);
  terr.bold ();
  fputs ("refuter: ", stderr);
  terr.red (1);
  fputs ("fatal error:", stderr);
  terr.normal ();
  fputc (' ', stderr);
}

void fatal_message_end () {
  fputc ('\n', stderr);
  fflush (stderr);
  abort ();
}

void fatal (const char * fmt, ...) {
  fatal_message_start ();
  va_list ap;
  va_start (ap, fmt);
  vfprintf (stderr, fmt, ap);
  va_end (ap);
  fatal_message_end ();
  abort ();
}

}
