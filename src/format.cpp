#include "internal.hpp"

namespace Refuter {

void Format::add (const char * fmt, va_list & ap) {
  va_list copy;
  va_copy (copy, ap);
  const int len = vsnprintf (0, 0, fmt, copy);
  va_end (copy);
  if (len <= 0) return;
  const size_t old = buffer.size ();
  buffer.resize (old + len + 1);
  vsnprintf (&buffer[old], len + 1, fmt, ap);
  buffer.resize (old + len);    // drop terminating zero
}

const char * Format::init (const char * fmt, ...) {
  buffer.clear ();
  va_list ap;
  va_start (ap, fmt);
  add (fmt, ap);
  va_end (ap);
  return str ();
}

const char * Format::append (const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  add (fmt, ap);
  va_end (ap);
  return str ();
}

}
