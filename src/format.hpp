#ifndef _format_hpp_INCLUDED
#define _format_hpp_INCLUDED

#include <cstdarg>
#include <string>

namespace Refuter {

// Error messages are returned as 'const char *' by the API.  The message
// is formatted into the buffer of a 'Format' object owned by the prover,
// where it stays valid until the next call to 'init'.

class Format {
  std::string buffer;
  void add (const char * fmt, va_list &);
public:
  const char * init (const char * fmt, ...)
    REFUTER_ATTRIBUTE_FORMAT (2, 3);
  const char * append (const char * fmt, ...)
    REFUTER_ATTRIBUTE_FORMAT (2, 3);
  const char * str () const { return buffer.c_str (); }
};

}

#endif
