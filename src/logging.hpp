#ifndef _logging_hpp_INCLUDED
#define _logging_hpp_INCLUDED

/*------------------------------------------------------------------------*/
#ifdef LOGGING
/*------------------------------------------------------------------------*/

#include <cstdarg>
#include <vector>

namespace Refuter {

// Logging is compiled in with 'REFUTER_LOGGING' and enabled by '-l'.

using namespace std;

struct Clause;
struct Internal;
struct Literal;

struct Logger {

  static void begin (Internal *, const char * fmt, va_list &);
  static void end ();

  static void log (Internal *, const char * fmt, ...)
    REFUTER_ATTRIBUTE_FORMAT (2, 3);

  static void log (Internal *, const Clause *, const char *fmt, ...)
    REFUTER_ATTRIBUTE_FORMAT (3, 4);

  // Literals not yet in a clause, e.g., 'resolvent'.
  //
  static void log (Internal *, const vector<Literal> &, const char *fmt, ...)
    REFUTER_ATTRIBUTE_FORMAT (3, 4);
};

}

/*------------------------------------------------------------------------*/

#define LOG(...) \
do { \
  if (!internal->opts.log) break; \
  Logger::log (internal, __VA_ARGS__); \
} while (0)

/*------------------------------------------------------------------------*/
#else // end of 'then' part of 'ifdef LOGGING'
/*------------------------------------------------------------------------*/

#define LOG(...) do { } while (0)

/*------------------------------------------------------------------------*/
#endif // end of 'else' part of 'ifdef LOGGING'
/*------------------------------------------------------------------------*/

#endif
