/*------------------------------------------------------------------------*/

// The version is read from the 'VERSION' file by 'CMakeLists.txt' and
// passed on the command line.  Otherwise we fall back to a default.

#ifndef REFUTER_VERSION
#define REFUTER_VERSION "1.0.0"
#endif

#ifndef REFUTER_COMPILER
#if defined(__clang__)
#define REFUTER_COMPILER "clang " __clang_version__
#elif defined(__GNUC__)
#define REFUTER_COMPILER "g++ " __VERSION__
#else
#define REFUTER_COMPILER "unknown compiler"
#endif
#endif

/*------------------------------------------------------------------------*/

#include "version.hpp"

namespace Refuter {

const char * version () { return REFUTER_VERSION; }
const char * compiler () { return REFUTER_COMPILER; }
const char * date () { return __DATE__ " " __TIME__; }

}
