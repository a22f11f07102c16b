#include "internal.hpp"

extern "C" {
#include <unistd.h>
}

namespace Refuter {

Terminal::Terminal (FILE * f) : file (f) {
  const char * term = getenv ("TERM");
  colors = isatty (fileno (file)) && term && strcmp (term, "dumb");
}

// Leave the terminal in normal mode at exit.

Terminal::~Terminal () { normal (); }

Terminal tout (stdout);
Terminal terr (stderr);

}
