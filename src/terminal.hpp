#ifndef _terminal_hpp_INCLUDED
#define _terminal_hpp_INCLUDED

#include <cstdio>

namespace Refuter {

// ANSI colors for messages on '<stdout>' and errors on '<stderr>'.  By
// default only enabled if connected to a terminal which is not 'dumb'.

class Terminal {

  FILE * file;
  bool colors;

  const char * code (const char * sequence) const {
    return colors ? sequence : "";
  }

  void emit (const char * sequence) {
    if (!colors) return;
    fputs (sequence, file);
    fflush (file);
  }

public:

  Terminal (FILE *);
  ~Terminal ();

  void force_colors () { colors = true; }
  void force_no_colors () { colors = false; }

  void red (bool bright = false)     { emit (red_code (bright)); }
  void blue (bool bright = false)    { emit (bright ? "\033[1;34m" : "\033[0;34m"); }
  void magenta (bool bright = false) { emit (magenta_code (bright)); }
  void bold ()                       { emit ("\033[1m"); }
  void normal ()                     { emit ("\033[0m"); }

  const char * red_code (bool bright = false) const {
    return code (bright ? "\033[1;31m" : "\033[0;31m");
  }
  const char * magenta_code (bool bright = false) const {
    return code (bright ? "\033[1;35m" : "\033[0;35m");
  }
  const char * yellow_code (bool bright = false) const {
    return code (bright ? "\033[1;33m" : "\033[0;33m");
  }
  const char * green_code () const  { return code ("\033[0;32m"); }
  const char * normal_code () const { return code ("\033[0m"); }

  const char * bright_red_code () const     { return red_code (true); }
  const char * bright_magenta_code () const { return magenta_code (true); }
  const char * bright_yellow_code () const  { return yellow_code (true); }
};

extern Terminal tout;   // '<stdout>'
extern Terminal terr;   // '<stderr>'

}

#endif
