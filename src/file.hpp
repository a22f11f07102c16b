#ifndef _file_hpp_INCLUDED
#define _file_hpp_INCLUDED

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

/*------------------------------------------------------------------------*/
#ifndef NUNLOCKED
#define refuter_putc_unlocked putc_unlocked
#define refuter_getc_unlocked getc_unlocked
#else
#define refuter_putc_unlocked putc
#define refuter_getc_unlocked getc
#endif
/*------------------------------------------------------------------------*/

namespace Refuter {

// Clause files and traces.  Reading counts lines for parse errors.

struct Internal;

class File {

  Internal * internal;
#if !defined(QUIET) || !defined(NDEBUG)
  bool writing;
#endif

  int close_file;       // need to close file (1=fclose, 2=pclose)
  FILE * file;
  std::string _name;
  uint64_t _lineno;
  uint64_t _bytes;

  File (Internal *, bool, int, FILE *, const char *);

  static FILE * open_pipe (Internal *, const char * utility,
                           const char * fmt, const char * path,
                           const char * mode);
public:

  static bool in_path (const char * utility);   // found in 'PATH'?
  static bool exists (const char * path);       // readable file?
  static bool writable (const char * path);     // can be (over)written?

  // Does the file start with the given bytes (terminated by 'EOF')?
  //
  static bool match (Internal *, const char * path, const int * magic);

  // Wrap an already opened file, which is not closed.
  //
  static File * read (Internal *, FILE * f, const char * name);
  static File * write (Internal *, FILE *, const char * name);

  // Open a file by path name.  Files with suffix '.gz', '.bz2' or '.xz'
  // are piped through the corresponding compression utility.
  //
  static File * read (Internal *, const char * path);
  static File * write (Internal *, const char * path);

  ~File ();

  // The 'unlocked' versions are fine since a file belongs to one prover.

  int get () {
    assert (!writing);
    int res = refuter_getc_unlocked (file);
    if (res == '\n') _lineno++;
    if (res != EOF) _bytes++;
    return res;
  }

  bool put (char ch) {
    assert (writing);
    if (refuter_putc_unlocked (ch, file) == EOF) return false;
    _bytes++;
    return true;
  }

  bool put (const char * s) {
    for (const char * p = s; *p; p++)
      if (!put (*p)) return false;
    return true;
  }

  bool put (const std::string & s) { return put (s.c_str ()); }

  bool put (uint64_t id) {
    assert (writing);
    if (!id) return put ('0');
    char buffer[21];
    int i = sizeof buffer;
    buffer[--i] = 0;
    while (id) {
      assert (i > 0);
      buffer[--i] = '0' + id % 10;
      id /= 10;
    }
    return put (buffer + i);
  }

  const char * name () const { return _name.c_str (); }
  uint64_t lineno () const { return _lineno; }
  uint64_t bytes () const { return _bytes; }

  bool closed () { return !file; }
  void close ();
  void flush ();
};

}

#endif
