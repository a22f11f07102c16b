#include "internal.hpp"

/*------------------------------------------------------------------------*/

extern "C" {
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
}

/*------------------------------------------------------------------------*/

namespace Refuter {

/*------------------------------------------------------------------------*/

// Compressed clause files and traces go through pipes to the external
// utility given by the suffix.  Before reading through a pipe the first
// bytes of the file are checked.  A file which does not start with them
// is read as is after a warning.

struct Compression {
  const char * suffix;
  const char * utility;
  const char * decompress;      // '%s' is replaced by the path
  const char * compress;
  int magic[7];                 // terminated by 'EOF'
};

static const Compression compressions[] = {
  { ".gz",  "gzip",  "gzip -c -d %s",  "gzip -c > %s",
    { 0x1F, 0x8B, EOF } },
  { ".bz2", "bzip2", "bzip2 -c -d %s", "bzip2 -c > %s",
    { 0x42, 0x5A, 0x68, EOF } },
  { ".xz",  "xz",    "xz -c -d %s",    "xz -c > %s",
    { 0xFD, 0x37, 0x7A, 0x58, 0x5A, 0x00, EOF } },
};

static const Compression * compression (const char * path) {
  for (const auto & c : compressions)
    if (has_suffix (path, c.suffix))
      return &c;
  return 0;
}

/*------------------------------------------------------------------------*/

File::File (Internal * i, bool w, int c, FILE * f, const char * n)
:
  internal (i),
#if !defined(QUIET) || !defined(NDEBUG)
  writing (w),
#endif
  close_file (c), file (f),
  _name (n), _lineno (1), _bytes (0)
{
  (void) w;
  assert (f), assert (n);
}

/*------------------------------------------------------------------------*/

bool File::exists (const char * path) {
  struct stat buf;
  return !stat (path, &buf) && !S_ISDIR (buf.st_mode) &&
         !access (path, R_OK);
}

// An existing file has to be writable, otherwise its directory.

bool File::writable (const char * path) {
  if (!path || !*path) return false;
  struct stat buf;
  if (!stat (path, &buf))
    return !S_ISDIR (buf.st_mode) && !access (path, W_OK);
  const char * slash = strrchr (path, '/');
  string dir;
  if (!slash) dir = ".";
  else if (slash == path) dir = "/";
  else dir.assign (path, slash - path);
  return !stat (dir.c_str (), &buf) && S_ISDIR (buf.st_mode) &&
         !access (dir.c_str (), W_OK);
}

bool File::in_path (const char * utility) {
  const char * env = getenv ("PATH");
  if (!env) return false;
  const string dirs = env;
  size_t start = 0;
  for (;;) {
    const size_t end = dirs.find (':', start);
    const string dir = dirs.substr (start, end - start);
    const string path = (dir.empty () ? "." : dir) + "/" + utility;
    if (!access (path.c_str (), X_OK)) return true;
    if (end == string::npos) return false;
    start = end + 1;
  }
}

bool File::match (Internal * internal,
                  const char * path, const int * magic) {
  FILE * tmp = fopen (path, "r");
  if (!tmp) {
    WARNING ("failed to open '%s' to check its first bytes", path);
    return false;
  }
  bool res = true;
  for (const int * p = magic; res && *p != EOF; p++)
    res = (refuter_getc_unlocked (tmp) == *p);
  fclose (tmp);
  if (!res) WARNING ("'%s' does not look compressed", path);
  return res;
}

/*------------------------------------------------------------------------*/

FILE * File::open_pipe (Internal * internal, const char * utility,
                        const char * fmt, const char * path,
                        const char * mode) {
#ifdef QUIET
  (void) internal;
#endif
  if (!in_path (utility)) {
    MSG ("did not find '%s' in path", utility);
    return 0;
  }
  string cmd = fmt;
  const size_t pos = cmd.find ("%s");
  assert (pos != string::npos);
  cmd.replace (pos, 2, path);
  MSG ("opening pipe '%s'", cmd.c_str ());
  return popen (cmd.c_str (), mode);
}

/*------------------------------------------------------------------------*/

File * File::read (Internal * internal, FILE * f, const char * n) {
  return new File (internal, false, 0, f, n);
}

File * File::write (Internal * internal, FILE * f, const char * n) {
  return new File (internal, true, 0, f, n);
}

File * File::read (Internal * internal, const char * path) {
  FILE * file = 0;
  int close_file = 2;
  const Compression * c = compression (path);
  if (c && exists (path) && match (internal, path, c->magic))
    file = open_pipe (internal, c->utility, c->decompress, path, "r");
  if (!file) {
    MSG ("opening file to read '%s'", path);
    file = fopen (path, "r");
    close_file = 1;
  }
  return file ? new File (internal, false, close_file, file, path) : 0;
}

File * File::write (Internal * internal, const char * path) {
  FILE * file;
  int close_file;
  const Compression * c = compression (path);
  if (c) {
    file = open_pipe (internal, c->utility, c->compress, path, "w");
    close_file = 2;
  } else {
    MSG ("opening file to write '%s'", path);
    file = fopen (path, "w");
    close_file = 1;
  }
  return file ? new File (internal, true, close_file, file, path) : 0;
}

/*------------------------------------------------------------------------*/

void File::close () {
  assert (file);
  if (close_file == 1) {
    MSG ("closing file '%s'", name ());
    fclose (file);
  } else if (close_file == 2) {
    MSG ("closing pipe on '%s'", name ());
    pclose (file);
  } else MSG ("disconnecting from '%s'", name ());
  file = 0;
#ifndef QUIET
  if (internal->opts.verbose > 1)
    MSG ("%s %" PRIu64 " bytes (%.2f MB)",
      writing ? "wrote" : "read", bytes (), bytes () / (double) (1 << 20));
#endif
}

void File::flush () {
  assert (file);
  fflush (file);
}

File::~File () { if (file) close (); }

}
