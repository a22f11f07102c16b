#include "internal.hpp"

/*------------------------------------------------------------------------*/

extern "C" {
#include <sys/time.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <unistd.h>
}

namespace Refuter {

static double seconds (const struct timeval & tv) {
  return tv.tv_sec + 1e-6 * tv.tv_usec;
}

double absolute_real_time () {
  struct timeval tv;
  return gettimeofday (&tv, 0) ? 0 : seconds (tv);
}

// User plus system time.

double absolute_process_time () {
  struct rusage u;
  if (getrusage (RUSAGE_SELF, &u)) return 0;
  return seconds (u.ru_utime) + seconds (u.ru_stime);
}

double Internal::real_time () {
  return absolute_real_time () - stats.time.real;
}

double Internal::process_time () {
  return absolute_process_time () - stats.time.process;
}

/*------------------------------------------------------------------------*/

// 'ru_maxrss' is in kilobytes on Linux.

uint64_t maximum_resident_set_size () {
  struct rusage u;
  if (getrusage (RUSAGE_SELF, &u)) return 0;
  return (uint64_t) u.ru_maxrss * 1024;
}

// Second field of '/proc/self/statm' in pages (Linux only).

uint64_t current_resident_set_size () {
  FILE * file = fopen ("/proc/self/statm", "r");
  if (!file) return 0;
  uint64_t size, pages;
  const int scanned = fscanf (file, "%" SCNu64 " %" SCNu64, &size, &pages);
  fclose (file);
  if (scanned != 2) return 0;
  return pages * (uint64_t) sysconf (_SC_PAGESIZE);
}

/*------------------------------------------------------------------------*/

void Internal::print_resource_usage () {
#ifndef QUIET
  SECTION ("resources");
  const double mb = 1 << 20;
  MSG ("process time: %12.2f seconds", process_time ());
  MSG ("real time:    %12.2f seconds", real_time ());
  MSG ("maximum RSS:  %12.2f MB", maximum_resident_set_size () / mb);
  MSG ("current RSS:  %12.2f MB", current_resident_set_size () / mb);
#endif
}

}
