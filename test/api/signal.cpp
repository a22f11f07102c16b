#include "../../src/signal.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <csignal>
#include <cstring>

using namespace Refuter;

// Names of caught signals as printed by the stand alone prover.

int main () {
  assert (!strcmp (Signal::name (SIGABRT), "SIGABRT"));
  assert (!strcmp (Signal::name (SIGBUS), "SIGBUS"));
  assert (!strcmp (Signal::name (SIGINT), "SIGINT"));
  assert (!strcmp (Signal::name (SIGSEGV), "SIGSEGV"));
  assert (!strcmp (Signal::name (SIGTERM), "SIGTERM"));
  assert (!strcmp (Signal::name (SIGALRM), "SIGALRM"));
  assert (!strcmp (Signal::name (SIGUSR1), "UNKNOWN"));
  return 0;
}
