#include "refuter.hpp"
#include "resources.hpp"
#include "signal.hpp"

/*------------------------------------------------------------------------*/

#include <cassert>
#include <csignal>

/*------------------------------------------------------------------------*/

extern "C" {
#include <unistd.h>
}

/*------------------------------------------------------------------------*/

// Signal handlers for printing statistics even if the prover is
// interrupted, and an alarm for the time limit of the stand alone prover.

namespace Refuter {

static volatile bool caught_signal = false;
static volatile bool caught_alarm = false;
static volatile bool alarm_set = false;
static double alarm_time = -1;
static Handler * signal_handler;

void Handler::catch_alarm () { catch_signal (SIGALRM); }

typedef void (*signal_function) (int);

struct Caught {
  int sig;
  const char * name;
  signal_function saved;        // previous handler restored in 'reset'
};

// Caught signals besides 'SIGALRM'.

#define SIGNALS \
SIGNAL(SIGABRT) \
SIGNAL(SIGBUS) \
SIGNAL(SIGINT) \
SIGNAL(SIGSEGV) \
SIGNAL(SIGTERM) \

static Caught caught[] = {
#define SIGNAL(SIG) \
  { SIG, # SIG, 0 },
  SIGNALS
#undef SIGNAL
};

static const size_t size_caught = sizeof caught / sizeof *caught;

static signal_function saved_alarm_handler;

void Signal::reset_alarm () {
  if (!alarm_set) return;
  (void) signal (SIGALRM, saved_alarm_handler);
  saved_alarm_handler = 0;
  caught_alarm = false;
  alarm_set = false;
  alarm_time = -1;
}

void Signal::reset () {
  signal_handler = 0;
  for (size_t i = 0; i < size_caught; i++) {
    (void) signal (caught[i].sig, caught[i].saved);
    caught[i].saved = 0;
  }
  reset_alarm ();
  caught_signal = false;
}

const char * Signal::name (int sig) {
  for (size_t i = 0; i < size_caught; i++)
    if (caught[i].sig == sig) return caught[i].name;
  if (sig == SIGALRM) return "SIGALRM";
  return "UNKNOWN";
}

// Printing statistics in the handler is not reentrant, which we accept for
// an interrupted prover which is going to terminate anyhow.

static void catch_signal (int sig) {
  if (sig == SIGALRM && absolute_real_time () >= alarm_time) {
    if (!caught_alarm) {
      caught_alarm = true;
      if (signal_handler) signal_handler->catch_alarm ();
    }
    Signal::reset_alarm ();
  } else {
    if (!caught_signal) {
      caught_signal = true;
      if (signal_handler) signal_handler->catch_signal (sig);
    }
    Signal::reset ();
    ::raise (sig);
  }
}

void Signal::set (Handler * h) {
  signal_handler = h;
  for (size_t i = 0; i < size_caught; i++)
    caught[i].saved = signal (caught[i].sig, catch_signal);
}

void Signal::alarm (int seconds) {
  assert (seconds >= 0);
  assert (!alarm_set);
  assert (alarm_time < 0);
  saved_alarm_handler = signal (SIGALRM, catch_signal);
  alarm_set = true;
  alarm_time = absolute_real_time () + seconds;
  ::alarm (seconds);
}

}
