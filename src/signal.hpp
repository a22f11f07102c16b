#ifndef _signal_hpp_INCLUDED
#define _signal_hpp_INCLUDED

namespace Refuter {

// Helper class for handling signals in the stand alone prover.  Caught
// signals are forwarded to the registered handler and then re-raised.  An
// alarm goes to 'catch_alarm' which does not terminate the process.

class Handler {
public:
  Handler () { }
  virtual ~Handler () { }
  virtual void catch_signal (int sig) = 0;
  virtual void catch_alarm ();
};

class Signal {

public:

  static void set (Handler *);
  static void alarm (int seconds);
  static void reset ();
  static void reset_alarm ();

  static const char * name (int sig);
};

}

#endif
