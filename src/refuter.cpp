#include "internal.hpp"
#include "signal.hpp"

/*------------------------------------------------------------------------*/

namespace Refuter {

// The stand alone prover.  Signals and the time limit are handled through
// static data in 'signal.cpp', so there is only one 'App' per process.
// Library users should use 'Prover' directly.

class App : public Handler, public Terminator {

  Prover * prover;

  // Command line.
  //
  const char * input_path;      // zero for '<stdin>'
  const char * trace_path;      // zero for '<stdout>'
  const char * example_name;    // '-e <example>'
  const char * time_limit_arg;  // '-t <sec>'
  bool input_specified;
  bool trace_specified;
  int time_limit;

  volatile bool timesup;        // set by 'catch_alarm'

  // Printing.
  //
  void print_usage (bool all = false);

#ifndef QUIET
  void signal_message (const char * msg, int sig);
#endif

  // Option handling.
  //
  bool set (const char*);
  bool set (const char*, int);
  int  get (const char*);
#ifdef QUIET
  bool verbose () { return false; }
#else
  bool verbose () { return get ("verbose") && !get ("quiet"); }
#endif

  /*----------------------------------------------------------------------*/

  void init ();
  void parse_arguments (int argc, char ** argv);
  void check_arguments ();
  void banner ();
  void start_tracing ();
  const char * read_seeds ();
  void report (int res);

  // Terminator interface.
  //
  bool terminate () { return timesup; }

  // Handler interface.
  //
  void catch_signal (int sig);
  void catch_alarm ();

public:

  App ();
  ~App ();

  // Parse the arguments and run the prover.
  //
  int main (int arg, char ** argv);
};

/*------------------------------------------------------------------------*/

void App::print_usage (bool all) {
  printf (
"usage: refuter [ <option> ... ] [ <input> [ <trace> ] ]\n"
"\n"
"where '<option>' is one of the following common options:\n"
"\n");

  if (!all) {      // Print only a short list of common options.
    printf (
"  -h             print this short list of common options\n"
"  --help         print complete list of all options\n"
"  --version      print version\n"
"\n"
"  -e <example>   prove built-in example (default 'socrates')\n"
#ifndef QUIET
"  -v             increase verbosity\n"
"  -q             be quiet\n"
#endif
"\n"
"  -t <sec>       set wall clock time limit\n"
    );
  } else {         // Print complete list of all options.
    printf (
"  -h             print alternatively only a list of common options\n"
"  --help         print this complete list of all options\n"
"  --version      print version\n"
"\n"
"  -e <example>   prove built-in example (default 'socrates')\n"
#ifndef QUIET
"  -v             increase verbosity (see also '--verbose' below)\n"
"  -q             be quiet (same as '--quiet')\n"
#endif
"  -t <sec>       set wall clock time limit\n"
#ifdef LOGGING
"  -l             enable logging messages (same as '--log')\n"
#endif
"\n"
"  --colors       force colored output\n"
"  --no-colors    disable colored output to terminal\n"
"  --no-trace     do not print resolution steps (same as '--trace=0')\n"
    );

    printf (
"\n"
"There are the following built-in examples:\n"
"\n");

    Prover::examples ();

    printf (
"\n"
"Or '<option>' is one of the following advanced internal options:\n"
"\n");
    Prover::usage ();

    fputs (
"\n"
"The internal options have their default value printed in brackets\n"
"after their description.  They can also be used in the form\n"
"'--<name>' which is equivalent to '--<name>=1' and in the form\n"
"'--no-<name>' which is equivalent to '--<name>=0'.  One can also\n"
"use 'true' instead of '1', 'false' instead of '0', as well as\n"
"numbers with positive exponent such as '1e3' instead of '1000'.\n"
"\n"
"Alternatively option values can also be specified in comments\n"
"before the first clause of the input, e.g., '% --rounds=10', or\n"
"through environment variables, such as 'REFUTER_ROUNDS=10'.  The\n"
"embedded options have highest priority, followed by command line\n"
"options and then values specified through environment variables.\n",
     stdout);
  }

  //------------------------------------------------------------------------
  // Common to both complete and common option usage.

  fputs (
"\n"
"The seed clauses are read from '<input>' in the clause format\n"
"\n"
"  % comment\n"
"  pred man/1.                  (optional arity declaration)\n"
"  ~man(X) | mortal(X).         (clause with variable 'X')\n"
"  man(socrates).\n"
"\n"
"where variables start with an upper case letter or '_'.  If '<input>'\n"
"is missing the built-in 'socrates' example is proved, while '-' reads\n"
"from '<stdin>'.  Resolution steps are written to '<trace>' if given\n"
"and otherwise to '<stdout>'.\n",
   stdout);

  //------------------------------------------------------------------------
  // More explanations for complete option usage.

  if (all) {
    fputs (
"\n"
"The prover saturates the clauses under binary resolution in rounds and\n"
"prints 's proved' with exit code '20' if the empty clause is derived,\n"
"'s not-proved' with exit code '10' if no new clause can be derived,\n"
"and 's unknown' with exit code '0' if a limit was hit.\n"
"\n"
"The input is assumed to be compressed if it is given explicitly\n"
"and has a '.gz', '.bz2' or '.xz' suffix.  The same applies to the\n"
"trace file.  In order to use compression and decompression the\n"
"corresponding utilities 'gzip', 'bzip2' and 'xz' are required.\n",
    stdout);
  }
}

/*------------------------------------------------------------------------*/

// Wrapper around option setting.

int App::get (const char * o) { return prover->get (o); }
bool App::set (const char * o, int v) { return prover->set (o, v); }
bool App::set (const char * arg) { return prover->set_long_option (arg); }

/*------------------------------------------------------------------------*/

// Errors in the app exit with status '1'.

#define APPERR(...) \
do { prover->error (__VA_ARGS__); } while (0)

/*------------------------------------------------------------------------*/

void App::parse_arguments (int argc, char ** argv) {
  for (int i = 1; i < argc; i++) {
    const char * arg = argv[i];
    if (!strcmp (arg, "-h") || !strcmp (arg, "--help") ||
        !strcmp (arg, "--version"))
      APPERR ("can only use '%s' as single first option", arg);
    else if (!strcmp (arg, "-e")) {
      if (++i == argc) APPERR ("argument to '-e' missing");
      else if (example_name)
        APPERR ("multiple examples '-e %s' and '-e %s'",
          example_name, argv[i]);
      else if (!Prover::is_valid_example (argv[i]))
        APPERR ("invalid example '%s' (try '--help')", argv[i]);
      else example_name = argv[i];
    } else if (!strcmp (arg, "-t")) {
      if (++i == argc) APPERR ("argument to '-t' missing");
      else if (time_limit_arg)
        APPERR ("multiple time limit '-t %s' and '-t %s'",
          time_limit_arg, argv[i]);
      else if (!parse_int_str (argv[i], time_limit) || time_limit < 0)
        APPERR ("invalid time limit in '-t %s'", argv[i]);
      else time_limit_arg = argv[i];
    } else if (is_color_option (arg)) {
      tout.force_colors ();
      terr.force_colors ();
    } else if (is_no_color_option (arg)) {
      tout.force_no_colors ();
      terr.force_no_colors ();
    }
#ifndef QUIET
    else if (!strcmp (arg, "-q")) set ("--quiet");
    else if (!strcmp (arg, "-v")) set ("verbose", get ("verbose") + 1);
#endif
#ifdef LOGGING
    else if (!strcmp (arg, "-l")) set ("--log");
#endif
    else if (arg[0] == '-' && arg[1]) {
      if (!set (arg)) APPERR ("invalid option '%s'", arg);
    } else if (trace_specified) APPERR ("too many arguments");
    else if (input_specified) {
      trace_specified = true;
      if (strcmp (arg, "-")) trace_path = arg;
    } else {
      input_specified = true;
      if (strcmp (arg, "-")) input_path = arg;
    }
  }
}

void App::check_arguments () {
  if (input_specified && example_name)
    APPERR ("can not combine input with example '-e %s'", example_name);
  if (input_path && !File::exists (input_path))
    APPERR ("input file '%s' does not exist", input_path);
  if (trace_path && !File::writable (trace_path))
    APPERR ("trace file '%s' not writable", trace_path);
  if (input_path && trace_path && !strcmp (input_path, trace_path))
    APPERR ("input file '%s' also specified as trace file", input_path);
  if (trace_specified && !get ("trace"))
    APPERR ("trace file '%s' specified but tracing disabled",
      trace_path ? trace_path : "<stdout>");
}

/*------------------------------------------------------------------------*/

void App::banner () {
#ifndef QUIET
  if (get ("quiet")) return;
  prover->section ("banner");
  prover->message ("%sRefuter Resolution Refutation Prover%s",
    tout.bright_magenta_code (), tout.normal_code ());
  prover->message ("%sVersion %s%s",
    tout.magenta_code (), Refuter::version (), tout.normal_code ());
  prover->message ("%sCompiled with '%s' on %s%s",
    tout.magenta_code (), compiler (), date (), tout.normal_code ());
#endif
}

void App::start_tracing () {
  if (verbose () || trace_specified) prover->section ("tracing");
  if (!get ("trace")) {
    prover->verbose (1, "will not write trace");
    return;
  }
  if (!trace_path) {
    prover->verbose (1, "writing trace to %s'<stdout>'%s",
      tout.green_code (), tout.normal_code ());
    prover->trace (stdout, "<stdout>");
  } else if (prover->trace (trace_path))
    prover->message ("writing trace to %s'%s'%s",
      tout.green_code (), trace_path, tout.normal_code ());
  else APPERR ("can not open and write trace to '%s'", trace_path);
}

const char * App::read_seeds () {
  prover->section ("parsing input");
  if (!input_specified) {
    if (!example_name) example_name = "socrates";
    prover->message ("using built-in example %s'%s'%s (%s)",
      tout.green_code (), example_name, tout.normal_code (),
      Examples::description (example_name));
    prover->message ("%s(use '-h' for a list of common options)%s",
      tout.magenta_code (), tout.normal_code ());
    return prover->example (example_name);
  }
  const char * name = input_path ? input_path : "<stdin>";
  prover->message ("reading clauses from %s'%s'%s",
    tout.green_code (), name, tout.normal_code ());
  if (input_path) return prover->read (input_path);
  return prover->read (stdin, name);
}

// The verdict goes to '<stdout>' even if 'quiet' is set.

void App::report (int res) {
  if (get ("trace")) {
    prover->flush_trace ();
    prover->close_trace ();
  }
  if (get ("store")) prover->store ();
  prover->section ("result");
  const char * verdict;
  switch (res) {
    case 20: verdict = "proved"; break;
    case 10: verdict = "not-proved"; break;
    default: verdict = "unknown"; break;
  }
  printf ("s %s\n", verdict);
  fflush (stdout);
  prover->statistics ();
  prover->resources ();
}

/*------------------------------------------------------------------------*/

int App::main (int argc, char ** argv) {

  if (argc == 2) {
    if (!strcmp (argv[1], "-h")) { print_usage (); return 0; }
    if (!strcmp (argv[1], "--help")) { print_usage (true); return 0; }
    if (!strcmp (argv[1], "--version")) {
      printf ("%s\n", Refuter::version ());
      return 0;
    }
  }

  init ();
  parse_arguments (argc, argv);
  check_arguments ();
  banner ();

  if (time_limit_arg) {
    prover->section ("limit");
    prover->message (
      "setting time limit to %d seconds real time (due to '-t %s')",
      time_limit, time_limit_arg);
    Signal::alarm (time_limit);
    prover->connect_terminator (this);
  }

  start_tracing ();

  const char * err = read_seeds ();
  if (err) APPERR ("%s", err);
  prover->message ("found %" PRId64 " seed clauses", prover->clauses ());

  prover->section ("options");
  prover->options ();

  prover->section ("proving");
  const int res = prover->prove ();
  report (res);

  prover->section ("shutting down");
  prover->message ("exit %d", res);
  if (time_limit_arg) Signal::reset_alarm ();

  return res;
}

/*------------------------------------------------------------------------*/

void App::init () {
  assert (!prover);
  input_path = trace_path = example_name = time_limit_arg = 0;
  input_specified = trace_specified = false;
  time_limit = -1;
  timesup = false;
  prover = new Prover ();
  Signal::set (this);
}

App::App () : prover (0) { }      // See 'init'.

App::~App () {
  if (!prover) return;
  Signal::reset ();
  delete prover;
}

/*------------------------------------------------------------------------*/

#ifndef QUIET

void App::signal_message (const char * msg, int sig) {
  prover->message (
    "%s%s %ssignal %d%s (%s)%s",
    tout.red_code (), msg,
    tout.bright_red_code (), sig,
    tout.red_code (), Signal::name (sig),
    tout.normal_code ());
}

#endif

void App::catch_signal (int sig) {
#ifndef QUIET
  if (!get ("quiet")) {
    prover->message ();
    signal_message ("caught", sig);
    prover->section ("result");
    prover->message ("unknown");
    prover->statistics ();
    prover->resources ();
    prover->message ();
    signal_message ("raising", sig);
  }
#else
  (void) sig;
#endif
}

// Wait for the prover to call 'App::terminate ()' before the next pair.

void App::catch_alarm () { timesup = true; }

} // end of 'namespace Refuter'

/*------------------------------------------------------------------------*/

// The actual app is allocated on the stack and then its 'main' function is
// called.  Both the signal handler connected to the app and the terminals
// have statically allocated components as well as the options table
// 'Options::table'.  All are shared among provers.

int main (int argc, char ** argv) {
  Refuter::App app;
  int res = app.main (argc, argv);
  return res;
}
