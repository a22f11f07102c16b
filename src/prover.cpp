#include "internal.hpp"

/*------------------------------------------------------------------------*/

namespace Refuter {

/*------------------------------------------------------------------------*/

// See corresponding header file 'refuter.hpp' (!) for more information.
//
// Again, to avoid confusion, note that, 'refuter.hpp' is the header file
// of this file 'prover.cpp', since we want to call the application and
// main file 'refuter.cpp', while at the same time using 'refuter.hpp' as
// the main header file of the library (and not 'prover.hpp').

/*------------------------------------------------------------------------*/

#define STATE(S) \
do { \
  assert (is_power_of_two (S)); \
  if (_state == S) break; \
  _state = S; \
  LOG ("API enters state %s", # S); \
} while (0)

static bool is_power_of_two (unsigned n) { return n && !(n & (n-1)); }

void Prover::transition_to_unknown_state () {
  if (state () == CONFIGURING)
    LOG ("API leaves state %s", "CONFIGURING");
  if (internal->status == 20) STATE (PROVED);
  else if (internal->status == 10) STATE (SATURATED);
  else STATE (UNKNOWN);
}

/*------------------------------------------------------------------------*/

Prover::Prover () {
  _state = INITIALIZING;
  internal = new Internal ();
  STATE (CONFIGURING);
}

Prover::~Prover () {
  REQUIRE_VALID_OR_PROVING_STATE ();
  STATE (DELETING);
  delete internal;
}

/*------------------------------------------------------------------------*/

const char * Prover::signature () {
  static const string res = string ("refuter-") + Refuter::version ();
  return res.c_str ();
}

const char * Prover::version () { return Refuter::version (); }

/*------------------------------------------------------------------------*/

bool Prover::is_valid_option (const char * name) {
  return Options::has (name);
}

bool Prover::is_valid_long_option (const char * arg) {
  string name;
  int tmp;
  return Options::parse_long_option (arg, name, tmp);
}

int Prover::get (const char * arg) {
  REQUIRE_VALID_OR_PROVING_STATE ();
  return internal->opts.get (arg);
}

bool Prover::set (const char * arg, int val) {
  REQUIRE_VALID_STATE ();
  REQUIRE (state () == CONFIGURING,
    "can only set option 'set (\"%s\", %d)' right after initialization",
    arg, val);
  return internal->opts.set (arg, val);
}

bool Prover::set_long_option (const char * arg) {
  REQUIRE_VALID_STATE ();
  REQUIRE (state () == CONFIGURING,
    "can only set option '%s' right after initialization", arg);
  bool res;
  if (arg[0] != '-' || arg[1] != '-') res = false;
  else {
    int val;
    string name;
    res = Options::parse_long_option (arg, name, val);
    if (res) set (name.c_str (), val);
  }
  return res;
}

void Prover::prefix (const char * str) {
  REQUIRE_VALID_OR_PROVING_STATE ();
  REQUIRE_NON_ZERO_STRING (str);
  internal->prefix = str;
}

/*------------------------------------------------------------------------*/

const char * Prover::declare (const char * predicate, int arity) {
  REQUIRE_READY_STATE ();
  REQUIRE_NON_ZERO_STRING (predicate);
  return internal->declare (predicate, arity);
}

const char * Prover::clause (const char * text) {
  REQUIRE_READY_STATE ();
  REQUIRE_NON_ZERO_STRING (text);
  vector<Literal> literals;
  Parser parser (this, text);
  const char * err = parser.parse_single_clause (literals);
  if (err) return err;
  internal->add_seed (literals);
  transition_to_unknown_state ();
  return 0;
}

const char * Prover::read (File * file) {
  REQUIRE_READY_STATE ();
  Parser * parser = new Parser (this, file);
  const char * err = parser->parse_clauses ();
  delete parser;
  if (internal->store.size () || internal->status)
    transition_to_unknown_state ();
  return err;
}

const char * Prover::read (FILE * external_file, const char * name) {
  REQUIRE_READY_STATE ();
  REQUIRE (external_file != 0, "zero file argument");
  REQUIRE_NON_ZERO_STRING (name);
  File * file = File::read (internal, external_file, name);
  assert (file);
  const char * err = read (file);
  delete file;
  return err;
}

const char * Prover::read (const char * path) {
  REQUIRE_READY_STATE ();
  REQUIRE_NON_ZERO_STRING (path);
  File * file = File::read (internal, path);
  if (!file)
    return internal->error_message.init (
             "failed to read clause file '%s'", path);
  const char * err = read (file);
  delete file;
  return err;
}

bool Prover::is_valid_example (const char * name) {
  return Examples::has (name);
}

const char * Prover::example (const char * name) {
  REQUIRE_READY_STATE ();
  REQUIRE_NON_ZERO_STRING (name);
  if (!Examples::has (name))
    return internal->error_message.init ("unknown example '%s'", name);
  return Examples::add (*this, name);
}

/*------------------------------------------------------------------------*/

int Prover::prove () {
  REQUIRE_READY_STATE ();
  transition_to_unknown_state ();
  STATE (PROVING);
  internal->terminated = false;
  const int res = internal->saturate ();
  internal->termination_forced = false;
  if (res == 20) STATE (PROVED);
  else if (res == 10) STATE (SATURATED);
  else STATE (UNKNOWN);
  return res;
}

int Prover::status () const {
  REQUIRE_VALID_OR_PROVING_STATE ();
  return internal->status;
}

int64_t Prover::clauses () const {
  REQUIRE_VALID_OR_PROVING_STATE ();
  return internal->store.size ();
}

bool Prover::derived (const char * text) {
  REQUIRE_VALID_OR_PROVING_STATE ();
  REQUIRE_NON_ZERO_STRING (text);
  vector<Literal> literals;
  Parser parser (this, text, true);
  const char * err = parser.parse_single_clause (literals);
  REQUIRE (!err, "invalid clause '%s': %s", text, err);
  if (parser.found_unknown_symbol ()) return false;
  return internal->derived (literals);
}

/*------------------------------------------------------------------------*/

void Prover::terminate () {
  REQUIRE_VALID_OR_PROVING_STATE ();
  internal->termination_forced = true;
}

void Prover::connect_terminator (Terminator * terminator) {
  REQUIRE_VALID_STATE ();
  REQUIRE (terminator, "can not connect zero terminator");
  if (internal->terminator)
    LOG ("connecting new terminator (disconnecting previous one)");
  else
    LOG ("connecting new terminator (no previous one)");
  internal->terminator = terminator;
}

void Prover::disconnect_terminator () {
  REQUIRE_VALID_STATE ();
  if (internal->terminator)
    LOG ("disconnecting previous terminator");
  else
    LOG ("ignoring to disconnect terminator (no previous one)");
  internal->terminator = 0;
}

/*------------------------------------------------------------------------*/

void Prover::connect_tracer (Tracer * tracer) {
  REQUIRE_VALID_STATE ();
  REQUIRE (tracer, "can not connect zero tracer");
  REQUIRE (state () == CONFIGURING,
    "can only start tracing right after initialization");
  internal->connect_tracer (tracer);
}

bool Prover::disconnect_tracer (Tracer * tracer) {
  REQUIRE_VALID_STATE ();
  REQUIRE (tracer, "can not disconnect zero tracer");
  return internal->disconnect_tracer (tracer);
}

bool Prover::trace (FILE * external_file, const char * name) {
  REQUIRE_VALID_STATE ();
  REQUIRE (external_file != 0, "zero file argument");
  REQUIRE_NON_ZERO_STRING (name);
  REQUIRE (state () == CONFIGURING,
    "can only start tracing right after initialization");
  File * file = File::write (internal, external_file, name);
  assert (file);
  internal->connect_text_tracer (file);
  return true;
}

bool Prover::trace (const char * path) {
  REQUIRE_VALID_STATE ();
  REQUIRE_NON_ZERO_STRING (path);
  REQUIRE (state () == CONFIGURING,
    "can only start tracing right after initialization");
  File * file = File::write (internal, path);
  if (!file) return false;
  internal->connect_text_tracer (file);
  return true;
}

void Prover::flush_trace () {
  REQUIRE_VALID_STATE ();
  internal->flush_trace ();
}

void Prover::close_trace () {
  REQUIRE_VALID_STATE ();
  internal->close_trace ();
}

/*------------------------------------------------------------------------*/

bool Prover::traverse_clauses (ClauseIterator & it) const {
  REQUIRE_VALID_STATE ();
  for (const auto & c : internal->store) {
    const string text = internal->text (c);
    if (!it.clause (c->id, text.c_str ())) return false;
  }
  return true;
}

/*------------------------------------------------------------------------*/

void Prover::usage () { Options::usage (); }

void Prover::examples () { Examples::usage (); }

void Prover::options () {
  REQUIRE_VALID_STATE ();
  internal->opts.print ();
}

void Prover::store () {
  REQUIRE_VALID_STATE ();
  internal->print_store ();
}

void Prover::statistics () {
  if (state () == DELETING) return;
  REQUIRE_VALID_OR_PROVING_STATE ();
  internal->print_statistics ();
}

void Prover::resources () {
  if (state () == DELETING) return;
  REQUIRE_VALID_OR_PROVING_STATE ();
  internal->print_resource_usage ();
}

/*------------------------------------------------------------------------*/

void Prover::section (const char * title) {
  if (state () == DELETING) return;
#ifdef QUIET
  (void) title;
#endif
  REQUIRE_INITIALIZED ();
  SECTION (title);
}

void Prover::message (const char * fmt, ...) {
  if (state () == DELETING) return;
#ifdef QUIET
  (void) fmt;
#else
  REQUIRE_INITIALIZED ();
  va_list ap;
  va_start (ap, fmt);
  internal->vmessage (fmt, ap);
  va_end (ap);
#endif
}

void Prover::message () {
  if (state () == DELETING) return;
  REQUIRE_INITIALIZED ();
#ifndef QUIET
  internal->message ();
#endif
}

void Prover::verbose (int level, const char * fmt, ...) {
  if (state () == DELETING) return;
  REQUIRE_VALID_OR_PROVING_STATE ();
#ifdef QUIET
  (void) level;
  (void) fmt;
#else
  va_list ap;
  va_start (ap, fmt);
  internal->vverbose (level, fmt, ap);
  va_end (ap);
#endif
}

void Prover::error (const char * fmt, ...) {
  if (state () == DELETING) return;
  REQUIRE_INITIALIZED ();
  va_list ap;
  va_start (ap, fmt);
  internal->verror (fmt, ap);
  va_end (ap);
}

}
