#include "internal.hpp"

/*------------------------------------------------------------------------*/

namespace Refuter {

/*------------------------------------------------------------------------*/

// Parse error.

#define PER(...) \
do { \
  internal->error_message.init (\
    "%s:%d: parse error: ", \
    name (), lineno ()); \
  return internal->error_message.append (__VA_ARGS__); \
} while (0)

/*------------------------------------------------------------------------*/

Parser::Parser (Prover * p, File * f) :
  prover (p), internal (p->internal), file (f), str (0), lines (1),
  ch (0), query (false), unknown (false), header (true)
{ }

Parser::Parser (Prover * p, const char * text, bool q) :
  prover (p), internal (p->internal), file (0), str (text), lines (1),
  ch (0), query (q), unknown (false), header (false)
{ }

const char * Parser::name () const {
  return file ? file->name () : "<clause>";
}

int Parser::lineno () const {
  return file ? (int) file->lineno () : lines;
}

/*------------------------------------------------------------------------*/

// Parsing utilities.

inline int Parser::parse_char () {
  if (file) return file->get ();
  if (!*str) return EOF;
  const int res = (unsigned char) *str++;
  if (res == '\n') lines++;
  return res;
}

// Comments before the first clause might contain embedded options, e.g.,
//
//   % --rounds=10
//
// which are set as long as the prover is still configurable.

void Parser::skip_comment () {
  assert (ch == '%');
  string buf;
  while ((ch = parse_char ()) != '\n' && ch != EOF)
    if (ch != '\r') buf.push_back (ch);
  if (!header) return;
  while (!buf.empty () && isspace ((unsigned char) buf.back ()))
    buf.pop_back ();
  const char * o = buf.c_str ();
  while (*o == ' ' || *o == '\t') o++;
  if (o[0] != '-' || o[1] != '-') return;
  PHASE ("parse", "found option '%s'", o);
  if (!Prover::is_valid_long_option (o))
    WARNING ("%s:%d: ignoring invalid embedded option '%s'",
      name (), lineno (), o);
  else if (prover->state () != CONFIGURING)
    WARNING ("%s:%d: ignoring embedded option '%s' (not configuring)",
      name (), lineno (), o);
  else prover->set_long_option (o);
}

void Parser::skip_white_space () {
  for (;;)
    if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r') next ();
    else if (ch == '%') skip_comment ();
    else break;
}

const char * Parser::parse_identifier (string & res, const char * what) {
  if (!is_identifier_char (ch)) {
    if (ch == EOF) PER ("unexpected end-of-file (expected %s)", what);
    if (isprint (ch)) PER ("unexpected character '%c' (expected %s)",
      (char) ch, what);
    PER ("unexpected character code %d (expected %s)", ch, what);
  }
  res.clear ();
  do res.push_back (ch), next (); while (is_identifier_char (ch));
  return 0;
}

const char * Parser::parse_arity (int & res) {
  assert (isdigit (ch));
  res = ch - '0';
  for (next (); isdigit (ch); next ()) {
    int digit = ch - '0';
    if (INT_MAX/10 < res || INT_MAX - digit < 10*res)
      PER ("arity too large");
    res = 10*res + digit;
  }
  return 0;
}

/*------------------------------------------------------------------------*/

// Declarations 'pred <name>/<arity>.' where 'pred' has been parsed.

const char * Parser::parse_declaration () {
  if (!file) PER ("declarations only allowed in files");
  string predicate;
  const char * err = parse_identifier (predicate, "predicate name");
  if (err) return err;
  if (is_variable_name (predicate.c_str ()))
    PER ("expected predicate name but got variable '%s'",
      predicate.c_str ());
  skip_white_space ();
  if (ch != '/') PER ("expected '/' after 'pred %s'", predicate.c_str ());
  next ();
  skip_white_space ();
  if (!isdigit (ch))
    PER ("expected arity after 'pred %s/'", predicate.c_str ());
  int arity;
  err = parse_arity (arity);
  if (err) return err;
  skip_white_space ();
  if (ch != '.')
    PER ("expected '.' after 'pred %s/%d'", predicate.c_str (), arity);
  err = internal->declare (predicate.c_str (), arity);
  if (err) {
    const string msg = err;
    PER ("%s", msg.c_str ());
  }
  next ();
  return 0;
}

/*------------------------------------------------------------------------*/

// Variables are local to a clause and numbered in the order of their
// first occurrence.

const char * Parser::parse_term (Term & res) {
  string id;
  const char * err = parse_identifier (id, "argument");
  if (err) return err;
  if (is_variable_name (id.c_str ())) {
    size_t idx = 0;
    while (idx < variables.size () && variables[idx] != id) idx++;
    if (idx == variables.size ()) variables.push_back (id);
    res = variable_term ((int) idx);
  } else if (query) {
    res = internal->signature.find_constant (id);
    if (!res) {
      LOG ("unknown constant '%s'", id.c_str ());
      unknown = true;
    }
  } else res = internal->signature.constant (id);
  return 0;
}

const char * Parser::parse_literal (const string & predicate,
                                    bool negative,
                                    vector<Literal> & literals) {
  if (is_variable_name (predicate.c_str ()))
    PER ("expected predicate but got variable '%s'", predicate.c_str ());

  Literal lit (0, negative);
  if (ch == '(') {
    next ();
    for (;;) {
      skip_white_space ();
      Term arg;
      const char * err = parse_term (arg);
      if (err) return err;
      lit.args.push_back (arg);
      skip_white_space ();
      if (ch == ')') break;
      if (ch != ',')
        PER ("expected ',' or ')' after argument %d of '%s'",
          lit.arity (), predicate.c_str ());
      next ();
    }
    next ();
  }

  // Here we check that each predicate is used with exactly one arity.

  const int arity = lit.arity ();
  int p = internal->signature.find_predicate (predicate);
  if (p) {
    const int expected = internal->signature.arity (p);
    if (expected != arity)
      PER ("predicate '%s' of arity %d used with %d arguments",
        predicate.c_str (), expected, arity);
  } else if (query) {
    LOG ("unknown predicate '%s'", predicate.c_str ());
    unknown = true;
  } else if (internal->opts.declare) {
    PER ("undeclared predicate '%s'", predicate.c_str ());
  } else {
    p = internal->signature.predicate (predicate, arity);
    LOG ("implicitly declared predicate '%s' of arity %d",
      predicate.c_str (), arity);
  }

  lit.predicate = p;
  literals.push_back (lit);
  return 0;
}

/*------------------------------------------------------------------------*/

// Parse a clause, the empty clause '[]' or a declaration.  The final '.'
// can be omitted at the end of the input.

const char * Parser::parse_clause (vector<Literal> & literals,
                                   bool & declaration) {
  assert (literals.empty ());
  variables.clear ();
  declaration = false;

  if (ch == '[') {
    next ();
    skip_white_space ();
    if (ch != ']') PER ("expected ']' after '['");
    next ();
    skip_white_space ();
    if (ch == '.') next ();
    else if (ch != EOF) PER ("expected '.' after '[]'");
    return 0;
  }

  for (;;) {
    bool negative = false;
    if (ch == '~' || ch == '-') {
      negative = true;
      next ();
      skip_white_space ();
    }
    string predicate;
    const char * err = parse_identifier (predicate, "literal");
    if (err) return err;
    if (!negative && literals.empty () && predicate == "pred" &&
        (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r')) {
      skip_white_space ();
      if (is_identifier_char (ch)) {
        declaration = true;
        return parse_declaration ();
      }
    }
    err = parse_literal (predicate, negative, literals);
    if (err) return err;
    skip_white_space ();
    if (ch == '.') { next (); break; }
    if (ch == EOF) break;
    if (ch != '|')
      PER ("expected '|' or '.' after literal '%s'", predicate.c_str ());
    next ();
    skip_white_space ();
  }

  return 0;
}

/*------------------------------------------------------------------------*/

const char * Parser::parse_clauses () {

#ifndef QUIET
  const double start = internal->process_time ();
#endif

  int64_t clauses = 0, declarations = 0;
  vector<Literal> literals;

  next ();
  for (;;) {
    skip_white_space ();
    if (ch == EOF) break;
    header = false;
    bool declaration;
    const Signature::Mark mark = internal->signature.mark ();
    const char * err = parse_clause (literals, declaration);
    if (err) {
      internal->signature.backtrack (mark);
      return err;
    }
    if (declaration) declarations++;
    else {
      clauses++;
      internal->add_seed (literals);
    }
  }

  VERBOSE (1,
    "parsed %" PRId64 " clauses and %" PRId64 " declarations "
    "in %.2f seconds", clauses, declarations,
    internal->process_time () - start);

  return 0;
}

const char * Parser::parse_one_clause (vector<Literal> & literals) {
  next ();
  skip_white_space ();
  if (ch == EOF) PER ("expected clause");
  bool declaration;
  const char * err = parse_clause (literals, declaration);
  if (err) return err;
  assert (!declaration);
  skip_white_space ();
  if (ch != EOF) PER ("unexpected text after clause");
  return 0;
}

// Symbols of a rejected clause are removed again.

const char * Parser::parse_single_clause (vector<Literal> & literals) {
  const Signature::Mark mark = internal->signature.mark ();
  const char * err = parse_one_clause (literals);
  if (err) {
    internal->signature.backtrack (mark);
    literals.clear ();
  }
  return err;
}

}
