#ifndef _parse_hpp_INCLUDED
#define _parse_hpp_INCLUDED

namespace Refuter {

// Parses the clause format described in 'refuter.hpp' from a file or from
// a string (for 'Prover::clause' and 'Prover::derived').

class File;
struct Internal;

class Parser {

  Prover * prover;
  Internal * internal;
  File * file;                  // either read from this file
  const char * str;             // or from this string
  int lines;                    // line number for strings

  int ch;                       // current character

  bool query;                   // do not add symbols (for 'derived')
  bool unknown;                 // found unknown symbol in query mode
  bool header;                  // before first clause (embedded options)

  vector<string> variables;     // clause local variable names

  const char * name () const;
  int lineno () const;

  int parse_char ();
  void next () { ch = parse_char (); }

  void skip_comment ();
  void skip_white_space ();
  const char * parse_identifier (string &, const char * what);
  const char * parse_arity (int &);
  const char * parse_declaration ();
  const char * parse_term (Term &);
  const char * parse_literal (const string &, bool, vector<Literal> &);
  const char * parse_clause (vector<Literal> &, bool & declaration);
  const char * parse_one_clause (vector<Literal> &);

public:

  Parser (Prover * p, File * f);
  Parser (Prover * p, const char * text, bool query = false);

  // Parse all clauses and declarations and add the clauses as seeds.
  // Return zero if successful. Otherwise the parse error.
  //
  const char * parse_clauses ();

  // Parse exactly one clause without adding it.  In query mode unknown
  // symbols are not added and instead 'unknown' is set.
  //
  const char * parse_single_clause (vector<Literal> &);

  bool found_unknown_symbol () const { return unknown; }
};

}

#endif
