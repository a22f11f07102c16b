#ifndef _texttracer_hpp_INCLUDED
#define _texttracer_hpp_INCLUDED

namespace Refuter {

// Writes the derivation in a human readable form, one line per stored
// seed clause and per resolution step:
//
//   seed [1] ~man(X) | mortal(X)
//   ...
//   resolved [8] ~man(socrates) and [9] man(socrates) => [13] empty clause derived
//
// The verdict is printed by the application and not part of the trace.
// Clause texts are kept by identifier in order to print antecedents.

class TextTracer : public FileTracer {

  Internal * internal;
  File * file;

  vector<string> texts;         // indexed by clause identifier

#ifndef QUIET
  uint64_t seeds, derived;
#endif

  void store (uint64_t id, const char * text);

public:

  // own and delete 'file'
  TextTracer (Internal *, File * file);
  ~TextTracer ();

  void add_seed_clause (uint64_t, const char *) override;
  void add_derived_clause (uint64_t, const char *,
                           uint64_t, uint64_t) override;
  void conclude (int) override;

#ifndef QUIET
  void print_statistics () override;
#endif
  bool closed () override;
  void close () override;
  void flush () override;
};

}

#endif
