#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

// The classical syllogism 'all men are mortal, Socrates is a man (since he
// is Greek), thus Socrates is mortal' in clausal form.  The last clause is
// the negated goal.  The philosopher clauses can not contribute to the
// refutation but are resolved anyhow.

static const char * socrates_clauses[] = {
  "~man(X) | mortal(X).",
  "~greek(X) | man(X).",
  "~philosopher(X) | thinker(X).",
  "greek(socrates).",
  "philosopher(socrates).",
  "~mortal(socrates).",
};

// Same knowledge base without negated goal, which saturates.

static const char * nogoal_clauses[] = {
  "~man(X) | mortal(X).",
  "~greek(X) | man(X).",
  "~philosopher(X) | thinker(X).",
  "greek(socrates).",
  "philosopher(socrates).",
};

/*------------------------------------------------------------------------*/

#define EXAMPLES \
 \
EXAMPLE(nogoal,"Socrates knowledge base without negated goal") \
EXAMPLE(socrates,"Socrates is mortal (default)") \

/*------------------------------------------------------------------------*/

bool Examples::has (const char * name) {
#define EXAMPLE(N,D) \
  if (!strcmp (name, #N)) return true;
  EXAMPLES
#undef EXAMPLE
  return false;
}

const char * Examples::add (Prover & prover, const char * name) {
#define EXAMPLE(N,D) \
  do { \
    if (strcmp (name, #N)) break; \
    const char ** BEGIN = N ## _clauses; \
    const char ** END = BEGIN + sizeof N ## _clauses / sizeof (char *); \
    for (const char ** P = BEGIN; P != END; P++) { \
      const char * err = prover.clause (*P); \
      if (err) return err; \
    } \
    return 0; \
  } while (0);
  EXAMPLES
#undef EXAMPLE
  return "unknown example";
}

const char * Examples::description (const char * name) {
#define EXAMPLE(N,D) \
  if (!strcmp (name, #N)) return D;
  EXAMPLES
#undef EXAMPLE
  return 0;
}

void Examples::usage () {
#define EXAMPLE(N,D) \
  printf ("  %-26s " D "\n", "-e " #N);
  EXAMPLES
#undef EXAMPLE
}

}
