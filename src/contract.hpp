#ifndef _contract_hpp_INCLUDED
#define _contract_hpp_INCLUDED

/*------------------------------------------------------------------------*/

// Violating a 'Prover' API contract ('refuter.hpp') aborts.

#define CONTRACT_VIOLATED(...) \
do { \
  fatal_message_start (); \
  fprintf (stderr, \
    "API contract of '%s' violated: ", __PRETTY_FUNCTION__); \
  fprintf (stderr, __VA_ARGS__); \
  fputc ('\n', stderr); \
  fflush (stderr); \
  abort (); \
} while (0)

/*------------------------------------------------------------------------*/


#define REQUIRE(COND,...) \
do { \
  if ((COND)) break; \
  CONTRACT_VIOLATED (__VA_ARGS__); \
} while (0)

#define REQUIRE_INITIALIZED() \
  REQUIRE (internal, "uninitialized prover")

#define REQUIRE_VALID_STATE() \
do { \
  REQUIRE_INITIALIZED (); \
  REQUIRE (this->state () & VALID, "prover in invalid state"); \
} while (0)

#define REQUIRE_READY_STATE() \
do { \
  REQUIRE_VALID_STATE (); \
  REQUIRE (state () & READY, "prover in invalid state"); \
} while (0)

#define REQUIRE_VALID_OR_PROVING_STATE() \
do { \
  REQUIRE_INITIALIZED (); \
  REQUIRE (this->state () & (VALID | PROVING), \
    "prover neither in valid nor proving state"); \
} while (0)

#define REQUIRE_NON_ZERO_STRING(STR) \
  REQUIRE ((STR), "argument '%s' is a zero string", # STR)

/*------------------------------------------------------------------------*/

#endif
