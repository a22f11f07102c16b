#ifndef _util_hpp_INCLUDED
#define _util_hpp_INCLUDED

#include <cassert>
#include <cstdint>
#include <vector>

namespace Refuter {

using namespace std;

// Common simple utility functions independent from 'Internal'.

/*------------------------------------------------------------------------*/

inline double relative (double a, double b) { return b ? a / b : 0; }
inline double percent (double a, double b) { return relative (100 * a, b); }

/*------------------------------------------------------------------------*/

bool parse_int_str (const char * str, int &);
bool has_suffix (const char * str, const char * suffix);

bool is_color_option (const char * arg);
bool is_no_color_option (const char * arg);

/*------------------------------------------------------------------------*/

// Characters of the clause file syntax.

inline bool is_identifier_char (int ch) {
  return ('a' <= ch && ch <= 'z') || ('A' <= ch && ch <= 'Z') ||
         ('0' <= ch && ch <= '9') || ch == '_';
}

inline bool is_variable_name (const char * name) {
  return ('A' <= *name && *name <= 'Z') || *name == '_';
}

/*------------------------------------------------------------------------*/

// Hashing of clause shapes (see 'store.cpp').

inline uint64_t hash_mix (uint64_t hash, uint64_t value) {
  hash ^= value + 0x9e3779b97f4a7c15ull + (hash << 6) + (hash >> 2);
  return hash;
}

}

#endif
