#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

// Limits are given as 'int' casts since '2e9' is a 'double' literal.

const Option Options::table[] = {
#define OPTION(N,V,L,H,D) \
  { #N, (int)(V), (int)(L), (int)(H), D, &Options::N },
  OPTIONS
#undef OPTION
};

const size_t Options::size = sizeof table / sizeof *table;

// The table is sorted (checked in the constructor).

const Option * Options::find (const char * name) {
  const Option * end = table + size;
  const Option * res = lower_bound (table, end, name,
    [] (const Option & o, const char * n) { return strcmp (o.name, n) < 0; });
  if (res == end || strcmp (res->name, name)) return 0;
  return res;
}

/*------------------------------------------------------------------------*/

bool Options::parse_long_option (const char * arg,
                                 string & name, int & val) {
  if (arg[0] != '-' || arg[1] != '-') return false;
  const char * p = arg + 2;
  const bool negated = !strncmp (p, "no-", 3);
  if (negated) p += 3;
  const char * eq = strchr (p, '=');
  if (!eq) {
    name = p;
    val = !negated;
    return has (name.c_str ());
  }
  if (negated) return false;
  name.assign (p, eq - p);
  return has (name.c_str ()) && parse_int_str (eq + 1, val);
}

/*------------------------------------------------------------------------*/

// An option 'rounds' is overwritten by 'REFUTER_ROUNDS' if set.

void Options::read_environment (const Option * o) {
  string key = "REFUTER_";
  for (const char * p = o->name; *p; p++)
    key += (char) toupper (*p);
  const char * str = getenv (key.c_str ());
  int val;
  if (!str || !parse_int_str (str, val)) return;
  this->*o->field = max (o->lo, min (o->hi, val));
}

Options::Options (Internal * s) : internal (s)
{
  const char * prev = "";
  for (const Option * o = table; o != table + size; o++) {
    if (o->def < o->lo || o->def > o->hi)
      FATAL ("default of '%s' out of range in 'options.hpp'", o->name);
    if (strcmp (prev, o->name) >= 0)
      FATAL ("'%s' ordered before '%s' in 'options.hpp'", prev, o->name);
    prev = o->name;
    this->*o->field = o->def;
  }
  for (const Option * o = table; o != table + size; o++)
    read_environment (o);
}

/*------------------------------------------------------------------------*/

void Options::set (const Option * o, int new_val) {
  int & val = this->*o->field;
  const int old_val = val;
  if (new_val < o->lo) {
    LOG ("bounding '%d' to lower limit '%d' for option '%s'",
      new_val, o->lo, o->name);
    new_val = o->lo;
  } else if (new_val > o->hi) {
    LOG ("bounding '%d' to upper limit '%d' for option '%s'",
      new_val, o->hi, o->name);
    new_val = o->hi;
  }
  val = new_val;
  LOG ("option '%s' set to '%d' (was '%d')", o->name, new_val, old_val);
}

bool Options::set (const char * name, int val) {
  const Option * o = find (name);
  if (!o) return false;
  set (o, val);
  return true;
}

int Options::get (const char * name) {
  const Option * o = find (name);
  return o ? this->*o->field : 0;
}

/*------------------------------------------------------------------------*/

// Only options different from their default unless 'verbose' is set.

void Options::print () {
#ifdef QUIET
  (void) internal;
#else
  unsigned different = 0;
  for (const Option * o = table; o != table + size; o++) {
    const int val = this->*o->field;
    const bool same = (val == o->def);
    if (!same) different++;
    else if (!verbose) continue;
    string arg = string ("--") + o->name + "=";
    string def;
    if (o->is_bool ()) {
      arg += val ? "true" : "false";
      def = o->def ? "true" : "false";
    } else {
      arg += std::to_string (val);
      def = std::to_string (o->def);
    }
    MSG ("  %s%-30s%s (%s default %s'%s'%s)",
      same ? "" : tout.bright_yellow_code (), arg.c_str (),
      same ? "" : tout.normal_code (),
      same ? "same as" : "different from",
      same ? tout.green_code () : tout.yellow_code (),
      def.c_str (), tout.normal_code ());
  }
  if (!different) MSG ("all options are set to their default value");
#endif
}

void Options::usage () {
  for (const Option * o = table; o != table + size; o++) {
    string arg = string ("--") + o->name + "=";
    if (o->is_bool ()) {
      arg += "bool";
      printf ("  %-26s %s [%s]\n",
        arg.c_str (), o->description, o->def ? "true" : "false");
    } else {
      arg += std::to_string (o->lo) + ".." + std::to_string (o->hi);
      printf ("  %-26s %s [%d]\n", arg.c_str (), o->description, o->def);
    }
  }
}

}
