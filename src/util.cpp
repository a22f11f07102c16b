#include "internal.hpp"

namespace Refuter {

/*------------------------------------------------------------------------*/

// Accepts 'true', 'false', '[-]<digits>' and '[-]<digits>e<digits>'
// (as in '1e3').  Values outside of the 'int' range saturate.

bool parse_int_str (const char * str, int & val)
{
  if (!strcmp (str, "true")) { val = 1; return true; }
  if (!strcmp (str, "false")) { val = 0; return true; }

  const char * p = str;
  const bool negative = (*p == '-');
  if (negative) p++;
  if (!isdigit (*p)) return false;

  const int64_t limit = (int64_t) INT_MAX + 1;
  int64_t res = 0;
  while (isdigit (*p))
    res = min (limit, 10 * res + (*p++ - '0'));

  if (*p == 'e') {
    if (!isdigit (*++p)) return false;
    int exponent = 0;
    while (isdigit (*p))
      exponent = min (10, 10 * exponent + (*p++ - '0'));
    while (exponent-- && res < limit)
      res = min (limit, 10 * res);
  }
  if (*p) return false;

  if (negative) val = (int) max ((int64_t) INT_MIN, -res);
  else val = (int) min ((int64_t) INT_MAX, res);
  return true;
}

/*------------------------------------------------------------------------*/

bool has_suffix (const char * str, const char * suffix) {
  size_t k = strlen (str), l = strlen (suffix);
  return k > l && !strcmp (str + k - l, suffix);
}

/*------------------------------------------------------------------------*/

bool is_color_option (const char * arg) {
  return !strcmp (arg, "--color") ||
         !strcmp (arg, "--colors") ||
         !strcmp (arg, "--color=1") ||
         !strcmp (arg, "--colors=1") ||
         !strcmp (arg, "--color=true") ||
         !strcmp (arg, "--colors=true");
}

bool is_no_color_option (const char * arg) {
  return !strcmp (arg, "--no-color") ||
         !strcmp (arg, "--no-colors") ||
         !strcmp (arg, "--color=0") ||
         !strcmp (arg, "--colors=0") ||
         !strcmp (arg, "--color=false") ||
         !strcmp (arg, "--colors=false");
}

}
