// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <string.h>

#include "getdata.hpp"
#include "istream.hpp"
#include "asc_ctype.hpp"

namespace lcommon {

  bool getdata_pair(IStream & in, DataPair & d)
  {
    String buf;
    const char * p;

    // get first non blank line and count all read ones
    do {
      if (!in.getline(buf)) return false;
      d.line_num++;
      p = buf.c_str();
      while (*p == ' ' || *p == '\t') ++p;
    } while (*p == '#' || *p == '\0' || *p == '\r');

    // get key
    const char * k = p;
    while (*p != '\0' && !asc_isspace(*p) && *p != '#') ++p;
    d.key.assign(k, p - k);
    d.value.clear();

    // skip any whitespace
    while (*p == ' ' || *p == '\t') ++p;
    if (*p == '\0' || *p == '#') return true;

    // get value, a '#' ends it unless escaped
    for (; *p != '\0'; ++p) {
      if (*p == '#' && (d.value.empty() || d.value[d.value.size() - 1] != '\\'))
        break;
      if (*p == '#')
        d.value[d.value.size() - 1] = '#';
      else
        d.value += *p;
    }

    // remove trailing white space
    String::size_type e = d.value.size();
    while (e > 0 && asc_isspace(d.value[e - 1])) --e;
    d.value.resize(e);

    return true;
  }

  void split(ParmStr str, ParmStr delim, Vector<String> & out)
  {
    const char * s = str.c_str();
    unsigned int dsize = delim.size();
    if (dsize == 0) {
      out.push_back(s);
      return;
    }
    const char * e;
    while ((e = strstr(s, delim.c_str())) != 0) {
      out.push_back(String(s, e - s));
      s = e + dsize;
    }
    out.push_back(s);
  }

  void chomp_cr(String & s)
  {
    if (!s.empty() && s[s.size() - 1] == '\r')
      s.resize(s.size() - 1);
  }

  void to_lower(String & s)
  {
    for (String::iterator i = s.begin(); i != s.end(); ++i)
      *i = asc_tolower(*i);
  }

}
