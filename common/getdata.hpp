// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_GET_DATA__HPP
#define LEXDIST_GET_DATA__HPP

#include <stddef.h>

#include "string.hpp"
#include "parm_string.hpp"
#include "vector.hpp"

namespace lcommon {

  class IStream;

  struct DataPair {
    String key;
    String value;
    size_t line_num;
    DataPair() : line_num(0) {}
  };

  // Reads the next "key value" line skipping blank lines and
  // comments, which start with '#'.  A '#' preceded by a backslash
  // is kept.  Leading and trailing whitespace is removed from both
  // key and value.  d.line_num is incremented for every line read,
  // so it should be zero on the first call.  Returns false at the
  // end of the input.
  bool getdata_pair(IStream & in, DataPair & d);

  // Splits str on every occurrence of delim.  Empty fields are kept,
  // so "a\t\tb" split on "\t" gives three fields.  An empty str gives
  // a single empty field.
  void split(ParmStr str, ParmStr delim, Vector<String> & out);

  // Removes a trailing carriage return left by DOS line endings.
  void chomp_cr(String &);

  void to_lower(String &);

}
#endif
