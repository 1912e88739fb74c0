// This file is part of Lexdist
// Copyright (C) 2026 by the Lexdist authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <stdio.h>

#include "istream.hpp"
#include "ostream.hpp"

namespace lcommon {

  bool StringIStream::append_line(String & str, char d)
  {
    if (in_str[0] == '\0') return false;
    const char * end = in_str;
    while (*end != d && *end != '\0') ++end;
    str.append(in_str, end - in_str);
    in_str = end;
    if (*in_str == d) ++in_str;
    return true;
  }

  int StringOStream::vprintf(const char * format, va_list ap)
  {
    va_list ap2;
    va_copy(ap2, ap);
    int res = vsnprintf(0, 0, format, ap2);
    va_end(ap2);
    if (res <= 0) return res;
    String::size_type pos = str_.size();
    str_.resize(pos + res + 1);
    vsnprintf(&str_[pos], res + 1, format, ap);
    str_.resize(pos + res);
    return res;
  }

}
