// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_ASC_CTYPE__HPP
#define LEXDIST_ASC_CTYPE__HPP

// Locale independent versions of the ctype functions.  Only the
// ASCII range is considered.

namespace lcommon {

  static inline bool asc_isspace(int c) 
  {
    return c==' ' || c=='\n' || c=='\r' || c=='\t' || c=='\f' || c=='\v';
  }
  static inline bool asc_isupper(int c)
  {
    return 'A' <= c && c <= 'Z';
  }
  static inline int asc_tolower(int c)
  {
    return asc_isupper(c) ? c + 0x20 : c;
  }
  
}

#endif
