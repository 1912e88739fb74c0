// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_PARM_STRING__HPP
#define LEXDIST_PARM_STRING__HPP

#include <string.h>
#include <limits.h>

#include "string.hpp"

//
// ParmString is a string class meant to be used as a function
// parameter.  It accepts either a "const char *" or a "String" and
// converts back to a "const char *".  The size is computed lazily
// when it was not given.  Usage example:
//
// void foo(ParmString s1, ParmString s2) {
//   const char *  str0 = s1;
//   unsigned int size0 = s2.size();
//   if (s1 == s2 || s2 == "bar") {
//     ...
//   }
// }
//
// The string is expected to be null terminated, even if a size is
// given during construction.  A null pointer is allowed and is
// treated as an empty string by size() and empty().
//

namespace lcommon {

  template<typename Ret> class PosibErr;

  class ParmString {
  public:
    ParmString() : str_(0), size_(0) {}
    ParmString(const char * str, unsigned int sz = UINT_MAX) 
      : str_(str), size_(str ? sz : 0) {}
    ParmString(const String & s)
      : str_(s.c_str()), size_(s.size()) {}
    inline ParmString(const PosibErr<const char *> &);
    inline ParmString(const PosibErr<String> &);

    bool empty() const {
      return str_ == 0 || str_[0] == '\0';
    }
    unsigned int size() const {
      if (size_ != UINT_MAX) return size_;
      else return size_ = strlen(str_);
    }
    operator const char * () const {
      return str_;
    }
    const char * str () const {
      return str_;
    }
    // never null
    const char * c_str () const {
      return str_ ? str_ : "";
    }
  private:
    const char * str_;
    mutable unsigned int size_;
  };

  typedef const ParmString & ParmStr;

  static inline bool operator== (ParmStr s1, ParmStr s2)
  {
    if (s1.str() == 0 || s2.str() == 0)
      return s1.str() == s2.str();
    return strcmp(s1,s2) == 0;
  }
  static inline bool operator== (ParmStr s1, const char * s2)
  {
    if (s1.str() == 0 || s2 == 0)
      return s1.str() == s2;
    return strcmp(s1,s2) == 0;
  }
  static inline bool operator!= (ParmStr s1, ParmStr s2)
  {
    return !(s1 == s2);
  }
  static inline bool operator!= (ParmStr s1, const char * s2)
  {
    return !(s1 == s2);
  }

}

#endif
