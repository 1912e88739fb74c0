// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_OSTREAM__HPP
#define LEXDIST_OSTREAM__HPP

#include <stdarg.h>

#include "parm_string.hpp"

namespace lcommon {

  class OStream {
  public:
    virtual void write (char c) = 0;
    virtual void write (ParmStr) = 0;
    virtual void write (const void *, unsigned int) = 0;

    virtual int vprintf(const char *format, va_list ap) = 0;

#ifdef __GNUC__
    __attribute__ ((format (printf,2,3)))
#endif
      int printf(const char * format, ...)
    {
      va_list ap;
      va_start(ap, format);
      int res = vprintf(format, ap);
      va_end(ap);
      return res;
    }

    void put (char c) {write(c);}
    void put (ParmStr str) {write(str);}

    virtual void printl(ParmStr l) 
    {
      write(l);
      write('\n');
    }

    OStream & operator << (char c) {
      write(c);
      return *this;
    }

    OStream & operator << (ParmStr in) {
      write(in);
      return *this;
    }

    virtual ~OStream() {}
  };

  // Collects everything written into a string.
  class StringOStream : public OStream {
    String str_;
  public:
    void write (char c) {str_ += c;}
    void write (ParmStr s) {str_.append(s.c_str(), s.size());}
    void write (const void * d, unsigned int sz) {str_.append(static_cast<const char *>(d), sz);}
    int vprintf(const char * format, va_list ap);
    const String & str() const {return str_;}
  };
  
}

#endif
