// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_FSTREAM__HPP
#define LEXDIST_FSTREAM__HPP

#include <stdio.h>

#include "string.hpp"
#include "istream.hpp"
#include "ostream.hpp"
#include "posib_err.hpp"

// NOTE: See iostream.hpp for the standard streams (ie standard input,
//       output, error)

namespace lcommon {

  class FStream : public IStream, public OStream
  {
  private:
    FILE * file_;
    bool   own_;

    FStream(const FStream &);
    void operator=(const FStream &);

  public:
    FStream(char d = '\n') 
      : IStream(d), file_(0), own_(true) {}
    FStream(FILE * f, bool own = true) 
      : IStream('\n'), file_(f), own_(own) {}
    ~FStream() {close();}

    PosibErr<void> open(ParmStr, const char *);
    void close();
 
    int vprintf(const char * format, va_list ap)
    {
      return vfprintf(file_, format, ap);
    }

    // Will return false if there is no more data
    bool append_line(String &, char d);

    void write(ParmStr);
    void write(char c);
    void write(const void *, unsigned int i);

    FStream & operator<< (char c)
    {
      putc(c, file_);
      return *this;
    }

    FStream & operator<< (ParmStr);
    FStream & operator<< (unsigned int);
    FStream & operator<< (int);

  };
}

#endif
