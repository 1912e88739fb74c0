// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_ISTREAM__HPP
#define LEXDIST_ISTREAM__HPP

#include "string.hpp"
#include "parm_string.hpp"

namespace lcommon {

  class IStream {
  private:
    char delem;
  public:
    IStream(char d = '\n') : delem(d) {}
    
    char delim() const {return delem;}

    // append_line will read until c and will return false if there
    // is no more data
    virtual bool append_line(String &, char c) = 0;
    bool append_line(String & str) {return append_line(str, delem);}
    bool getline(String & str, char c) {str.clear(); return append_line(str, c);}
    bool getline(String & str) {str.clear(); return append_line(str, delem);}

    virtual ~IStream() {}
  };

  // Reads from an in memory string.  The string is not copied.
  class StringIStream : public IStream {
    const char * in_str;
  public:
    StringIStream(ParmStr s, char d = '\n')
      : IStream(d), in_str(s.c_str()) {}
    bool append_line(String & str, char c);
  };
  
}

#endif
