// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <stdio.h>
#include <string.h>
#include <assert.h>

#include "fstream.hpp"
#include "errors.hpp"

namespace lcommon {

  PosibErr<void> FStream::open(ParmStr name, const char * mode)
  {
    assert (file_ == 0);
    file_ = fopen(name.c_str(), mode);
    if (file_ == 0)
      return make_err(cant_read_file, name);
    else
      return no_err;
  }

  void FStream::close()
  {
    if (file_ != 0 && own_)
      fclose(file_);
    file_ = 0;
  }

  FStream & FStream::operator<< (ParmStr str)
  {
    fputs(str.c_str(), file_);
    return *this;
  }

  bool FStream::append_line(String & str, char d)
  {
    int c;
    c = getc(file_);
    if (c == EOF) return false;
    if (c == (int)d) return true;
    str += static_cast<char>(c);
    while (c = getc(file_), c != EOF && c != (int)d) 
      str += static_cast<char>(c);
    return true;
  }

  void FStream::write(char c)
  {
    putc(c, file_);
  }

  void FStream::write(ParmStr str) 
  {
    fputs(str.c_str(), file_);
  }

  void FStream::write(const void * str, unsigned int n)
  {
    fwrite(str,1,n,file_);
  }

  FStream & FStream::operator<< (unsigned int num)
  {
    fprintf(file_, "%u", num);
    return *this;
  }

  FStream & FStream::operator<< (int num)
  {
    fprintf(file_, "%i", num);
    return *this;
  }

}
