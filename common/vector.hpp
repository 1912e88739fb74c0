// This file is part of Lexdist
// Copyright (C) 2001-2003 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_VECTOR__HPP
#define LEXDIST_VECTOR__HPP

#include <vector>

namespace lcommon
{
  template <typename T>
  class Vector : public std::vector<T>
  {
  public:

    Vector() {}
    Vector(unsigned int s) : std::vector<T>(s) {}

    void pop_front() {this->erase(this->begin());}
  };
}

#endif
