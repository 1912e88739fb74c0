// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_IOSTREAM__HPP
#define LEXDIST_IOSTREAM__HPP

#include "fstream.hpp"

namespace lcommon {

  // These streams are based on stdout and stderr respectfully.  So it
  // is safe to mix them with the standard C functions.

  extern FStream COUT;
  extern FStream CERR;
}

#endif
