// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_STRING__HPP
#define LEXDIST_STRING__HPP

#include <string>

namespace lcommon {

  // Transcriptions are plain bytes, one symbol per byte, so the
  // standard string is all that is needed.
  typedef std::string String;

}

#endif
