/* This file is part of Lexdist
 * Copyright (C) 2001-2002 by Kevin Atkinson under the GNU LGPL
 * license version 2.0 or 2.1.  You should have received a copy of the
 * LGPL license along with this library if you did not you can find it
 * at http://www.gnu.org/.                                              */

#ifndef LEXDIST_ERROR__HPP
#define LEXDIST_ERROR__HPP

#include "string.hpp"

namespace lcommon {

struct ErrorInfo;

struct Error {
  String mesg;
  const ErrorInfo * err;

  Error() : err(0) {}
  
  bool is_a(const ErrorInfo * e) const;
};

// ErrorInfo objects are static and form a tree through "isa".  The
// message may contain parameters of the form "%name:N" where N is
// the 1 based index of the parameter.
struct ErrorInfo {
  const ErrorInfo * isa;
  const char * mesg;
  unsigned int num_parms;
  const char * parms[3];
};


}

#endif /* LEXDIST_ERROR__HPP */
