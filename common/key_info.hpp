// This file is part of Lexdist
// Copyright (C) 2026 by the Lexdist authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_KEY_INFO__HPP
#define LEXDIST_KEY_INFO__HPP

namespace lcommon {

  enum KeyInfoType {KeyInfoString, KeyInfoInt, KeyInfoBool, KeyInfoDouble};

  struct KeyInfo {
    const char * name;
    KeyInfoType  type;
    const char * def;   // default value, as text
    const char * desc;
    unsigned     flags;
  };

  static const unsigned KEYINFO_NON_NEGATIVE = 1 << 0;

}

#endif
