// This file is part of Lexdist
// Copyright (C) 2026 by the Lexdist authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

// NOTE: This file should be the last file included to avoid problems
//       with system header files that might include libintl.h

#ifndef LEXDIST_I18N__HPP
#define LEXDIST_I18N__HPP

#include <libintl.h>

/* dgettext is used so that the right domain is looked at when the
   library is linked into another program */
#define _(String) dgettext ("lexdist", String)
#define N_(String) String

/* use gt_ when there is the possibility that str will be the empty
   string.  gettext in this case is not guaranteed to return an
   empty string */
static inline const char * gt_(const char * str) {
  return str[0] == '\0' ? str : _(str);
}

void lexdist_gettext_init();

#endif
