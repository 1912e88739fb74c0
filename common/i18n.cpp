// This file is part of Lexdist
// Copyright (C) 2026 by the Lexdist authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "lock.hpp"

#include "i18n.hpp"

#ifndef LOCALEDIR
#  define LOCALEDIR "/usr/local/share/locale"
#endif

static lcommon::Mutex lock;

static bool did_init = false;

void lexdist_gettext_init()
{
  lcommon::Lock l(&lock);
  if (did_init) return;
  bindtextdomain("lexdist", LOCALEDIR);
  did_init = true;
}
