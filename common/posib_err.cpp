// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <stdlib.h>
#include <stdio.h>
#include <assert.h>

#include "posib_err.hpp"

#include "i18n.hpp"


namespace lcommon {

  // Expands the "%name:N" parameters of the message.  If one more
  // parameter than the error expects is given it is appended to the
  // end of the message.
  PosibErrBase & PosibErrBase::set(const ErrorInfo * inf,
				   ParmString p1, ParmString p2, 
				   ParmString p3)
  {
    const char * s0 = inf->mesg ? _(inf->mesg) : "";
    ParmString p[4] = {p1,p2,p3,0};
    unsigned int n = 0;
    while (n != 3 && p[n].str() != 0) 
      ++n;
    assert(n == inf->num_parms || n == inf->num_parms + 1);

    String mesg;
    const char * s;
    while (true) {
      s = s0 + strcspn(s0, "%");
      mesg.append(s0, s - s0);
      if (*s == '\0') break;
      const char * colon = strchr(s, ':');
      assert(colon != 0);
      unsigned int ip = colon[1] - '0' - 1;
      assert(ip < inf->num_parms);
      mesg += p[ip].c_str();
      s0 = colon + 2;
    }
    if (n == inf->num_parms + 1 && !p[inf->num_parms].empty()) {
      if (!mesg.empty()) mesg += ' ';
      mesg += p[inf->num_parms].c_str();
    }

    Error * e = new Error;
    e->err = inf;
    e->mesg = mesg;
    err_ = new ErrPtr(e);
    
    return *this;
  }

  PosibErrBase & PosibErrBase::with_file(ParmString fn, int line_num)
  {
    assert(err_ != 0);
    assert(err_->refcount == 1);
    Error * e = const_cast<Error *>(err_->err);
    String prefix = fn.c_str();
    if (line_num) {
      char buf[16];
      snprintf(buf, sizeof(buf), "%d", line_num);
      if (!prefix.empty()) prefix += ':';
      prefix += buf;
    }
    if (prefix.empty()) return *this;
    prefix += ": ";
    e->mesg.insert(0, prefix);
    return *this;
  }
  
#ifndef NDEBUG
  void PosibErrBase::handle_err() const {
    assert (err_);
    assert (!err_->handled);
    fputs(_("Unhandled Error: "), stderr);
    fputs(err_->err->mesg.c_str(), stderr);
    fputs("\n", stderr);
    abort();
  }
#endif

  void PosibErrBase::del() {
    if (!err_) return;
    delete err_->err;
    delete err_;
  }

}
