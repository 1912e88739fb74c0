// This file is part of Lexdist
// Copyright (C) 2026 by the Lexdist authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_ERRORS__HPP
#define LEXDIST_ERRORS__HPP

#include "error.hpp"

namespace lcommon {

  extern const ErrorInfo * const lexdist_err;

  extern const ErrorInfo * const not_found_error;
  extern const ErrorInfo * const unknown_language;
  extern const ErrorInfo * const unknown_concept;

  extern const ErrorInfo * const no_comparable_concepts;

  extern const ErrorInfo * const file_error;
  extern const ErrorInfo * const cant_read_file;
  extern const ErrorInfo * const bad_file_format;

  extern const ErrorInfo * const config_error;
  extern const ErrorInfo * const unknown_key;
  extern const ErrorInfo * const key_not_string;
  extern const ErrorInfo * const key_not_int;
  extern const ErrorInfo * const key_not_bool;
  extern const ErrorInfo * const key_not_double;
  extern const ErrorInfo * const bad_value;

}

#endif
