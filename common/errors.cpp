// This file is part of Lexdist
// Copyright (C) 2026 by the Lexdist authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "errors.hpp"
#include "i18n.hpp"

namespace lcommon {

static const ErrorInfo lexdist_err_obj = {
  0, // isa
  0, // mesg
  0, // num_parms
  {""} // parms
};
const ErrorInfo * const lexdist_err = &lexdist_err_obj;

//
// lookups
//

static const ErrorInfo not_found_error_obj = {
  lexdist_err, // isa
  0, // mesg
  0, // num_parms
  {""} // parms
};
const ErrorInfo * const not_found_error = &not_found_error_obj;

static const ErrorInfo unknown_language_obj = {
  not_found_error, // isa
  N_("There is no word list for the language \"%lang:1\"."), // mesg
  1, // num_parms
  {"lang"} // parms
};
const ErrorInfo * const unknown_language = &unknown_language_obj;

static const ErrorInfo unknown_concept_obj = {
  not_found_error, // isa
  N_("The word list for \"%lang:1\" has no forms for the concept \"%concept:2\"."), // mesg
  2, // num_parms
  {"lang", "concept"} // parms
};
const ErrorInfo * const unknown_concept = &unknown_concept_obj;

//
// comparison
//

static const ErrorInfo no_comparable_concepts_obj = {
  lexdist_err, // isa
  N_("The word lists for \"%lang:1\" and \"%lang:2\" have no concepts in common."), // mesg
  2, // num_parms
  {"lang", "lang"} // parms
};
const ErrorInfo * const no_comparable_concepts = &no_comparable_concepts_obj;

//
// files
//

static const ErrorInfo file_error_obj = {
  lexdist_err, // isa
  N_("%file:1:"), // mesg
  1, // num_parms
  {"file"} // parms
};
const ErrorInfo * const file_error = &file_error_obj;

static const ErrorInfo cant_read_file_obj = {
  file_error, // isa
  N_("The file \"%file:1\" can not be opened for reading."), // mesg
  1, // num_parms
  {"file"} // parms
};
const ErrorInfo * const cant_read_file = &cant_read_file_obj;

static const ErrorInfo bad_file_format_obj = {
  file_error, // isa
  N_("%what:1"), // mesg
  1, // num_parms
  {"what"} // parms
};
const ErrorInfo * const bad_file_format = &bad_file_format_obj;

//
// configuration
//

static const ErrorInfo config_error_obj = {
  lexdist_err, // isa
  0, // mesg
  0, // num_parms
  {""} // parms
};
const ErrorInfo * const config_error = &config_error_obj;

static const ErrorInfo unknown_key_obj = {
  config_error, // isa
  N_("The key \"%key:1\" is unknown."), // mesg
  1, // num_parms
  {"key"} // parms
};
const ErrorInfo * const unknown_key = &unknown_key_obj;

static const ErrorInfo key_not_string_obj = {
  config_error, // isa
  N_("The key \"%key:1\" is not a string."), // mesg
  1, // num_parms
  {"key"} // parms
};
const ErrorInfo * const key_not_string = &key_not_string_obj;

static const ErrorInfo key_not_int_obj = {
  config_error, // isa
  N_("The key \"%key:1\" is not an integer."), // mesg
  1, // num_parms
  {"key"} // parms
};
const ErrorInfo * const key_not_int = &key_not_int_obj;

static const ErrorInfo key_not_bool_obj = {
  config_error, // isa
  N_("The key \"%key:1\" is not a boolean."), // mesg
  1, // num_parms
  {"key"} // parms
};
const ErrorInfo * const key_not_bool = &key_not_bool_obj;

static const ErrorInfo key_not_double_obj = {
  config_error, // isa
  N_("The key \"%key:1\" is not a number."), // mesg
  1, // num_parms
  {"key"} // parms
};
const ErrorInfo * const key_not_double = &key_not_double_obj;

static const ErrorInfo bad_value_obj = {
  config_error, // isa
  N_("The value \"%value:2\" is not %accepted:3 for the key \"%key:1\"."), // mesg
  3, // num_parms
  {"key", "value", "accepted"} // parms
};
const ErrorInfo * const bad_value = &bad_value_obj;

}
