#ifndef __lexdist_forms_hh__
#define __lexdist_forms_hh__

#include "string.hpp"
#include "vector.hpp"

namespace lexdist {

  using lcommon::String;
  using lcommon::Vector;

  // The word forms of one concept in one language, in the order they
  // are listed in the database.
  typedef Vector<String> Forms;

}

#endif
