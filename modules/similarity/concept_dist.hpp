#ifndef __lexdist_concept_distance_hh__
#define __lexdist_concept_distance_hh__

#include "forms.hpp"
#include "parm_string.hpp"
#include "weights.hpp"

namespace lexdist {

  using lcommon::ParmString;

  // The edit distance divided by the length of the longer string
  // (NLD).  Two empty strings have a distance of 0.
  double normalized_edit_distance(ParmString a, ParmString b,
                                  const PhoneticWeights & w = PhoneticWeights());

  // The mean NLD over every pair in forms1 x forms2.  Usually each
  // concept has exactly one form per language, in which case this is
  // just the NLD of the two forms.  Returns 0 if either list is empty.
  double mean_concept_distance(const Forms & forms1, const Forms & forms2,
                               const PhoneticWeights & w = PhoneticWeights());

}

#endif
