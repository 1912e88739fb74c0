#ifndef __lexdist_edit_distance_hh__
#define __lexdist_edit_distance_hh__

#include "parm_string.hpp"
#include "weights.hpp"

namespace lexdist {

  using lcommon::ParmString;

  // edit_distance finds the cheapest way to turn a into b.  The cost is
  //   (cost of deletion)(# of deletions) 
  //   + (cost of insertion)(# of insertions) 
  //   + (cost of substitution)(# of substitutions)
  // where replacing a symbol with itself is free and replacing an
  // ASJP vowel with a different ASJP vowel costs w.vowel_sub instead
  // of w.sub.

  // A null a or b is the same as an empty string.  The result is
  // symmetric in a and b as long as w.del1 == w.del2.

  // the running time and space are tightly asymptotically bounded by
  // strlen(a)*strlen(b)

  double edit_distance(ParmString a, ParmString b,
                       const PhoneticWeights & w = PhoneticWeights());

  double edit_distance(ParmString a, ParmString b, double vowel_weight);
}

#endif
