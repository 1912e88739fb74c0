#ifndef __lexdist_language_distance_hh__
#define __lexdist_language_distance_hh__

#include "forms.hpp"
#include "posib_err.hpp"
#include "weights.hpp"

namespace lexdist {

  class WordList;

  // Appends the concepts that have forms in both word lists to out,
  // in sorted order.
  void common_concepts(const WordList & wl1, const WordList & wl2,
                       Vector<String> & out);

  // The mean, over all concepts the two lists have in common, of
  // mean_concept_distance for that concept.  Concepts are visited in
  // sorted order so the result does not depend on how the lists were
  // built.
  //
  // If the lists have no concept in common the distance is undefined
  // and no_comparable_concepts is returned.
  PosibErr<double> mean_language_distance(const WordList & wl1, 
                                          const WordList & wl2,
                                          const PhoneticWeights & w 
                                          = PhoneticWeights());

}

#endif
