#ifndef __lexdist_weights_hh__
#define __lexdist_weights_hh__

#include "posib_err.hpp"

namespace lcommon {
  class Config;
}

namespace lexdist {

  using lcommon::PosibErr;
  using lcommon::Config;

  struct PhoneticWeights {
    double del1;      // the cost of deleting a symbol in the first string
    double del2;      // the cost of inserting a symbol or deleting a
                      // symbol in the second string
    double sub;       // the cost of replacing one symbol with another
    double vowel_sub; // the cost of replacing a vowel with a different
                      // vowel
    PhoneticWeights()
      : del1(1), del2(1), sub(1), vowel_sub(1) {}
    explicit PhoneticWeights(double vowel_weight)
      : del1(1), del2(1), sub(1), vowel_sub(vowel_weight) {}
  };

  // Takes the vowel weight from the "vowel-weight" key.
  PosibErr<void> setup(PhoneticWeights & w, const Config * config);
  
}

#endif
