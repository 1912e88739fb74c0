#include <string.h>

#include "alphabet.hpp"

namespace lexdist {

  Alphabet::Alphabet(const char * vowels)
  {
    memset(symbol_info_, 0, sizeof(symbol_info_));
    for (const char * v = vowels; *v; ++v)
      symbol_info_[static_cast<unsigned char>(*v)] |= VOWEL;
  }

  const Alphabet & asjp_alphabet()
  {
    static const Alphabet alphabet(ASJP_VOWELS);
    return alphabet;
  }

}
