#ifndef __lexdist_alphabet_hh__
#define __lexdist_alphabet_hh__

namespace lexdist {

  // SymbolInfo

  typedef unsigned int SymbolInfo;

  static const SymbolInfo VOWEL = (1 << 0);

  // the vowels of the ASJP code
  static const char ASJP_VOWELS[] = "3aeEiou";

  // Information about every symbol of a transcription alphabet.  Every
  // symbol is a single byte.
  class Alphabet {
    SymbolInfo symbol_info_[256];
  public:
    explicit Alphabet(const char * vowels);
    SymbolInfo symbol_info(char c) const {
      return symbol_info_[static_cast<unsigned char>(c)];
    }
    bool is_vowel(char c) const {return symbol_info(c) & VOWEL;}
  };

  const Alphabet & asjp_alphabet();

}

#endif
