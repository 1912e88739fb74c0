#ifndef __lexdist_registry_hh__
#define __lexdist_registry_hh__

#include <map>

#include "word_list.hpp"

namespace lexdist {

  // Decides which of two word lists with the same identifier to keep:
  // the one with more concepts, or seen when both have as many.
  const WordList & richer(const WordList & seen, const WordList & incoming);

  // A collection of word lists keyed by their ISO code.
  //
  // The database may contain several entries with the same code, for
  // example different dialects.  Only the richest of them is kept, see
  // richer().

  class Registry {
  public:
    typedef std::map<String, WordList> Lists;
    typedef Lists::const_iterator const_iterator;

  private:
    Lists lists_;

  public:
    // Returns false if a list with the same code was already present,
    // in which case the richer of the two lists is kept.
    bool add(const WordList & wl);

    bool have(ParmStr iso) const;
    PosibErr<const WordList *> lookup(ParmStr iso) const;

    unsigned int size() const {return lists_.size();}
    bool empty() const {return lists_.empty();}

    // in sorted order of the ISO code
    const_iterator begin() const {return lists_.begin();}
    const_iterator end() const {return lists_.end();}
  };

}

#endif
