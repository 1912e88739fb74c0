#ifndef __lexdist_word_list_hh__
#define __lexdist_word_list_hh__

#include <map>

#include "forms.hpp"
#include "parm_string.hpp"
#include "posib_err.hpp"

namespace lexdist {

  using lcommon::ParmStr;
  using lcommon::PosibErr;

  // The word list of a single language.
  //
  // Maps concept identifiers (e.g. "stone") to the non-empty list of
  // forms for that concept.  A concept with no forms is never present.
  // The list can not be changed once it is constructed.

  class WordList {
  public:
    typedef std::map<String, Forms> Concepts;
    typedef Concepts::const_iterator const_iterator;

  private:
    String   iso_;
    String   name_;
    Concepts concepts_;

  public:
    WordList() {}
    // Concepts with an empty list of forms are dropped.
    WordList(ParmStr iso, ParmStr name, const Concepts & concepts);

    // the ISO 639-3 code, used as the key in a Registry
    const char * iso() const {return iso_.c_str();}
    // the name of the language, for display only
    const char * name() const {return name_.c_str();}

    // the number of concepts
    unsigned int size() const {return concepts_.size();}
    bool empty() const {return concepts_.empty();}

    bool have(ParmStr concept) const;
    PosibErr<const Forms *> lookup(ParmStr concept) const;

    // in sorted order of the concept identifier
    const_iterator begin() const {return concepts_.begin();}
    const_iterator end() const {return concepts_.end();}
  };

}

#endif
