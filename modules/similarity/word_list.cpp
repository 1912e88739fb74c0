#include "word_list.hpp"
#include "errors.hpp"

using namespace lcommon;

namespace lexdist {

  WordList::WordList(ParmStr iso, ParmStr name, const Concepts & concepts)
    : iso_(iso.c_str()), name_(name.c_str())
  {
    for (const_iterator i = concepts.begin(); i != concepts.end(); ++i) {
      if (!i->second.empty())
        concepts_.insert(*i);
    }
  }

  bool WordList::have(ParmStr concept) const
  {
    return concepts_.find(concept.c_str()) != concepts_.end();
  }

  PosibErr<const Forms *> WordList::lookup(ParmStr concept) const
  {
    const_iterator i = concepts_.find(concept.c_str());
    if (i == concepts_.end())
      return make_err(unknown_concept, iso_, concept);
    return &i->second;
  }

}
