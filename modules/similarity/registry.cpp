#include "registry.hpp"
#include "errors.hpp"

using namespace lcommon;

namespace lexdist {

  const WordList & richer(const WordList & seen, const WordList & incoming)
  {
    return incoming.size() > seen.size() ? incoming : seen;
  }

  bool Registry::add(const WordList & wl)
  {
    std::pair<Lists::iterator, bool> res 
      = lists_.insert(Lists::value_type(wl.iso(), wl));
    if (res.second) return true;
    WordList & seen = res.first->second;
    if (&richer(seen, wl) != &seen)
      seen = wl;
    return false;
  }

  bool Registry::have(ParmStr iso) const
  {
    return lists_.find(iso.c_str()) != lists_.end();
  }

  PosibErr<const WordList *> Registry::lookup(ParmStr iso) const
  {
    const_iterator i = lists_.find(iso.c_str());
    if (i == lists_.end())
      return make_err(unknown_language, iso);
    return &i->second;
  }

}
