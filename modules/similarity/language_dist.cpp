#include "concept_dist.hpp"
#include "errors.hpp"
#include "language_dist.hpp"
#include "word_list.hpp"

using namespace lcommon;

namespace lexdist {

  void common_concepts(const WordList & wl1, const WordList & wl2,
                       Vector<String> & out)
  {
    // both lists are sorted so a single merge pass is enough
    WordList::const_iterator i = wl1.begin();
    WordList::const_iterator j = wl2.begin();
    while (i != wl1.end() && j != wl2.end()) {
      if (i->first < j->first) {
        ++i;
      } else if (j->first < i->first) {
        ++j;
      } else {
        out.push_back(i->first);
        ++i;
        ++j;
      }
    }
  }

  PosibErr<double> mean_language_distance(const WordList & wl1, 
                                          const WordList & wl2,
                                          const PhoneticWeights & w)
  {
    Vector<String> common;
    common_concepts(wl1, wl2, common);
    if (common.empty())
      return make_err(no_comparable_concepts, wl1.iso(), wl2.iso());

    double sum = 0;
    for (Vector<String>::const_iterator c = common.begin(); 
         c != common.end(); ++c) 
    {
      RET_ON_ERR_SET(wl1.lookup(*c), const Forms *, forms1);
      RET_ON_ERR_SET(wl2.lookup(*c), const Forms *, forms2);
      sum += mean_concept_distance(*forms1, *forms2, w);
    }
    return sum / common.size();
  }

}
