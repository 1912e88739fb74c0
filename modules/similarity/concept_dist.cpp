#include "concept_dist.hpp"
#include "editdist.hpp"

namespace lexdist {

  double normalized_edit_distance(ParmString a, ParmString b,
                                  const PhoneticWeights & w)
  {
    unsigned int max_len = a.size() > b.size() ? a.size() : b.size();
    if (max_len == 0) return 0.0;
    return edit_distance(a, b, w) / max_len;
  }

  double mean_concept_distance(const Forms & forms1, const Forms & forms2,
                               const PhoneticWeights & w)
  {
    if (forms1.empty() || forms2.empty()) return 0.0;
    double sum = 0;
    for (Forms::const_iterator a = forms1.begin(); a != forms1.end(); ++a)
      for (Forms::const_iterator b = forms2.begin(); b != forms2.end(); ++b)
        sum += normalized_edit_distance(*a, *b, w);
    return sum / (forms1.size() * forms2.size());
  }

}
