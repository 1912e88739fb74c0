#include "config.hpp"
#include "weights.hpp"

using namespace lcommon;

namespace lexdist {

  PosibErr<void> setup(PhoneticWeights & w, const Config * config)
  {
    RET_ON_ERR_SET(config->retrieve_double("vowel-weight"), double, vw);
    w = PhoneticWeights(vw);
    return no_err;
  }

}
