#ifndef __lexdist_asjp_reader_hh__
#define __lexdist_asjp_reader_hh__

#include "parm_string.hpp"
#include "posib_err.hpp"

namespace lcommon {
  class IStream;
}

namespace lexdist {

  using lcommon::IStream;
  using lcommon::ParmStr;
  using lcommon::PosibErr;

  class Registry;

  // Reads the ASJP database, a tab separated table.  The first line is
  // the header.  It must have an "iso" and a "names" column.  The
  // first ASJP_META_FIELDS columns hold data about the language, every
  // column after that holds the forms of one concept, separated by
  // ", ".  Empty concept fields are skipped.  Fields are used as is,
  // there is no quoting since '"' is a symbol of the ASJP code.
  //
  // Every record is added to reg, so if several records share an ISO
  // code the richest of them is kept.

  static const unsigned int ASJP_META_FIELDS = 10;

  struct AsjpReadStats {
    unsigned int rows;       // records read, not counting the header
    unsigned int duplicates; // records whose ISO code was already present
    AsjpReadStats() : rows(0), duplicates(0) {}
  };

  PosibErr<void> read_asjp(IStream & in, Registry & reg, 
                           ParmStr id = "", AsjpReadStats * stats = 0);

  PosibErr<void> read_asjp_file(ParmStr file, Registry & reg, 
                                AsjpReadStats * stats = 0);

}

#endif
