#include "asjp_reader.hpp"
#include "errors.hpp"
#include "fstream.hpp"
#include "getdata.hpp"
#include "registry.hpp"

#include "i18n.hpp"

using namespace lcommon;

namespace lexdist {

  static const char FIELD_SEP[] = "\t";
  static const char FORM_SEP[]  = ", ";

  static unsigned int find_column(const Vector<String> & header, const char * name)
  {
    unsigned int i = 0;
    while (i != header.size() && header[i] != name) ++i;
    return i;
  }

  PosibErr<void> read_asjp(IStream & in, Registry & reg, 
                           ParmStr id, AsjpReadStats * stats)
  {
    String line;
    unsigned int line_num = 0;

    //
    // header
    //

    do {
      if (!in.getline(line))
        return make_err(bad_file_format, _("The header line is missing."))
          .with_file(id);
      ++line_num;
      chomp_cr(line);
    } while (line.empty());

    Vector<String> header;
    split(line, FIELD_SEP, header);

    unsigned int iso_col  = find_column(header, "iso");
    unsigned int name_col = find_column(header, "names");
    if (iso_col == header.size())
      return make_err(bad_file_format, _("The header has no \"iso\" column."))
        .with_file(id, line_num);
    if (name_col == header.size())
      return make_err(bad_file_format, _("The header has no \"names\" column."))
        .with_file(id, line_num);
    if (header.size() <= ASJP_META_FIELDS)
      return make_err(bad_file_format, _("The header has no concept columns."))
        .with_file(id, line_num);

    //
    // records
    //

    Vector<String> fields;
    while (in.getline(line)) {
      ++line_num;
      chomp_cr(line);
      if (line.empty()) continue;

      fields.clear();
      split(line, FIELD_SEP, fields);

      // missing trailing fields are empty, extra fields are ignored
      WordList::Concepts concepts;
      for (unsigned int c = ASJP_META_FIELDS; 
           c < header.size() && c < fields.size(); ++c) 
      {
        if (fields[c].empty()) continue;
        Forms forms;
        split(fields[c], FORM_SEP, forms);
        concepts[header[c]] = forms;
      }

      String iso  = iso_col  < fields.size() ? fields[iso_col]  : String();
      String name = name_col < fields.size() ? fields[name_col] : String();

      bool added = reg.add(WordList(iso, name, concepts));
      if (stats) {
        ++stats->rows;
        if (!added) ++stats->duplicates;
      }
    }
    return no_err;
  }

  PosibErr<void> read_asjp_file(ParmStr file, Registry & reg, 
                                AsjpReadStats * stats)
  {
    FStream in;
    RET_ON_ERR(in.open(file, "r"));
    return read_asjp(in, reg, file, stats);
  }

}
