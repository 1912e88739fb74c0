#include <stdio.h>
#include <string.h>

#include "asjp_reader.hpp"
#include "errors.hpp"
#include "istream.hpp"
#include "registry.hpp"
#include "word_list.hpp"

using namespace lcommon;
using namespace lexdist;

int fail = 0;

#define META "names\twls_fam\twls_gen\te\thh\tlat\tlon\tpop\twcode\tiso"
#define META_ROW(name, iso) name "\tFam\tGen\t\t\t0\t0\t100\t1\t" iso

static const char table[] =
  META "\tI\tyou\tstone\n"
  META_ROW("ENGLISH", "eng") "\tEy\tyu\tston\n"
  META_ROW("GERMAN", "deu") "\tiC\tdu, zi\tStain\n"
  // a dialect with fewer concepts, the first record is kept
  META_ROW("ENGLISH_SCOTS", "eng") "\tEy\t\t\n"
  "\n"
  // a short record, missing fields are empty
  META_ROW("SHORT", "sho") "\tmi\r\n";

static const WordList * get(const Registry & reg, const char * iso)
{
  PosibErr<const WordList *> wl = reg.lookup(iso);
  if (wl.has_err()) {
    fprintf(stderr, "fail: %s\n", wl.get_err()->mesg.c_str());
    fail = 1;
    return 0;
  }
  return wl.data;
}

static void expect_forms(const WordList * wl, const char * concept, 
                         const char * f1, const char * f2 = 0)
{
  if (!wl) return;
  PosibErr<const Forms *> f = wl->lookup(concept);
  if (f.has_err()) {
    fprintf(stderr, "fail: %s\n", f.get_err()->mesg.c_str());
    fail = 1;
    return;
  }
  const Forms & forms = *f.data;
  if (forms.size() != (f2 ? 2u : 1u) || forms[0] != f1 || (f2 && forms[1] != f2)) {
    fprintf(stderr, "fail: wrong forms for %s in %s\n", concept, wl->iso());
    fail = 1;
  }
}

void read_table() {
  Registry reg;
  AsjpReadStats stats;
  StringIStream in(table);
  PosibErr<void> pe = read_asjp(in, reg, "table", &stats);
  if (pe.has_err()) {
    fprintf(stderr, "fail: %s\n", pe.get_err()->mesg.c_str());
    fail = 1;
    return;
  }
  if (stats.rows != 4 || stats.duplicates != 1) {
    fprintf(stderr, "fail: read %u rows with %u duplicates\n", 
            stats.rows, stats.duplicates);
    fail = 1;
  }
  if (reg.size() != 3) {
    fprintf(stderr, "fail: %u languages in registry\n", reg.size());
    fail = 1;
  }

  const WordList * eng = get(reg, "eng");
  if (eng && (strcmp(eng->name(), "ENGLISH") != 0 || eng->size() != 3)) {
    fprintf(stderr, "fail: the richer English list was not kept\n");
    fail = 1;
  }
  expect_forms(eng, "stone", "ston");

  const WordList * deu = get(reg, "deu");
  expect_forms(deu, "you", "du", "zi");
  expect_forms(deu, "I", "iC");

  const WordList * sho = get(reg, "sho");
  if (sho && (sho->size() != 1 || sho->have("you"))) {
    fprintf(stderr, "fail: a short record has the wrong concepts\n");
    fail = 1;
  }
  // the trailing \r is not part of the form
  expect_forms(sho, "I", "mi");
}

void symbols_are_literal() {
  static const char t[] = 
    META "\tstone\n"
    META_ROW("QUOTED", "quo") "\t\"ston, t~an*\n";
  Registry reg;
  StringIStream in(t);
  PosibErr<void> pe = read_asjp(in, reg);
  if (pe.has_err()) {
    fprintf(stderr, "fail: %s\n", pe.get_err()->mesg.c_str());
    fail = 1;
    return;
  }
  expect_forms(get(reg, "quo"), "stone", "\"ston", "t~an*");
}

static void expect_bad_format(const char * what, const char * t, const char * prefix)
{
  Registry reg;
  StringIStream in(t);
  PosibErr<void> pe = read_asjp(in, reg, "table");
  if (!pe.has_err(bad_file_format)) {
    fprintf(stderr, "fail: %s: expected bad_file_format\n", what);
    fail = 1;
    pe.ignore_err();
    return;
  }
  const char * mesg = pe.get_err()->mesg.c_str();
  if (strncmp(mesg, prefix, strlen(prefix)) != 0) {
    fprintf(stderr, "fail: %s: unexpected message \"%s\"\n", what, mesg);
    fail = 1;
  }
}

void bad_headers() {
  expect_bad_format("empty table", "", "table:");
  expect_bad_format("blank lines only", "\n\n", "table:");
  expect_bad_format("no iso column", 
                    "names\ta\tb\tc\td\te\tf\tg\th\tj\tstone\n", "table:1:");
  expect_bad_format("no names column", 
                    "\n" "iso\ta\tb\tc\td\te\tf\tg\th\tj\tstone\n", "table:2:");
  expect_bad_format("no concept columns", META "\n", "table:1:");
}

void missing_file() {
  Registry reg;
  PosibErr<void> pe = read_asjp_file("/nonexistent/asjp.tab", reg);
  if (!pe.has_err(cant_read_file)) {
    fprintf(stderr, "fail: expected cant_read_file\n");
    fail = 1;
    pe.ignore_err();
  }
}

int main() {
  read_table();
  symbols_are_literal();
  bad_headers();
  missing_file();
  if (fail)
    printf("not ok\n");
  else
    printf("ok\n");
  return fail;
}
