#include <stdio.h>
#include <string.h>

#include "errors.hpp"
#include "registry.hpp"
#include "word_list.hpp"

using namespace lcommon;
using namespace lexdist;

int fail = 0;

// a word list with n concepts named c0, c1, ...
static WordList make_list(const char * iso, const char * name, unsigned n)
{
  WordList::Concepts c;
  for (unsigned i = 0; i != n; ++i) {
    String concept = "c";
    concept += (char)('0' + i);
    c[concept].push_back("tan");
  }
  return WordList(iso, name, c);
}

static void expect_name(const Registry & reg, const char * iso, const char * name)
{
  PosibErr<const WordList *> wl = reg.lookup(iso);
  if (wl.has_err()) {
    fprintf(stderr, "fail: %s\n", wl.get_err()->mesg.c_str());
    fail = 1;
  } else if (strcmp(wl.data->name(), name) != 0) {
    fprintf(stderr, "fail: kept \"%s\" for %s, expected \"%s\"\n", 
            wl.data->name(), iso, name);
    fail = 1;
  }
}

void word_list_lookup() {
  WordList::Concepts c;
  c["stone"].push_back("tan");
  c["stone"].push_back("ston");
  c["water"].push_back("wat3r");
  WordList wl("aaa", "Aaa", c);
  if (wl.size() != 2 || !wl.have("stone") || wl.have("tree")) {
    fprintf(stderr, "fail: wrong concepts in word list\n");
    fail = 1;
  }
  PosibErr<const Forms *> f = wl.lookup("stone");
  if (f.has_err() || f.data->size() != 2 || (*f.data)[1] != "ston") {
    fprintf(stderr, "fail: wrong forms for \"stone\"\n");
    fail = 1;
    f.ignore_err();
  }
  PosibErr<const Forms *> missing = wl.lookup("tree");
  if (!missing.has_err(unknown_concept)) {
    fprintf(stderr, "fail: expected unknown_concept for \"tree\"\n");
    fail = 1;
    missing.ignore_err();
  } 
  PosibErr<const Forms *> missing2 = wl.lookup("tree");
  if (!missing2.has_err(not_found_error)) {
    fprintf(stderr, "fail: unknown_concept is not a not_found_error\n");
    fail = 1;
    missing2.ignore_err();
  }
}

void registry_lookup() {
  Registry reg;
  reg.add(make_list("aaa", "Aaa", 2));
  reg.add(make_list("bbb", "Bbb", 3));
  if (reg.size() != 2 || !reg.have("aaa") || reg.have("xxx")) {
    fprintf(stderr, "fail: wrong languages in registry\n");
    fail = 1;
  }
  expect_name(reg, "bbb", "Bbb");
  PosibErr<const WordList *> wl = reg.lookup("xxx");
  if (!wl.has_err(not_found_error)) {
    fprintf(stderr, "fail: expected not_found_error for \"xxx\"\n");
    fail = 1;
    wl.ignore_err();
  } else if (!wl.get_err()->is_a(unknown_language)) {
    fprintf(stderr, "fail: expected unknown_language for \"xxx\"\n");
    fail = 1;
  }
  // in sorted order
  Registry::const_iterator i = reg.begin();
  if (i == reg.end() || i->first != "aaa" 
      || ++i == reg.end() || i->first != "bbb" || ++i != reg.end()) 
  {
    fprintf(stderr, "fail: registry is not sorted\n");
    fail = 1;
  }
}

void richer_list() {
  WordList small = make_list("aaa", "Small", 2);
  WordList big = make_list("aaa", "Big", 5);
  WordList other = make_list("aaa", "Other", 2);
  if (&richer(small, big) != &big || &richer(big, small) != &big) {
    fprintf(stderr, "fail: richer does not pick the list with more concepts\n");
    fail = 1;
  }
  if (&richer(small, other) != &small) {
    fprintf(stderr, "fail: richer does not keep the first list on a tie\n");
    fail = 1;
  }
}

void deduplication() {
  Registry reg;
  bool first = reg.add(make_list("aaa", "Big", 5));
  bool second = reg.add(make_list("aaa", "Small", 2));
  if (!first || second) {
    fprintf(stderr, "fail: add does not report duplicates\n");
    fail = 1;
  }
  expect_name(reg, "aaa", "Big");

  // a later richer list replaces the earlier one
  reg.add(make_list("bbb", "Small", 2));
  reg.add(make_list("bbb", "Big", 5));
  expect_name(reg, "bbb", "Big");

  // on a tie the first one seen is kept
  reg.add(make_list("ccc", "First", 3));
  reg.add(make_list("ccc", "Second", 3));
  expect_name(reg, "ccc", "First");

  if (reg.size() != 3) {
    fprintf(stderr, "fail: duplicates were not merged\n");
    fail = 1;
  }
}

int main() {
  word_list_lookup();
  registry_lookup();
  richer_list();
  deduplication();
  if (fail)
    printf("not ok\n");
  else
    printf("ok\n");
  return fail;
}
