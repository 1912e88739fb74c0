#include <math.h>
#include <stdio.h>

#include "language_dist.hpp"
#include "word_list.hpp"

using namespace lcommon;
using namespace lexdist;

int fail = 0;

static Forms forms(const char * a, const char * b = 0)
{
  Forms f;
  f.push_back(a);
  if (b) f.push_back(b);
  return f;
}

static void check(const char * what, PosibErr<double> d, double expected)
{
  if (d.has_err()) {
    fprintf(stderr, "fail: %s: %s\n", what, d.get_err()->mesg.c_str());
    fail = 1;
  } else if (fabs(d.data - expected) > 1e-9) {
    fprintf(stderr, "fail: %s = %g, expected %g\n", what, d.data, expected);
    fail = 1;
  }
}

void single_concept() {
  WordList::Concepts c1, c2;
  c1["stone"] = forms("tan");
  c2["stone"] = forms("ston");
  WordList l1("l1", "Language One", c1);
  WordList l2("l2", "Language Two", c2);
  check("l1 vs l2", mean_language_distance(l1, l2), 0.5);
  check("l2 vs l1", mean_language_distance(l2, l1), 0.5);
  check("l1 vs l1", mean_language_distance(l1, l1), 0);
}

void no_common_concepts() {
  WordList::Concepts c1, c2;
  c1["stone"] = forms("tan");
  c2["water"] = forms("wat3r");
  WordList l1("l1", "Language One", c1);
  WordList l2("l2", "Language Two", c2);
  PosibErr<double> d = mean_language_distance(l1, l2);
  if (!d.has_err(no_comparable_concepts)) {
    fprintf(stderr, "fail: expected no_comparable_concepts for disjoint lists\n");
    fail = 1;
    d.ignore_err();
  }
  WordList empty("emp", "Empty", WordList::Concepts());
  PosibErr<double> e = mean_language_distance(empty, empty);
  if (!e.has_err(no_comparable_concepts)) {
    fprintf(stderr, "fail: expected no_comparable_concepts for empty lists\n");
    fail = 1;
    e.ignore_err();
  }
}

void several_concepts() {
  WordList::Concepts c1, c2;
  c1["stone"] = forms("tan");           // 0.5
  c1["water"] = forms("wat3r");         // 0
  c1["fish"]  = forms("pEs", "fiS");    // not in l2
  c1["name"]  = forms("ab");            // 1/2 for (ab, a), 0 for (ab, ab)
  c2["stone"] = forms("ston");
  c2["water"] = forms("wat3r");
  c2["name"]  = forms("a", "ab");
  c2["tree"]  = forms("tri");           // not in l1
  WordList l1("l1", "Language One", c1);
  WordList l2("l2", "Language Two", c2);
  check("mean over shared concepts", 
        mean_language_distance(l1, l2), (0.5 + 0 + 0.25)/3);

  Vector<String> common;
  common_concepts(l1, l2, common);
  if (common.size() != 3 || common[0] != "name" 
      || common[1] != "stone" || common[2] != "water") 
  {
    fprintf(stderr, "fail: wrong common concepts\n");
    fail = 1;
  }
}

void weights() {
  WordList::Concepts c1, c2;
  c1["stone"] = forms("tan");
  c2["stone"] = forms("ston");
  WordList l1("l1", "Language One", c1);
  WordList l2("l2", "Language Two", c2);
  check("l1 vs l2 with vowel weight 0.5", 
        mean_language_distance(l1, l2, PhoneticWeights(0.5)), 1.5/4);
}

void empty_forms_dropped() {
  WordList::Concepts c1, c2;
  c1["stone"] = forms("tan");
  c1["water"] = Forms();
  c2["water"] = forms("wat3r");
  WordList l1("l1", "Language One", c1);
  WordList l2("l2", "Language Two", c2);
  if (l1.size() != 1 || l1.have("water")) {
    fprintf(stderr, "fail: a concept without forms was kept\n");
    fail = 1;
  }
  PosibErr<double> d = mean_language_distance(l1, l2);
  if (!d.has_err(no_comparable_concepts)) {
    fprintf(stderr, "fail: a concept without forms was compared\n");
    fail = 1;
    d.ignore_err();
  }
}

int main() {
  single_concept();
  no_common_concepts();
  several_concepts();
  weights();
  empty_forms_dropped();
  if (fail)
    printf("not ok\n");
  else
    printf("ok\n");
  return fail;
}
