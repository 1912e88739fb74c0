#include <math.h>
#include <stdio.h>
#include <string.h>

#include "config.hpp"
#include "errors.hpp"
#include "ostream.hpp"
#include "stack_ptr.hpp"
#include "weights.hpp"

using namespace lcommon;
using namespace lexdist;

int fail = 0;

#define EXPECT_OK(command) \
  do{PosibErrBase pe(command);\
  if(pe.has_err()){fprintf(stderr, "fail: %s\n", pe.get_err()->mesg.c_str()); fail = 1;}\
  } while(false)

#define EXPECT_ERR(command, error) \
  do{PosibErrBase pe(command);\
  if(!pe.has_err(error)){fprintf(stderr, "fail: line %d: expected " #error "\n", __LINE__); fail = 1; pe.ignore_err();}\
  } while(false)

void defaults() {
  StackPtr<Config> config(new_config());
  PosibErr<String> file = config->retrieve("data-file");
  if (file.has_err() || file.data != "asjp.tab") {
    fprintf(stderr, "fail: wrong default for data-file\n");
    fail = 1;
    file.ignore_err();
  }
  PosibErr<double> w = config->retrieve_double("vowel-weight");
  if (w.has_err() || w.data != 1.0) {
    fprintf(stderr, "fail: wrong default for vowel-weight\n");
    fail = 1;
    w.ignore_err();
  }
  PosibErr<int> p = config->retrieve_int("precision");
  if (p.has_err() || p.data != 4) {
    fprintf(stderr, "fail: wrong default for precision\n");
    fail = 1;
    p.ignore_err();
  }
  PosibErr<bool> v = config->retrieve_bool("verbose");
  if (v.has_err() || v.data) {
    fprintf(stderr, "fail: wrong default for verbose\n");
    fail = 1;
    v.ignore_err();
  }
  if (config->have("data-file")) {
    fprintf(stderr, "fail: data-file was not set but have() is true\n");
    fail = 1;
  }
}

void replace() {
  StackPtr<Config> config(new_config());
  EXPECT_OK(config->replace("vowel-weight", "0.5"));
  EXPECT_OK(config->replace("data-file", "other.tab"));
  PosibErr<double> w = config->retrieve_double("vowel-weight");
  if (w.has_err() || w.data != 0.5) {
    fprintf(stderr, "fail: vowel-weight was not replaced\n");
    fail = 1;
    w.ignore_err();
  }
  PosibErr<String> any = config->retrieve_any("vowel-weight");
  if (any.has_err() || any.data != "0.5") {
    fprintf(stderr, "fail: retrieve_any does not give the text of vowel-weight\n");
    fail = 1;
    any.ignore_err();
  }
  EXPECT_OK(config->remove("vowel-weight"));
  PosibErr<double> w2 = config->retrieve_double("vowel-weight");
  if (w2.has_err() || w2.data != 1.0) {
    fprintf(stderr, "fail: vowel-weight was not reset\n");
    fail = 1;
    w2.ignore_err();
  }
}

void bad_values() {
  StackPtr<Config> config(new_config());
  EXPECT_ERR(config->replace("vowel-weight", "-0.5"), bad_value);
  EXPECT_ERR(config->replace("vowel-weight", "heavy"), bad_value);
  EXPECT_ERR(config->replace("vowel-weight", "0.5x"), bad_value);
  EXPECT_ERR(config->replace("precision", "-1"), bad_value);
  EXPECT_ERR(config->replace("precision", "1.5"), bad_value);
  EXPECT_ERR(config->replace("verbose", "yes"), bad_value);
  EXPECT_ERR(config->replace("no-such-key", "1"), unknown_key);
  EXPECT_ERR(config->replace("vowel-weight", "-1"), config_error);
  // a rejected value leaves the old one
  PosibErr<double> w = config->retrieve_double("vowel-weight");
  if (w.has_err() || w.data != 1.0) {
    fprintf(stderr, "fail: a rejected value was stored\n");
    fail = 1;
    w.ignore_err();
  }
}

void wrong_types() {
  StackPtr<Config> config(new_config());
  EXPECT_ERR(config->retrieve("vowel-weight"), key_not_string);
  EXPECT_ERR(config->retrieve_int("data-file"), key_not_int);
  EXPECT_ERR(config->retrieve_bool("precision"), key_not_bool);
  EXPECT_ERR(config->retrieve_double("verbose"), key_not_double);
  EXPECT_ERR(config->retrieve("no-such-key"), unknown_key);
}

void prefixes() {
  StackPtr<Config> config(new_config());
  EXPECT_OK(config->replace("enable-verbose", ""));
  PosibErr<bool> v = config->retrieve_bool("verbose");
  if (v.has_err() || !v.data) {
    fprintf(stderr, "fail: enable-verbose did not set verbose\n");
    fail = 1;
    v.ignore_err();
  }
  EXPECT_OK(config->replace("dont-verbose", ""));
  PosibErr<bool> v2 = config->retrieve_bool("verbose");
  if (v2.has_err() || v2.data) {
    fprintf(stderr, "fail: dont-verbose did not clear verbose\n");
    fail = 1;
    v2.ignore_err();
  }
  EXPECT_OK(config->replace("verbose", ""));
  PosibErr<bool> v3 = config->retrieve_bool("verbose");
  if (v3.has_err() || !v3.data) {
    fprintf(stderr, "fail: an empty value did not set verbose\n");
    fail = 1;
    v3.ignore_err();
  }
  EXPECT_ERR(config->replace("dont-precision", ""), key_not_bool);
}

void read_in() {
  StackPtr<Config> config(new_config());
  EXPECT_OK(config->read_in_string(
              "# lexdist settings\n"
              "\n"
              "data-file  /data/asjp.tab  # the database\n"
              "Vowel-Weight 0.25\n"
              "verbose\n"));
  PosibErr<String> file = config->retrieve("data-file");
  if (file.has_err() || file.data != "/data/asjp.tab") {
    fprintf(stderr, "fail: data-file was not read\n");
    fail = 1;
    file.ignore_err();
  }
  PosibErr<double> w = config->retrieve_double("vowel-weight");
  if (w.has_err() || w.data != 0.25) {
    fprintf(stderr, "fail: vowel-weight was not read\n");
    fail = 1;
    w.ignore_err();
  }

  PosibErr<void> pe = config->read_in_string("precision 2\nvowel-weight -3\n", "conf");
  if (!pe.has_err(bad_value)) {
    fprintf(stderr, "fail: expected bad_value from the configuration string\n");
    fail = 1;
    pe.ignore_err();
  } else if (strncmp(pe.get_err()->mesg.c_str(), "conf:2: ", 8) != 0) {
    fprintf(stderr, "fail: file and line missing from \"%s\"\n", 
            pe.get_err()->mesg.c_str());
    fail = 1;
  }
}

void write_out() {
  StackPtr<Config> config(new_config());
  EXPECT_OK(config->replace("precision", "2"));
  StringOStream out;
  config->write_to_stream(out);
  if (strstr(out.str().c_str(), "\nprecision 2\n") == 0 
      || strstr(out.str().c_str(), "\ndata-file asjp.tab\n") == 0) 
  {
    fprintf(stderr, "fail: unexpected configuration dump:\n%s", out.str().c_str());
    fail = 1;
  }
}

void weights_from_config() {
  StackPtr<Config> config(new_config());
  EXPECT_OK(config->replace("vowel-weight", "0.5"));
  PhoneticWeights w;
  EXPECT_OK(setup(w, config));
  if (w.vowel_sub != 0.5 || w.sub != 1 || w.del1 != 1 || w.del2 != 1) {
    fprintf(stderr, "fail: weights were not set up from the configuration\n");
    fail = 1;
  }
}

int main() {
  defaults();
  replace();
  bad_values();
  wrong_types();
  prefixes();
  read_in();
  write_out();
  weights_from_config();
  if (fail)
    printf("not ok\n");
  else
    printf("ok\n");
  return fail;
}
