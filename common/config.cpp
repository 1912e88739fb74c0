// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <errno.h>
#include <limits.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>

#include "config.hpp"
#include "errors.hpp"
#include "fstream.hpp"
#include "getdata.hpp"
#include "istream.hpp"
#include "ostream.hpp"

#include "i18n.hpp"

namespace lcommon {

  static const KeyInfo config_keys[] = {
    // the description should be under 50 chars
    {"conf",         KeyInfoString, "",
     N_("main configuration file"), 0}
    , {"data-file",    KeyInfoString, "asjp.tab",
       N_("ASJP word list database"), 0}
    , {"precision",    KeyInfoInt,    "4",
       N_("digits printed after the decimal point"), KEYINFO_NON_NEGATIVE}
    , {"verbose",      KeyInfoBool,   "false",
       N_("report progress on standard error"), 0}
    , {"vowel-weight", KeyInfoDouble, "1.0",
       N_("cost of replacing a vowel by another vowel"), KEYINFO_NON_NEGATIVE}
  };

  static const KeyInfo * config_keys_end 
    = config_keys + sizeof(config_keys)/sizeof(KeyInfo);

  Config * new_config()
  {
    return new Config("lexdist", config_keys, config_keys_end);
  }

  Config::Config(ParmStr name,
                 const KeyInfo * mainbegin, 
                 const KeyInfo * mainend)
    : name_(name.c_str())
    , keyinfo_begin(mainbegin), keyinfo_end(mainend)
  {}

  static const char * const prefixes[] = {"reset-", "enable-", "dont-", "disable-"};
  static const Config::Action prefix_actions[] 
    = {Config::Reset, Config::Enable, Config::Disable, Config::Disable};

  const char * Config::base_name(const char * name, Action * action)
  {
    if (action) *action = Set;
    for (unsigned i = 0; i != sizeof(prefixes)/sizeof(const char *); ++i) {
      unsigned l = strlen(prefixes[i]);
      if (strncmp(name, prefixes[i], l) == 0) {
        if (action) *action = prefix_actions[i];
        return name + l;
      }
    }
    return name;
  }

  PosibErr<const KeyInfo *> Config::keyinfo(ParmStr key) const
  {
    for (const KeyInfo * i = keyinfo_begin; i != keyinfo_end; ++i) {
      if (strcmp(i->name, key.c_str()) == 0)
        return i;
    }
    return make_err(unknown_key, key);
  }

  const Config::Entry * Config::lookup(const char * key) const
  {
    for (Vector<Entry>::const_iterator i = entries_.begin(); 
         i != entries_.end(); ++i) 
    {
      if (i->key == key) return &*i;
    }
    return 0;
  }

  bool Config::have(ParmStr key) const 
  {
    return lookup(key.c_str()) != 0;
  }

  static bool parse_int(const char * str, long & res)
  {
    char * end;
    errno = 0;
    res = strtol(str, &end, 10);
    return *str != '\0' && *end == '\0' && errno == 0 
      && res <= INT_MAX && res >= INT_MIN;
  }

  static bool parse_double(const char * str, double & res)
  {
    char * end;
    errno = 0;
    res = strtod(str, &end);
    return *str != '\0' && *end == '\0' && errno == 0 && isfinite(res);
  }

  PosibErr<void> Config::check_value(const KeyInfo * ki, ParmStr value) const
  {
    switch (ki->type) {
    case KeyInfoString:
      break;
    case KeyInfoBool:
      if (value != "true" && value != "false")
        return make_err(bad_value, ki->name, value, _("either \"true\" or \"false\""));
      break;
    case KeyInfoInt: {
      long i;
      if (!parse_int(value.c_str(), i))
        return make_err(bad_value, ki->name, value, _("an integer"));
      if ((ki->flags & KEYINFO_NON_NEGATIVE) && i < 0)
        return make_err(bad_value, ki->name, value, _("a non-negative integer"));
      break;
    }
    case KeyInfoDouble: {
      double d;
      if (!parse_double(value.c_str(), d))
        return make_err(bad_value, ki->name, value, _("a number"));
      if ((ki->flags & KEYINFO_NON_NEGATIVE) && d < 0)
        return make_err(bad_value, ki->name, value, _("a non-negative number"));
      break;
    }
    }
    return no_err;
  }

  PosibErr<void> Config::set(const Entry & entry0)
  {
    Action action;
    const char * base = base_name(entry0.key.c_str(), &action);
    RET_ON_ERR_SET(keyinfo(base), const KeyInfo *, ki);

    Vector<Entry>::iterator cur = entries_.begin();
    while (cur != entries_.end() && cur->key != ki->name) ++cur;

    if (action == Reset) {
      if (cur != entries_.end()) entries_.erase(cur);
      return no_err;
    }

    Entry entry = entry0;
    entry.key = ki->name;
    if (action == Enable || action == Disable) {
      if (ki->type != KeyInfoBool)
        return make_err(key_not_bool, ki->name);
      entry.value = action == Enable ? "true" : "false";
    } else if (ki->type == KeyInfoBool && entry.value.empty()) {
      entry.value = "true";
    }

    RET_ON_ERR(check_value(ki, entry.value));

    if (cur != entries_.end())
      *cur = entry;
    else
      entries_.push_back(entry);
    return no_err;
  }

  PosibErr<void> Config::replace(ParmStr key, ParmStr value)
  {
    return set(Entry(key, value));
  }

  PosibErr<void> Config::remove(ParmStr key)
  {
    Entry entry;
    entry.key = "reset-";
    entry.key += key.c_str();
    return set(entry);
  }

  PosibErr<String> Config::retrieve(ParmStr key) const
  {
    RET_ON_ERR_SET(keyinfo(key), const KeyInfo *, ki);
    if (ki->type != KeyInfoString) return make_err(key_not_string, ki->name);

    const Entry * cur = lookup(ki->name);

    return cur ? cur->value : get_default(ki);
  }

  PosibErr<String> Config::retrieve_any(ParmStr key) const
  {
    RET_ON_ERR_SET(keyinfo(key), const KeyInfo *, ki);

    const Entry * cur = lookup(ki->name);

    return cur ? cur->value : get_default(ki);
  }

  PosibErr<bool> Config::retrieve_bool(ParmStr key) const
  {
    RET_ON_ERR_SET(keyinfo(key), const KeyInfo *, ki);
    if (ki->type != KeyInfoBool) return make_err(key_not_bool, ki->name);

    const Entry * cur = lookup(ki->name);

    String value(cur ? cur->value : get_default(ki));

    if (value == "false") return false;
    else                  return true;
  }
  
  PosibErr<int> Config::retrieve_int(ParmStr key) const
  {
    RET_ON_ERR_SET(keyinfo(key), const KeyInfo *, ki);
    if (ki->type != KeyInfoInt) return make_err(key_not_int, ki->name);

    const Entry * cur = lookup(ki->name);

    String value(cur ? cur->value : get_default(ki));

    return atoi(value.c_str());
  }

  PosibErr<double> Config::retrieve_double(ParmStr key) const
  {
    RET_ON_ERR_SET(keyinfo(key), const KeyInfo *, ki);
    if (ki->type != KeyInfoDouble) return make_err(key_not_double, ki->name);

    const Entry * cur = lookup(ki->name);

    String value(cur ? cur->value : get_default(ki));

    return strtod(value.c_str(), 0);
  }

  static const char * type_name(KeyInfoType t)
  {
    switch (t) {
    case KeyInfoString: return _("string");
    case KeyInfoInt:    return _("integer");
    case KeyInfoBool:   return _("boolean");
    case KeyInfoDouble: return _("number");
    }
    return "";
  }

  void Config::write_to_stream(OStream & out) const
  {
    for (const KeyInfo * i = keyinfo_begin; i != keyinfo_end; ++i) {
      out.printf("# %s (%s)\n#   %s\n", i->name, type_name(i->type), _(i->desc));
      const Entry * cur = lookup(i->name);
      if (cur) {
        out.printf("#   default: %s\n", i->def);
        out.printf("%s %s\n\n", i->name, cur->value.c_str());
      } else {
        out.printf("%s %s\n\n", i->name, i->def);
      }
    }
  }

  PosibErr<void> Config::read_in(IStream & in, ParmStr id) 
  {
    DataPair dp;
    while (getdata_pair(in, dp)) {
      to_lower(dp.key);
      Entry entry;
      entry.key = dp.key;
      entry.value = dp.value;
      entry.file = id.c_str();
      entry.line_num = dp.line_num;
      PosibErrBase pe = set(entry);
      if (pe.has_err()) {
        pe.with_file(id, dp.line_num);
        return pe;
      }
    }
    return no_err;
  }

  PosibErr<void> Config::read_in_file(ParmStr file) {
    FStream in;
    RET_ON_ERR(in.open(file, "r"));
    return read_in(in, file);
  }

  PosibErr<void> Config::read_in_string(ParmStr str, const char * what) {
    StringIStream in(str);
    return read_in(in, what);
  }

}
