// This file is part of Lexdist
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef LEXDIST_CONFIG__HPP
#define LEXDIST_CONFIG__HPP

#include "key_info.hpp"
#include "posib_err.hpp"
#include "string.hpp"
#include "vector.hpp"

namespace lcommon {

  class IStream;
  class OStream;

  // The Config class is used to hold configuration information.  It
  // has a set of keys which it will accept.  Inserting or even trying
  // to look at a key that it does not know will produce an error.
  // Values are checked against the type of the key when they are
  // set, so retrieving a value never fails once the key is known.

  // prefixes
  //
  // reset - resets a value to the default
  //
  // enable - sets a boolean value to true
  // dont, disable - sets a boolean value to false
  // -- setting a boolean value to an empty string is the same as setting 
  //    it to true

  class Config {
  public:
    enum Action {Set, Reset, Enable, Disable};

    struct Entry {
      String key;
      String value;
      String file;
      unsigned line_num;
      Entry() : line_num(0) {}
      Entry(ParmStr k, ParmStr v) 
        : key(k.c_str()), value(v.c_str()), line_num(0) {}
    };

  private:
    String    name_;

    Vector<Entry> entries_;

    const KeyInfo * keyinfo_begin;
    const KeyInfo * keyinfo_end;

    const Entry * lookup(const char * key) const;
    PosibErr<void> check_value(const KeyInfo *, ParmStr value) const;

  public:

    Config(ParmStr name,
	   const KeyInfo * mainbegin, 
	   const KeyInfo * mainend);

    const char * name() const {return name_.c_str();}

    const KeyInfo * possible_begin() const {return keyinfo_begin;}
    const KeyInfo * possible_end() const {return keyinfo_end;}

    static const char * base_name(const char * name, Action * action = 0);
  
    PosibErr<const KeyInfo *> keyinfo(ParmStr key) const;

    PosibErr<void> set(const Entry & entry);
    PosibErr<void> replace(ParmStr key, ParmStr value);
    PosibErr<void> remove(ParmStr key);

    // true if the key was explicitly set
    bool have(ParmStr key) const;

    String get_default(const KeyInfo * ki) const {return ki->def;}

    PosibErr<String> retrieve(ParmStr key) const;

    // will retrieve any type of key as text
    PosibErr<String> retrieve_any(ParmStr key) const;
  
    PosibErr<bool>   retrieve_bool  (ParmStr key) const;
    PosibErr<int>    retrieve_int   (ParmStr key) const;
    PosibErr<double> retrieve_double(ParmStr key) const;
    
    void write_to_stream(OStream & out) const;

    PosibErr<void> read_in(IStream & in, ParmStr id = "");
    PosibErr<void> read_in_file(ParmStr file);
    PosibErr<void> read_in_string(ParmStr str, const char * what = "");
  };

  // A config object with the keys the lexdist program knows about
  Config * new_config();

}

#endif
