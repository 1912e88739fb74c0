// This file is part of Lexdist Copyright (C)
// 2002,2003,2004,2011 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find it at
// http://www.gnu.org/.

#include <locale.h>
#include <stdlib.h>
#include <string.h>

#include "asjp_reader.hpp"
#include "concept_dist.hpp"
#include "config.hpp"
#include "editdist.hpp"
#include "iostream.hpp"
#include "language_dist.hpp"
#include "posib_err.hpp"
#include "registry.hpp"
#include "stack_ptr.hpp"
#include "version.hpp"
#include "weights.hpp"
#include "word_list.hpp"

#include "i18n.hpp"

using namespace lcommon;
using namespace lexdist;

// action functions declarations

void print_ver();
void print_help(bool verbose = false);
void config();

void dist();
void nld();
void list();
void info();
void forms();
void compare();
void matrix();

void print_error(ParmString msg)
{
  CERR.printf(_("Error: %s\n"), msg.c_str());
}

void print_error(ParmString msg, ParmString str)
{
  CERR.put(_("Error: "));
  CERR.printf(msg.c_str(), str.c_str());
  CERR.put('\n');
}

#define EXIT_ON_ERR(command) \
  do{PosibErrBase pe(command);\
  if(pe.has_err()){print_error(pe.get_err()->mesg); exit(1);}\
  } while(false)
#define EXIT_ON_ERR_SET(command, type, var)\
  type var;\
  do{PosibErr< type > pe(command);\
  if(pe.has_err()){print_error(pe.get_err()->mesg); exit(1);}\
  else {var=pe.data;}\
  } while(false)


/////////////////////////////////////////////////////////
//
// Command line options functions and classes
// (including main)
//

typedef Vector<String> Args;
typedef Config         Options;

Args              args;
StackPtr<Options> options;

struct PossibleOption {
  const char * name;
  char         abrv;
  int          num_arg; // for commands the minimum number of parameters
  bool         is_command;
};

#define OPTION(name,abrv,num)         {name,abrv,num,false}
#define COMMAND(name,abrv,num)        {name,abrv,num,true}

const PossibleOption possible_options[] = {
  OPTION("conf",          'c', 1),
  OPTION("data-file",     'f', 1),
  OPTION("vowel-weight",  'w', 1),
  OPTION("precision",     'p', 1),
  OPTION("verbose",       'V', 0),

  COMMAND("usage",     '?',  0),
  COMMAND("help",      '\0', 0),
  COMMAND("version",   'v',  0),
  COMMAND("config",    '\0', 0),
  COMMAND("dist",      '\0', 2),
  COMMAND("nld",       '\0', 2),
  COMMAND("list",      '\0', 0),
  COMMAND("info",      '\0', 1),
  COMMAND("forms",     '\0', 2),
  COMMAND("compare",   '\0', 2),
  COMMAND("matrix",    '\0', 1),
};

const PossibleOption * possible_options_end 
  = possible_options + sizeof(possible_options)/sizeof(PossibleOption);

static const PossibleOption * find_option(char c) {
  const PossibleOption * i = possible_options;
  while (i != possible_options_end && i->abrv != c) 
    ++i;
  return i;
}

static const PossibleOption * find_option(const char * str) {
  const PossibleOption * i = possible_options;
  while (i != possible_options_end && strcmp(str, i->name) != 0)
    ++i;
  return i;
}

// Long options that are not in the table above are taken to be
// configuration keys.  Boolean keys take no parameter unless one is
// given with '='.
static bool takes_parm(const String & name)
{
  const PossibleOption * o = find_option(name.c_str());
  if (o != possible_options_end) return o->num_arg != 0;
  Config::Action action;
  const char * base = Config::base_name(name.c_str(), &action);
  if (action != Config::Set) return false;
  PosibErr<const KeyInfo *> ki = options->keyinfo(base);
  if (ki.has_err()) {ki.ignore_err(); return true;}
  return ki.data->type != KeyInfoBool;
}

int main (int argc, const char *argv[]) 
{
  options = new_config();

  setlocale (LC_ALL, "");
  // numbers are always read and written with a '.'
  setlocale (LC_NUMERIC, "C");
  lexdist_gettext_init();

  if (argc == 1) {print_help(); return 0;}

  //
  // process command line options by collecting the configuration
  // entries and pushing everything else onto "args"
  //
  Vector<Config::Entry> entries;
  int i = 1;
  while (i != argc) {
    const char * arg = argv[i];
    if (arg[0] != '-' || arg[1] == '\0') {
      args.push_back(arg);
      i += 1;
      continue;
    }
    String name;
    String parm;
    bool have_parm = false;
    if (arg[1] == '-') {
      // a long arg
      const char * c = arg + 2;
      while(*c != '=' && *c != '\0') ++c;
      name.assign(arg + 2, c - arg - 2);
      if (*c == '=') {have_parm = true; parm = c + 1;}
    } else {
      // a short arg
      const PossibleOption * o = find_option(arg[1]);
      if (o == possible_options_end) {
        print_error(_("Invalid Option: %s"), arg);
        return 1;
      }
      name = o->name;
      if (arg[2] != '\0') {have_parm = true; parm = arg + 2;}
    }
    i += 1;
    const PossibleOption * o = find_option(name.c_str());
    if (o != possible_options_end && o->is_command) {
      if (have_parm) {
        print_error(_("\"%s\" does not take any parameters."), arg);
        return 1;
      }
      args.push_back(name);
      continue;
    }
    if (!have_parm && takes_parm(name)) {
      if (i == argc) {
        print_error(_("You must specify a parameter for \"%s\"."), arg);
        return 1;
      }
      parm = argv[i];
      i += 1;
    }
    entries.push_back(Config::Entry(name, parm));
  }

  //
  // the configuration file is read first so that the command line
  // takes precedence
  //
  for (Vector<Config::Entry>::const_iterator e = entries.begin(); 
       e != entries.end(); ++e) 
  {
    if (e->key == "conf") EXIT_ON_ERR(options->set(*e));
  }
  EXIT_ON_ERR_SET(options->retrieve("conf"), String, conf);
  if (!conf.empty()) 
    EXIT_ON_ERR(options->read_in_file(conf));
  for (Vector<Config::Entry>::const_iterator e = entries.begin(); 
       e != entries.end(); ++e) 
  {
    EXIT_ON_ERR(options->set(*e));
  }

  if (args.empty()) {
    print_error(_("You must specify an action"));
    return 1;
  }

  String action_str = args.front();
  args.pop_front();
  const PossibleOption * action_opt = find_option(action_str.c_str());
  if (action_opt == possible_options_end || !action_opt->is_command) {
    print_error(_("Unknown Action: %s"),  action_str);
    return 1;
  } else if (action_opt->num_arg > (int)args.size()) {
    CERR.printf(_("Error: You must specify at least %d parameters for \"%s\".\n"), 
                action_opt->num_arg, action_str.c_str());
    return 1;
  }

  //
  // perform the requested action
  //
  if (action_str == "usage")
    print_help();
  else if (action_str == "help")
    print_help(true);
  else if (action_str == "version")
    print_ver();
  else if (action_str == "config")
    config();
  else if (action_str == "dist")
    dist();
  else if (action_str == "nld")
    nld();
  else if (action_str == "list")
    list();
  else if (action_str == "info")
    info();
  else if (action_str == "forms")
    forms();
  else if (action_str == "compare")
    compare();
  else if (action_str == "matrix")
    matrix();

  return 0;
}

///////////////////////////
//
// helper functions
//

static PhoneticWeights get_weights()
{
  PhoneticWeights w;
  EXIT_ON_ERR(setup(w, options));
  return w;
}

static void print_number(double d)
{
  EXIT_ON_ERR_SET(options->retrieve_int("precision"), int, precision);
  COUT.printf("%.*f", precision, d);
}

static void load_registry(Registry & reg)
{
  EXIT_ON_ERR_SET(options->retrieve("data-file"), String, file);
  EXIT_ON_ERR_SET(options->retrieve_bool("verbose"), bool, verbose);
  if (verbose)
    CERR.printf(_("Reading \"%s\".\n"), file.c_str());
  AsjpReadStats stats;
  EXIT_ON_ERR(read_asjp_file(file, reg, &stats));
  if (verbose) {
    CERR.printf(_("Read %u records, %u with an ISO code seen before.\n"),
                stats.rows, stats.duplicates);
    CERR.printf(_("Kept %u word lists.\n"), reg.size());
  }
}

static const WordList * get_word_list(const Registry & reg, ParmString iso)
{
  EXIT_ON_ERR_SET(reg.lookup(iso), const WordList *, wl);
  return wl;
}

///////////////////////////
//
// config
//

void config ()
{
  options->write_to_stream(COUT);
}

///////////////////////////
//
// dist, nld
//

void dist ()
{
  print_number(edit_distance(args[0], args[1], get_weights()));
  COUT << '\n';
}

void nld ()
{
  print_number(normalized_edit_distance(args[0], args[1], get_weights()));
  COUT << '\n';
}

///////////////////////////
//
// list, info, forms
//

void list ()
{
  Registry reg;
  load_registry(reg);
  for (Registry::const_iterator i = reg.begin(); i != reg.end(); ++i)
    COUT.printf("%s\t%u\t%s\n", 
                i->second.iso(), i->second.size(), i->second.name());
}

static void print_forms(const Forms & forms)
{
  for (Forms::const_iterator f = forms.begin(); f != forms.end(); ++f) {
    if (f != forms.begin()) COUT << ", ";
    COUT << *f;
  }
}

void info ()
{
  Registry reg;
  load_registry(reg);
  const WordList * wl = get_word_list(reg, args[0]);
  COUT.printf(_("ISO code: %s\n"), wl->iso());
  COUT.printf(_("Name: %s\n"), wl->name());
  COUT.printf(_("Concepts: %u\n"), wl->size());
  for (WordList::const_iterator i = wl->begin(); i != wl->end(); ++i) {
    COUT.printf("  %s\t", i->first.c_str());
    print_forms(i->second);
    COUT << '\n';
  }
}

void forms ()
{
  Registry reg;
  load_registry(reg);
  const WordList * wl = get_word_list(reg, args[0]);
  EXIT_ON_ERR_SET(wl->lookup(args[1]), const Forms *, fs);
  for (Forms::const_iterator f = fs->begin(); f != fs->end(); ++f)
    COUT.printl(*f);
}

///////////////////////////
//
// compare, matrix
//

void compare ()
{
  Registry reg;
  load_registry(reg);
  const WordList * wl1 = get_word_list(reg, args[0]);
  const WordList * wl2 = get_word_list(reg, args[1]);
  EXIT_ON_ERR_SET(options->retrieve_bool("verbose"), bool, verbose);
  if (verbose) {
    Vector<String> common;
    common_concepts(*wl1, *wl2, common);
    CERR.printf(_("%u concepts in common.\n"), (unsigned)common.size());
  }
  EXIT_ON_ERR_SET(mean_language_distance(*wl1, *wl2, get_weights()), double, d);
  print_number(d);
  COUT << '\n';
}

void matrix ()
{
  Registry reg;
  load_registry(reg);
  PhoneticWeights w = get_weights();
  Vector<const WordList *> wls;
  for (Args::const_iterator i = args.begin(); i != args.end(); ++i)
    wls.push_back(get_word_list(reg, *i));

  for (unsigned j = 0; j != wls.size(); ++j)
    COUT.printf("\t%s", wls[j]->iso());
  COUT << '\n';
  for (unsigned i = 0; i != wls.size(); ++i) {
    COUT << wls[i]->iso();
    for (unsigned j = 0; j != wls.size(); ++j) {
      COUT << '\t';
      PosibErr<double> d = mean_language_distance(*wls[i], *wls[j], w);
      if (d.has_err(no_comparable_concepts)) {
        COUT << '-';
      } else if (d.has_err()) {
        print_error(d.get_err()->mesg);
        exit(1);
      } else {
        print_number(d.data);
      }
    }
    COUT << '\n';
  }
}

///////////////////////////
//
// print_ver, print_help
//

void print_ver () {
  COUT.printf("Lexdist %s\n", lexdist_version_string());
}

struct HelpLine {
  char         abrv;
  const char * name;
  const char * parm;
  const char * desc;
};

static const HelpLine command_help[] = {
  {'?',  "usage",   "",                 N_("displays a brief usage message")},
  {'\0', "help",    "",                 N_("displays a detailed help message")},
  {'v',  "version", "",                 N_("prints a version line")},
  {'\0', "config",  "",                 N_("dumps the current configuration to stdout")},
  {'\0', "dist",    N_("<a> <b>"),      N_("edit distance of two transcriptions")},
  {'\0', "nld",     N_("<a> <b>"),      N_("normalized edit distance of two transcriptions")},
  {'\0', "list",    "",                 N_("lists the loaded word lists")},
  {'\0', "info",    N_("<iso>"),        N_("shows the word list of a language")},
  {'\0', "forms",   N_("<iso> <concept>"), N_("shows the forms of one concept")},
  {'\0', "compare", N_("<iso1> <iso2>"), N_("mean normalized distance of two languages")},
  {'\0', "matrix",  N_("<iso>..."),     N_("pairwise distances of several languages")},
};

static const HelpLine * command_help_end 
  = command_help + sizeof(command_help)/sizeof(HelpLine);

static void print_help_line(const HelpLine & l)
{
  String command;
  if (l.abrv != '\0') {
    command += '-';
    command += l.abrv;
    command += ',';
  }
  command += l.name;
  if (l.parm[0] != '\0') {
    command += ' ';
    command += gt_(l.parm);
  }
  COUT.printf("  %-24s %s\n", command.c_str(), _(l.desc));
}

void print_help (bool verbose) {
  COUT.printf(_("\n"
                "Lexdist %s.  Measures the lexical similarity of languages\n"
                "using the word lists of the ASJP database.\n"
                "\n"
                "Usage: lexdist [options] <command>\n"
                "\n"
                "<command> is one of:\n"),
              lexdist_version_string());
  for (const HelpLine * l = command_help; l != command_help_end; ++l)
    print_help_line(*l);
  if (!verbose) {
    COUT.put(_("\n[options] are any of the following:\n"
               "  -f,--data-file=<file>   ASJP word list database\n"
               "  -w,--vowel-weight=<n>   cost of replacing a vowel by another vowel\n"
               "  -c,--conf=<file>        main configuration file\n"
               "\nUse \"help\" for the full list of options.\n"));
    return;
  }
  COUT.put(_("\n[options] are --<key>=<value> for any of the keys below.  Boolean\n"
             "keys also accept --<key>, --dont-<key> and --enable-<key>, and\n"
             "--reset-<key> restores the default.\n\n"));
  for (const KeyInfo * k = options->possible_begin(); 
       k != options->possible_end(); ++k) 
  {
    const PossibleOption * o = find_option(k->name);
    String command;
    if (o != possible_options_end && o->abrv != '\0') {
      command += '-';
      command += o->abrv;
      command += ',';
    }
    command += "--";
    if (k->type == KeyInfoBool) command += "[dont-]";
    command += k->name;
    COUT.printf("  %-24s %s\n", command.c_str(), _(k->desc));
  }
  COUT.put('\n');
}
