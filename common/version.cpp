#include "version.hpp"

#ifndef LEXDIST_VERSION
#  define LEXDIST_VERSION "0.1.0"
#endif

#ifdef NDEBUG
#  define NDEBUG_STR " NDEBUG"
#else
#  define NDEBUG_STR
#endif

const char * lexdist_version_string() {
  return LEXDIST_VERSION NDEBUG_STR;
}
