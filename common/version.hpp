#ifndef LEXDIST_VERSION__HPP
#define LEXDIST_VERSION__HPP

const char * lexdist_version_string();

#endif
