// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the package library

   This function must be called to configure the config class before
   calling the parser or the cycle finder, they read their field lists
   and debug switches from it.

   ##################################################################### */
									/*}}}*/
#ifndef AUTOMARKLIB_INIT_H
#define AUTOMARKLIB_INIT_H

#include <automark-pkg/macros.h>

class Configuration;

AUTOMARK_PUBLIC extern const char *pkgVersion;
AUTOMARK_PUBLIC extern const char *pkgLibVersion;

AUTOMARK_PUBLIC bool pkgInitConfig(Configuration &Cnf);

#endif
