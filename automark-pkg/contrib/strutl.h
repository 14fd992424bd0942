// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   String Util - These are some useful string functions

   This file had this historic note, but now includes further changes
   under the GPL-2.0+:

   This source is placed in the Public Domain, do with it what you will
   It was originally written by Jason Gunthorpe <jgg@gpu.srv.ualberta.ca>

   ##################################################################### */
									/*}}}*/
#ifndef AUTOMARKLIB_STRUTL_H
#define AUTOMARKLIB_STRUTL_H

#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <stdarg.h>

#include "macros.h"


namespace AutoMark {
   namespace String {
      AUTOMARK_PUBLIC std::string Strip(const std::string &s);
      AUTOMARK_PUBLIC bool Endswith(const std::string &s, const std::string &ending);
      AUTOMARK_PUBLIC bool Startswith(const std::string &s, const std::string &starting);
      AUTOMARK_PUBLIC std::string Join(std::vector<std::string> list, const std::string &sep);
   }
}

AUTOMARK_PUBLIC bool ParseQuoteWord(const char *&String,std::string &Res);
AUTOMARK_PUBLIC int StringToBool(const std::string &Text,int Default = -1);

// split a given string by a char
AUTOMARK_PUBLIC std::vector<std::string> VectorizeString(std::string const &haystack, char const &split) AUTOMARK_PURE;

AUTOMARK_PUBLIC void ioprintf(std::ostream &out,const char *format,...) AUTOMARK_PRINTF(2);
AUTOMARK_PUBLIC void strprintf(std::string &out,const char *format,...) AUTOMARK_PRINTF(2);

AUTOMARK_PUBLIC int stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd) AUTOMARK_PURE;
inline int stringcasecmp(const char *A,const char *AEnd,const char *B) {return stringcasecmp(A,AEnd,B,B+strlen(B));};
inline int stringcasecmp(const std::string &A,const char *B) {return stringcasecmp(A.data(),A.data()+A.length(),B,B+strlen(B));};
inline int stringcasecmp(const std::string &A,const std::string &B) {return stringcasecmp(A.data(),A.data()+A.length(),B.data(),B.data()+B.length());};
inline int stringcasecmp(const std::string &A,const char *B,const char *BEnd) {return stringcasecmp(A.data(),A.data()+A.length(),B,BEnd);};

AUTOMARK_PUBLIC std::string SubstVar(const std::string &Str,const std::string &Subst,const std::string &Contents);

#endif
