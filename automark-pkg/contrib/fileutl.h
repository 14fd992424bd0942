// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   Small helpers to check for files and directories and to list the
   configuration fragments of a directory.

   This file had this historic note, but now includes further changes
   under the GPL-2.0+:

   This source is placed in the Public Domain, do with it what you will
   It was originally written by Jason Gunthorpe.

   ##################################################################### */
									/*}}}*/
#ifndef AUTOMARKLIB_FILEUTL_H
#define AUTOMARKLIB_FILEUTL_H

#include <automark-pkg/macros.h>

#include <string>
#include <vector>

AUTOMARK_PUBLIC bool RealFileExists(std::string const &File);
AUTOMARK_PUBLIC bool DirectoryExists(std::string const &Path);
/** \brief regular files in Dir which have the extension Ext or no extension at all
 *
 *  Names consisting of other characters than alphanumerics, '_', '-'
 *  and '.' are skipped, like backups of editors and package managers. */
AUTOMARK_PUBLIC std::vector<std::string> GetListOfFilesInDir(std::string const &Dir, std::string const &Ext,
					bool const &SortList);

// File string manipulators
AUTOMARK_PUBLIC std::string flNotDir(std::string const &File);

#endif
