// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   Most of this source is placed in the Public Domain, do with it what
   you will
   It was originally written by Jason Gunthorpe <jgg@debian.org>.
   FileFd gzip support added by Martin Pitt <martin.pitt@canonical.com>

   The exception is RunScripts() it is under the GPLv2

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/error.h>
#include <automark-pkg/fileutl.h>
#include <automark-pkg/strutl.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>

#include <automarki18n.h>
									/*}}}*/
using std::string;

// RealFileExists - Check if a file exists and if it is really a file	/*{{{*/
bool RealFileExists(string const &File)
{
   struct stat Buf;
   if (stat(File.c_str(),&Buf) != 0)
      return false;
   return S_ISREG(Buf.st_mode);
}
									/*}}}*/
// DirectoryExists - Check if a directory exists and is really one	/*{{{*/
bool DirectoryExists(string const &Path)
{
   struct stat Buf;
   if (stat(Path.c_str(),&Buf) != 0)
      return false;
   return S_ISDIR(Buf.st_mode);
}
									/*}}}*/
// GetListOfFilesInDir - returns a vector of files in the given dir	/*{{{*/
std::vector<string> GetListOfFilesInDir(string const &Dir, string const &Ext,
					bool const &SortList)
{
   bool const Debug = _config->FindB("Debug::GetListOfFilesInDir", false);
   std::vector<string> List;

   DIR *D = opendir(Dir.c_str());
   if (D == nullptr)
   {
      _error->Errno("opendir",_("Unable to read %s"),Dir.c_str());
      return List;
   }

   for (struct dirent *Ent = readdir(D); Ent != nullptr; Ent = readdir(D))
   {
      string const Name = Ent->d_name;
      if (Name[0] == '.')
	 continue;

      bool const BadChar = std::any_of(Name.begin(), Name.end(), [](char const c) {
	 return isalnum(static_cast<unsigned char>(c)) == 0 && c != '_' && c != '-' && c != '.';
      });
      if (BadChar == true)
      {
	 if (Debug == true)
	    std::clog << "Bad file: " << Name << " → bad character" << std::endl;
	 continue;
      }

      string::size_type const Dot = Name.rfind('.');
      if (Dot != string::npos && Name.compare(Dot + 1, string::npos, Ext) != 0)
      {
	 if (Debug == true)
	    std::clog << "Bad file: " << Name << " → bad extension" << std::endl;
	 continue;
      }

      string const File = Dir + (AutoMark::String::Endswith(Dir, "/") ? "" : "/") + Name;
      if (RealFileExists(File) == false)
	 continue;

      if (Debug == true)
	 std::clog << "Accept file: " << Name << " in " << Dir << std::endl;
      List.push_back(File);
   }
   closedir(D);

   if (SortList == true)
      std::sort(List.begin(),List.end());
   return List;
}
									/*}}}*/
// flNotDir - Strip the directory from the filename			/*{{{*/
string flNotDir(string const &File)
{
   string::size_type const Res = File.rfind('/');
   if (Res == string::npos)
      return File;
   return File.substr(Res + 1);
}
									/*}}}*/
