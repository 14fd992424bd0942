// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - Sophisticated command line parser

   Options are matched against the Args table and stored in the
   Configuration, everything else ends up in the FileList with the
   command as its first entry.

   This source is placed in the Public Domain, do with it what you will
   It was originally written by Jason Gunthorpe <jgg@debian.org>.

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <automark-pkg/cmndline.h>
#include <automark-pkg/configuration.h>
#include <automark-pkg/error.h>
#include <automark-pkg/strutl.h>

#include <string>

#include <stddef.h>
#include <stdlib.h>
#include <string.h>

#include <automarki18n.h>
									/*}}}*/
using namespace std;

// CommandLine::CommandLine - Constructor				/*{{{*/
CommandLine::CommandLine(Args *AList,Configuration *Conf) : ArgList(AList),
                                 Conf(Conf), FileList(nullptr)
{
}
CommandLine::CommandLine() : ArgList(nullptr), Conf(nullptr), FileList(nullptr)
{
}
CommandLine &CommandLine::operator=(CommandLine &&Other)
{
   if (this == &Other)
      return *this;
   delete [] FileList;
   ArgList = Other.ArgList;
   Conf = Other.Conf;
   FileList = Other.FileList;
   Other.FileList = nullptr;
   return *this;
}
									/*}}}*/
// CommandLine::~CommandLine - Destructor				/*{{{*/
CommandLine::~CommandLine()
{
   delete [] FileList;
}
									/*}}}*/
// CommandLine::GetCommand - return the first non-option word		/*{{{*/
// ---------------------------------------------------------------------
/* A -- ends the options, so the command is either before it or the
   first word right after it. Without a -- the first word which is a
   known command wins. */
char const * CommandLine::GetCommand(Dispatch const * const Map,
      unsigned int const argc, char const * const * const argv)
{
   auto const findInMap = [&](char const * const Word) -> char const * {
      for (size_t j = 0; Map[j].Match != nullptr; ++j)
	 if (strcmp(Word, Map[j].Match) == 0)
	    return Map[j].Match;
      return nullptr;
   };

   for (size_t i = 1; i < argc; ++i)
   {
      if (strcmp(argv[i], "--") != 0)
	 continue;
      for (size_t k = 1; k < i; ++k)
	 if (char const * const Cmd = findInMap(argv[k]))
	    return Cmd;
      ++i;
      if (i < argc)
	 return findInMap(argv[i]);
      return nullptr;
   }
   for (size_t i = 1; i < argc; ++i)
   {
      if (*(argv[i]) == '-')
	 continue;
      if (char const * const Cmd = findInMap(argv[i]))
	 return Cmd;
   }
   return nullptr;
}
									/*}}}*/
// CommandLine::Parse - Main action member				/*{{{*/
bool CommandLine::Parse(int argc,const char **argv)
{
   delete [] FileList;
   FileList = new const char *[argc + 1];
   const char **Files = FileList;
   int I;
   for (I = 1; I < argc; ++I)
   {
      const char *Opt = argv[I];

      // a lone - is stdin, so it is a file like any other
      if (*Opt != '-' || Opt[1] == 0)
      {
	 *Files++ = Opt;
	 continue;
      }

      ++Opt;

      // Double dash signifies the end of option processing
      if (*Opt == '-' && Opt[1] == 0)
      {
	 ++I;
	 break;
      }

      // Single dash is a short option
      if (*Opt != '-')
      {
	 while (*Opt != 0)
	 {
	    Args *A;
	    for (A = ArgList; A->end() == false && A->ShortOpt != *Opt; ++A);
	    if (A->end() == true)
	       return _error->Error(_("Command line option '%c' [from %s] is not understood in combination with the other options."),*Opt,argv[I]);

	    if (HandleOpt(I,argc,argv,Opt,A) == false)
	       return false;
	    if (*Opt != 0)
	       ++Opt;
	 }
	 continue;
      }

      ++Opt;

      // Match up to a = against the list
      const char *OptEnd = strchrnul(Opt, '=');
      auto const findLong = [&](const char * const Start) {
	 Args *A = ArgList;
	 for (; A->end() == false &&
	      (A->LongOpt == nullptr || stringcasecmp(Start,OptEnd,A->LongOpt) != 0);
	      ++A);
	 return A;
      };
      Args *A = findLong(Opt);

      // Failed, look for a word after the first - (no-foo)
      bool PreceedMatch = false;
      if (A->end() == true)
      {
	 Opt = static_cast<const char *>(memchr(Opt, '-', OptEnd - Opt));
	 if (Opt == nullptr)
	    return _error->Error(_("Command line option %s is not understood in combination with the other options"),argv[I]);
	 ++Opt;

	 A = findLong(Opt);
	 if (A->end() == true && OptEnd - Opt == 1)
	    for (A = ArgList; A->end() == false && A->ShortOpt != *Opt; ++A);

	 if (A->end() == true)
	    return _error->Error(_("Command line option %s is not understood in combination with the other options"),argv[I]);
	 if (A->IsBoolean() == false)
	    return _error->Error(_("Command line option %s is not boolean"),argv[I]);
	 PreceedMatch = true;
      }

      --OptEnd;
      if (HandleOpt(I,argc,argv,OptEnd,A,PreceedMatch) == false)
	 return false;
   }

   // Copy any remaining file names over
   for (; I < argc; ++I)
      *Files++ = argv[I];
   *Files = nullptr;

   SaveInConfig(argc, argv);

   return true;
}
									/*}}}*/
// CommandLine::HandleOpt - Handle a single option including all flags	/*{{{*/
// ---------------------------------------------------------------------
/* This is a helper function for parser, it looks at a given argument
   and looks for specific patterns in the string, it gets tokanized
   -ruffly- like -*[yes|true|enable]-(o|longopt)[=][ ][argument] */
bool CommandLine::HandleOpt(int &I,int argc,const char *argv[],
			    const char *&Opt,Args *A,bool PreceedMatch)
{
   const char *Argument = nullptr;
   bool CertainArg = false;
   int IncI = 0;

   if (Opt[1] == 0)
   {
      if (I + 1 < argc && argv[I+1][0] != '-')
	 Argument = argv[I+1];
      IncI = 1;
   }
   else if (Opt[1] == '=')
   {
      CertainArg = true;
      Argument = Opt + 2;
   }
   else
      Argument = Opt + 1;

   // Option is an argument set
   if ((A->Flags & HasArg) == HasArg)
   {
      if (Argument == nullptr)
	 return _error->Error(_("Option %s requires an argument."),argv[I]);
      Opt += strlen(Opt);
      I += IncI;

      if ((A->Flags & ConfigFile) == ConfigFile)
	 return ReadConfigFile(*Conf,Argument);

      if ((A->Flags & ArbItem) == ArbItem)
      {
	 const char * const J = strchr(Argument, '=');
	 if (J == nullptr)
	    return _error->Error(_("Option %s: Configuration item specification must have an =<val>."),argv[I]);

	 Conf->Set(string(Argument,J-Argument), string(J+1));
	 return true;
      }

      Conf->Set(A->ConfName,string(Argument));
      return true;
   }

   // Option is an integer level
   if ((A->Flags & IntLevel) == IntLevel)
   {
      if (Argument != nullptr)
      {
	 char *EndPtr;
	 long const Value = strtol(Argument,&EndPtr,10);

	 if (EndPtr == Argument && CertainArg == true)
	    return _error->Error(_("Option %s requires an integer argument, not '%s'"),argv[I],Argument);

	 if (EndPtr != Argument && *EndPtr == 0)
	 {
	    Conf->Set(A->ConfName,static_cast<int>(Value));
	    Opt += strlen(Opt);
	    I += IncI;
	    return true;
	 }
      }

      Conf->Set(A->ConfName,Conf->FindI(A->ConfName)+1);
      return true;
   }

   // Option is a boolean
   int Sense = -1;
   string Preceding;
   while (true)
   {
      // --no-foo and friends carry the sense in front of the name
      if (Argument == nullptr)
      {
	 if (PreceedMatch == false)
	    break;

	 const char *J = argv[I];
	 for (; *J == '-'; ++J);
	 const char * const JEnd = strchr(J, '-');
	 if (JEnd == nullptr)
	    break;
	 Preceding.assign(J, JEnd - J);
	 Argument = Preceding.c_str();
	 CertainArg = true;
      }

      Sense = StringToBool(Argument);
      if (Sense >= 0)
      {
	 if (Argument != Preceding.c_str())
	 {
	    Opt += strlen(Opt);
	    I += IncI;
	 }
	 break;
      }

      if (CertainArg == true)
	 return _error->Error(_("Sense %s is not understood, try true or false."),Argument);

      Argument = nullptr;
      if (PreceedMatch == false)
	 break;
   }

   if (Sense == -1)
      Sense = ((A->Flags & InvBoolean) == InvBoolean) ? 0 : 1;

   Conf->Set(A->ConfName,Sense);
   return true;
}
									/*}}}*/
// CommandLine::FileSize - Count the number of filenames		/*{{{*/
unsigned int CommandLine::FileSize() const
{
   unsigned int Count = 0;
   for (const char **I = FileList; I != nullptr && *I != nullptr; ++I)
      ++Count;
   return Count;
}
									/*}}}*/
// CommandLine::DispatchArg - Do something with the first arg		/*{{{*/
bool CommandLine::DispatchArg(Dispatch const * const Map,bool NoMatch)
{
   if (FileList == nullptr || FileList[0] == nullptr)
      return _error->Error(_("No operation given"));

   int I;
   for (I = 0; Map[I].Match != nullptr; ++I)
   {
      if (strcmp(FileList[0],Map[I].Match) != 0)
	 continue;
      bool const Res = Map[I].Handler(*this);
      if (Res == false && _error->PendingError() == false)
	 _error->Error("Handler silently failed");
      return Res;
   }

   if (NoMatch == true)
      _error->Error(_("Invalid operation %s"),FileList[0]);
   return false;
}
									/*}}}*/
// CommandLine::SaveInConfig - keep the invocation around for debugging	/*{{{*/
void CommandLine::SaveInConfig(unsigned int const &argc, char const * const * const argv)
{
   string cmdline;
   for (unsigned int i = 0; i < argc && argv[i] != nullptr; ++i)
   {
      if (i != 0)
	 cmdline.append(" ");
      bool const quote = strchr(argv[i], ' ') != nullptr;
      if (quote == true)
	 cmdline.append("'");
      cmdline.append(argv[i]);
      if (quote == true)
	 cmdline.append("'");
   }
   _config->Set("CommandLine::AsString", cmdline);
}
									/*}}}*/
// CommandLine::MakeArgs - build an Args entry for an option table	/*{{{*/
CommandLine::Args CommandLine::MakeArgs(char ShortOpt, char const *LongOpt,
      char const *ConfName, unsigned long Flags)
{
   Args arg;
   arg.ShortOpt = ShortOpt;
   arg.LongOpt = LongOpt;
   arg.ConfName = ConfName;
   arg.Flags = Flags;
   return arg;
}
									/*}}}*/
