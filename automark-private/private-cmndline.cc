// Include Files							/*{{{*/
#include <config.h>

#include <automark-pkg/cmndline.h>
#include <automark-pkg/configuration.h>
#include <automark-pkg/error.h>
#include <automark-pkg/fileutl.h>
#include <automark-pkg/init.h>
#include <automark-pkg/strutl.h>

#include <automark-private/private-cmndline.h>
#include <automark-private/private-main.h>

#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <iostream>
#include <iterator>
#include <vector>

#include <automarki18n.h>
									/*}}}*/

AUTOMARK_NONNULL(1, 2)
static bool CmdMatches_fn(char const *const Cmd, char const *const Match)
{
   return strcmp(Cmd, Match) == 0;
}
template <typename... Tail>
AUTOMARK_NONNULL(1, 2)
static bool CmdMatches_fn(char const *const Cmd, char const *const Match, Tail... MoreMatches)
{
   return CmdMatches_fn(Cmd, Match) || CmdMatches_fn(Cmd, MoreMatches...);
}
#define addArg(w, x, y, z) Args.emplace_back(CommandLine::MakeArgs(w, x, y, z))
#define CmdMatches(...) (Cmd != nullptr && CmdMatches_fn(Cmd, __VA_ARGS__))

static bool addArgumentsCycles(std::vector<CommandLine::Args> &Args, char const * const Cmd)/*{{{*/
{
   if (CmdMatches("check"))
      addArg('p', "pending", "Automark::Cycles::Pending-File", CommandLine::HasArg);
   else if (CmdMatches("show"))
      addArg(0, "columns", "Automark::Output::Columns", 0);
   else if (CmdMatches("acyclic", "cycles", "nodes") == false)
      return false;

   addArg(0, "color", "Automark::Color", 0);
   addArg(0, "colour", "Automark::Color", 0);
   return true;
}
									/*}}}*/
std::vector<CommandLine::Args> getCommandArgs(char const * const Cmd)/*{{{*/
{
   std::vector<CommandLine::Args> Args;
   Args.reserve(20);
   if (Cmd != nullptr && strcmp(Cmd, "help") == 0)
      ; // no options for help so no need to implement it in each
   else
      addArgumentsCycles(Args, Cmd);

   // options without a command
   addArg('h', "help", "help", 0);
   addArg('v', "version", "version", 0);
   // general options
   addArg('q', "quiet", "quiet", CommandLine::IntLevel);
   addArg('q', "silent", "quiet", CommandLine::IntLevel);
   addArg('c', "config-file", 0, CommandLine::ConfigFile);
   addArg('o', "option", 0, CommandLine::ArbItem);
   addArg(0, nullptr, nullptr, 0);

   return Args;
}
									/*}}}*/
#undef addArg
#undef CmdMatches
static void ShowHelpListCommands(std::vector<automarkDispatchWithHelp> const &Cmds)/*{{{*/
{
   if (Cmds.empty() || Cmds[0].Match == nullptr)
      return;
   std::cout << std::endl << _("Most used commands:") << std::endl;
   for (auto const &c: Cmds)
   {
      if (c.Help == nullptr)
	 continue;
      std::cout << "  " << c.Match << " - " << c.Help << std::endl;
   }
}
									/*}}}*/
static bool ShowCommonHelp(CommandLine &CmdL, std::vector<automarkDispatchWithHelp> const &Cmds,/*{{{*/
      bool (*ShowHelp)(CommandLine &))
{
   std::cout << PACKAGE << " " << pkgVersion << " (libautomark-pkg " << pkgLibVersion << ")" << std::endl;
   if (_config->FindB("version") == true)
      return true;
   if (ShowHelp(CmdL) == false)
      return false;
   ShowHelpListCommands(Cmds);
   std::cout << std::endl;
   ioprintf(std::cout, _("Configuration options and syntax is detailed in %s.\n"), "automark.conf(5)");
   return true;
}
									/*}}}*/
std::vector<CommandLine::Dispatch> ParseCommandLine(CommandLine &CmdL,/*{{{*/
      Configuration * const * const Cnf, int const argc, const char *argv[],
      bool (*ShowHelp)(CommandLine &), std::vector<automarkDispatchWithHelp> (*GetCommands)(void))
{
   InitLocale();
   if (Cnf != nullptr && pkgInitConfig(**Cnf) == false)
   {
      _error->DumpErrors();
      exit(100);
   }

   if (likely(argc != 0 && argv[0] != nullptr))
      _config->Set("Binary", flNotDir(argv[0]));

   std::vector<CommandLine::Dispatch> Cmds;
   std::vector<automarkDispatchWithHelp> const CmdsWithHelp = GetCommands();
   if (CmdsWithHelp.empty() == false)
   {
      CommandLine::Dispatch const help = { "help", [](CommandLine &){return false;} };
      Cmds.push_back(help);
   }
   std::transform(CmdsWithHelp.begin(), CmdsWithHelp.end(), std::back_inserter(Cmds),
		  [](automarkDispatchWithHelp const &cmd) { return CommandLine::Dispatch{cmd.Match, cmd.Handler}; });

   char const * CmdCalled = nullptr;
   if (Cmds.empty() == false && Cmds[0].Handler != nullptr)
      CmdCalled = CommandLine::GetCommand(Cmds.data(), argc, argv);

   // Args running out of scope invalidates the pointer stored in CmdL,
   // it is only used while parsing below though.
   auto Args = getCommandArgs(CmdCalled);
   CmdL = CommandLine(Args.data(), _config);

   if (CmdL.Parse(argc,argv) == false)
   {
      if (_config->FindB("version") == true)
	 ShowCommonHelp(CmdL, CmdsWithHelp, ShowHelp);

      _error->DumpErrors();
      exit(100);
   }

   // See if the help should be shown
   if (_config->FindB("help") == true || _config->FindB("version") == true ||
	 (CmdL.FileSize() > 0 && strcmp(CmdL.FileList[0], "help") == 0))
   {
      ShowCommonHelp(CmdL, CmdsWithHelp, ShowHelp);
      exit(0);
   }
   if (Cmds.empty() == false && CmdL.FileSize() == 0)
   {
      ShowCommonHelp(CmdL, CmdsWithHelp, ShowHelp);
      exit(1);
   }
   return Cmds;
}
									/*}}}*/
unsigned short DispatchCommandLine(CommandLine &CmdL, std::vector<CommandLine::Dispatch> const &Cmds)	/*{{{*/
{
   // Match the operation
   bool const returned = Cmds.empty() ? true : CmdL.DispatchArg(Cmds.data());

   // Print any errors or warnings found during parsing
   bool const Errors = _error->PendingError();
   if (_config->FindI("quiet",0) > 0)
      _error->DumpErrors();
   else
      _error->DumpErrors(GlobalError::DEBUG);
   if (returned == false)
      return 100;
   return Errors == true ? 100 : 0;
}
									/*}}}*/
