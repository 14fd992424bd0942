// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* #####################################################################
   automark-cycles - find packages kept installed by dependency cycles
   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <automark-pkg/cmndline.h>
#include <automark-pkg/configuration.h>
#include <automark-pkg/error.h>
#include <automark-pkg/init.h>

#include <automark-private/private-cmndline.h>
#include <automark-private/private-cycles.h>
#include <automark-private/private-main.h>
#include <automark-private/private-output.h>

#include <iostream>
#include <vector>

#include <automarki18n.h>
									/*}}}*/

static bool ShowHelp(CommandLine &)					/*{{{*/
{
   std::cout <<
    _("Usage: automark-cycles [options] command [file ...]\n"
      "\n"
      "automark-cycles reads package metadata blocks of packages which\n"
      "should be marked as automatically installed but are still needed\n"
      "by another package. It lists the packages whose dependencies end\n"
      "without a cycle and the dependency cycles keeping the others.\n"
      "Without a file, or with -, the blocks are read from stdin.\n");
   return true;
}
									/*}}}*/
static std::vector<automarkDispatchWithHelp> GetCommands()		/*{{{*/
{
   return {
      {"acyclic", &DoAcyclic, _("Print the packages which can be marked as automatically installed")},
      {"cycles", &DoCycles, _("Print the dependency cycles, one per line")},
      {"nodes", &DoNodes, _("Print all packages taking part in the dependency graph")},
      {"show", &DoShow, _("Show a report of the packages and cycles found")},
      {"check", &DoCheck, _("Verify the cycles against the packages with a pending action")},
      {nullptr, nullptr, nullptr}
   };
}
									/*}}}*/
int main(int argc,const char *argv[])					/*{{{*/
{
   InitSignals();

   CommandLine CmdL;
   auto const Cmds = ParseCommandLine(CmdL, &_config, argc, argv, &ShowHelp, &GetCommands);

   InitOutput();

   return DispatchCommandLine(CmdL, Cmds);
}
									/*}}}*/
