#ifndef AUTOMARK_PRIVATE_CMNDLINE_H
#define AUTOMARK_PRIVATE_CMNDLINE_H

#include <automark-pkg/cmndline.h>
#include <automark-pkg/macros.h>

#include <vector>

class Configuration;

struct automarkDispatchWithHelp
{
   const char *Match;
   bool (*Handler)(CommandLine &);
   const char *Help;
};

AUTOMARK_PUBLIC std::vector<CommandLine::Dispatch> ParseCommandLine(CommandLine &CmdL,
      Configuration * const * const Cnf, int const argc, const char * argv[],
      bool (*ShowHelp)(CommandLine &), std::vector<automarkDispatchWithHelp> (*GetCommands)(void));
AUTOMARK_PUBLIC unsigned short DispatchCommandLine(CommandLine &CmdL, std::vector<CommandLine::Dispatch> const &Cmds);

AUTOMARK_PUBLIC std::vector<CommandLine::Args> getCommandArgs(char const * const Cmd);

#endif
