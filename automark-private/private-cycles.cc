// Include Files							/*{{{*/
#include <config.h>

#include <automark-pkg/cmndline.h>
#include <automark-pkg/configuration.h>
#include <automark-pkg/cyclefinder.h>
#include <automark-pkg/deprecords.h>
#include <automark-pkg/error.h>
#include <automark-pkg/strutl.h>

#include <automark-private/private-cycles.h>
#include <automark-private/private-output.h>

#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <string.h>

#include <automarki18n.h>
									/*}}}*/

using AutoMark::CycleReport;
using AutoMark::DepRecordParser;

// ReadCycleInput - parse the files named after the command		/*{{{*/
// ---------------------------------------------------------------------
/* Each file is a stream of its own, so a block can't continue from one
   file into the next. No file or "-" reads stdin. */
bool ReadCycleInput(CommandLine &CmdL, DepRecordParser &Parser)
{
   if (CmdL.FileSize() <= 1)
      return Parser.Read(std::cin);

   for (const char **I = CmdL.FileList + 1; *I != nullptr; ++I)
   {
      if (strcmp(*I, "-") == 0)
      {
	 if (Parser.Read(std::cin) == false)
	    return false;
	 continue;
      }

      std::ifstream In(*I);
      if (In.is_open() == false)
	 return _error->Errno("open", _("Could not open file %s"), *I);
      if (Parser.Read(In) == false)
	 return _error->Error(_("Problem reading %s"), *I);
   }
   return true;
}
									/*}}}*/
// ReadPendingFile - names of the packages with a pending action	/*{{{*/
bool ReadPendingFile(std::string const &File, std::set<std::string> &Pending)
{
   std::ifstream In(File);
   if (In.is_open() == false)
      return _error->Errno("open", _("Could not open file %s"), File.c_str());

   std::string Line;
   while (std::getline(In, Line))
   {
      std::string::size_type const hash = Line.find('#');
      if (hash != std::string::npos)
	 Line.erase(hash);
      std::string const Name = AutoMark::String::Strip(Line);
      if (Name.empty() == false)
	 Pending.insert(Name);
   }
   if (In.bad() == true)
      return _error->Error(_("Problem reading %s"), File.c_str());
   return true;
}
									/*}}}*/
// Report* - formatting of the results					/*{{{*/
void ReportNames(std::ostream &out, std::set<std::string> const &Names)
{
   for (auto const &Name : Names)
      out << Name << std::endl;
}
void ReportCycles(std::ostream &out, std::vector<std::string> const &Cycles, std::string const &Indent)
{
   for (auto const &Cycle : Cycles)
      out << Indent << Cycle << std::endl;
}
void ReportSummary(std::ostream &out, CycleReport const &Report)
{
   ioprintf(out, _("%lu packages can be marked as automatically installed, %lu packages are held by %lu dependency cycles.\n"),
	 static_cast<unsigned long>(Report.Acyclic.size()),
	 static_cast<unsigned long>(Report.Residual.size()),
	 static_cast<unsigned long>(Report.Cycles.size()));
}
void ShowCycleReport(std::ostream &out, CycleReport const &Report)
{
   ShowList(out, _("The following packages can be marked as automatically installed:"), Report.Acyclic, "action::auto");
   if (Report.Cycles.empty() == false)
   {
      std::string const setColor = OutputColor("action::cycle");
      std::string const resetColor = setColor.empty() ? "" : OutputColor("neutral");
      out << _("The following dependency cycles keep packages installed:") << std::endl;
      for (auto const &Cycle : Report.Cycles)
	 out << "  " << setColor << Cycle << resetColor << std::endl;
   }
   ReportSummary(out, Report);
}
									/*}}}*/
// VerifyResidual - cross check the residual nodes with the caller	/*{{{*/
bool VerifyResidual(CycleReport const &Report, std::set<std::string> const &Pending)
{
   bool consistent = true;
   for (auto const &Name : Report.Residual)
   {
      if (Pending.find(Name) != Pending.end())
	 continue;
      _error->Fatal(_("Internal inconsistency: %s was found in a dependency cycle but has no pending action"), Name.c_str());
      consistent = false;
   }
   return consistent;
}
									/*}}}*/
static bool RunDetection(CommandLine &CmdL, CycleReport &Report)	/*{{{*/
{
   DepRecordParser Parser(*_config);
   if (ReadCycleInput(CmdL, Parser) == false)
      return false;
   Report = AutoMark::FindCycles(Parser.Records());
   return true;
}
									/*}}}*/
// Do* - the commands							/*{{{*/
bool DoAcyclic(CommandLine &CmdL)
{
   CycleReport Report;
   if (RunDetection(CmdL, Report) == false)
      return false;
   ReportNames(std::cout, Report.Acyclic);
   return true;
}
bool DoCycles(CommandLine &CmdL)
{
   CycleReport Report;
   if (RunDetection(CmdL, Report) == false)
      return false;
   ReportCycles(std::cout, Report.Cycles);
   return true;
}
bool DoNodes(CommandLine &CmdL)
{
   CycleReport Report;
   if (RunDetection(CmdL, Report) == false)
      return false;
   ReportNames(std::cout, Report.Nodes());
   return true;
}
bool DoShow(CommandLine &CmdL)
{
   CycleReport Report;
   if (RunDetection(CmdL, Report) == false)
      return false;
   ShowCycleReport(c1out, Report);
   return true;
}
bool DoCheck(CommandLine &CmdL)
{
   std::string const PendingFile = _config->FindFile("Automark::Cycles::Pending-File");
   if (PendingFile.empty() == true)
      return _error->Error(_("No file with pending packages given, use --pending"));

   std::set<std::string> Pending;
   if (ReadPendingFile(PendingFile, Pending) == false)
      return false;

   CycleReport Report;
   if (RunDetection(CmdL, Report) == false)
      return false;
   if (VerifyResidual(Report, Pending) == false)
      return false;
   ioprintf(c0out, _("All %lu packages held by dependency cycles have a pending action.\n"),
	 static_cast<unsigned long>(Report.Residual.size()));
   ReportCycles(std::cout, Report.Cycles);
   return true;
}
									/*}}}*/
