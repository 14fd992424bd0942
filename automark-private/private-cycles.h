#ifndef AUTOMARK_PRIVATE_CYCLES_H
#define AUTOMARK_PRIVATE_CYCLES_H

#include <automark-pkg/cyclefinder.h>
#include <automark-pkg/deprecords.h>
#include <automark-pkg/macros.h>

#include <iosfwd>
#include <set>
#include <string>
#include <vector>

class CommandLine;

// the metadata text given as files on the command line or on stdin
AUTOMARK_PUBLIC bool ReadCycleInput(CommandLine &CmdL, AutoMark::DepRecordParser &Parser);
AUTOMARK_PUBLIC bool ReadPendingFile(std::string const &File, std::set<std::string> &Pending);

AUTOMARK_PUBLIC void ReportNames(std::ostream &out, std::set<std::string> const &Names);
AUTOMARK_PUBLIC void ReportCycles(std::ostream &out, std::vector<std::string> const &Cycles, std::string const &Indent = "");
AUTOMARK_PUBLIC void ReportSummary(std::ostream &out, AutoMark::CycleReport const &Report);
AUTOMARK_PUBLIC void ShowCycleReport(std::ostream &out, AutoMark::CycleReport const &Report);
/** \brief each residual node must be one the caller still has to act on
 *
 * \return false with a fatal error per node missing from Pending */
AUTOMARK_PUBLIC bool VerifyResidual(AutoMark::CycleReport const &Report, std::set<std::string> const &Pending);

AUTOMARK_PUBLIC bool DoAcyclic(CommandLine &CmdL);
AUTOMARK_PUBLIC bool DoCycles(CommandLine &CmdL);
AUTOMARK_PUBLIC bool DoNodes(CommandLine &CmdL);
AUTOMARK_PUBLIC bool DoShow(CommandLine &CmdL);
AUTOMARK_PUBLIC bool DoCheck(CommandLine &CmdL);

#endif
