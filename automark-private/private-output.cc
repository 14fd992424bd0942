// Include files							/*{{{*/
#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/error.h>
#include <automark-pkg/strutl.h>

#include <automark-private/private-output.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <sys/ioctl.h>
#include <unistd.h>

#include <automarki18n.h>
									/*}}}*/

using namespace std;

std::ostream c0out(0);
std::ostream c1out(0);
std::ofstream devnull("/dev/null");

unsigned int ScreenWidth = 80 - 1; /* - 1 for the cursor */

// SigWinch - Window size change signal handler				/*{{{*/
static void SigWinch(int)
{
   // Riped from GNU ls
#ifdef TIOCGWINSZ
   struct winsize ws;

   if (ioctl(1, TIOCGWINSZ, &ws) != -1 && ws.ws_col >= 5)
      ScreenWidth = ws.ws_col - 1;
#endif
}
									/*}}}*/
bool InitOutput(std::basic_streambuf<char> * const out)			/*{{{*/
{
   bool const tty = isatty(STDOUT_FILENO) != 0;
   if (tty == false && _config->FindI("quiet", -1) == -1)
      _config->Set("quiet","1");

   c0out.rdbuf(out);
   c1out.rdbuf(out);
   if (_config->FindI("quiet",0) > 0)
      c0out.rdbuf(devnull.rdbuf());
   if (_config->FindI("quiet",0) > 1)
      c1out.rdbuf(devnull.rdbuf());

   // deal with window size changes
   auto cols = getenv("COLUMNS");
   if (cols != nullptr)
   {
      char * colends;
      auto const sw = strtoul(cols, &colends, 10);
      if (*colends != '\0' || sw == 0)
      {
	 _error->Warning("Environment variable COLUMNS was ignored as it has an invalid value: \"%s\"", cols);
	 cols = nullptr;
      }
      else
	 ScreenWidth = sw;
   }
   if (cols == nullptr)
   {
      signal(SIGWINCH,SigWinch);
      SigWinch(0);
   }

   _config->CndSet("Automark::Output::Columns", tty);

   if (tty == false || _config->FindB("Automark::Color", true) == false || getenv("NO_COLOR") != nullptr)
   {
      _config->Set("Automark::Color", false);
      _config->Set("Automark::Color::Highlight", "");
      _config->Set("Automark::Color::Neutral", "");
   } else {
      _config->Set("Automark::Color", true);
      // Colors
      _config->CndSet("Automark::Color::Highlight", "\x1B[32m");
      _config->CndSet("Automark::Color::Bold", "\x1B[1m");
      _config->CndSet("Automark::Color::Neutral", "\x1B[0m");

      _config->CndSet("Automark::Color::Red", "\x1B[31m");
      _config->CndSet("Automark::Color::Green", "\x1B[32m");
      _config->CndSet("Automark::Color::Yellow", "\x1B[33m");

      _config->CndSet("Automark::Color::Action::Auto", "green");
      _config->CndSet("Automark::Color::Action::Cycle", "yellow");
   }

   return true;
}
									/*}}}*/
// OutputColor - escape sequence for a color or a role			/*{{{*/
std::string OutputColor(std::string const &Name)
{
   if (Name.empty() == true || _config->FindB("Automark::Color", false) == false)
      return "";
   std::string const Value = _config->Find("Automark::Color::" + Name);
   if (Value.empty() == true || Value[0] == '\x1B')
      return Value;
   // a role names another color
   return _config->Find("Automark::Color::" + Value);
}
									/*}}}*/
// ShowWithColumns - Show a list in the style of ls			/*{{{*/
// ---------------------------------------------------------------------
/* This prints out a vector of strings with the given indent and in as
   many columns as will fit the screen width.

   The output looks like:
  libfoo-common   libfoo1         python3-foo
  libfoo-dev      libfoo1-dbg
 */
struct columnInfo
{
   bool ValidLen;
   size_t LineWidth;
   vector<size_t> RemainingWidths;
};
void ShowWithColumns(ostream &out, vector<string> const &List, size_t Indent, size_t ScreenWidth)
{
   constexpr size_t MinColumnWidth = 2;
   constexpr size_t ColumnSpace = 2;

   size_t const ListSize = List.size();
   if (ListSize == 0)
      return;
   size_t const MaxScreenCols = (ScreenWidth > Indent) ? (ScreenWidth - Indent) / MinColumnWidth : 1;
   size_t const MaxNumCols = std::max<size_t>(1, min(MaxScreenCols, ListSize));

   vector<columnInfo> ColumnInfo(MaxNumCols);
   for (size_t I = 0; I < MaxNumCols; ++I) {
      ColumnInfo[I].ValidLen = true;
      ColumnInfo[I].LineWidth = (I + 1) * MinColumnWidth;
      ColumnInfo[I].RemainingWidths.resize(I + 1, MinColumnWidth);
   }

   for (size_t I = 0; I < ListSize; ++I) {
      for (size_t J = 0; J < MaxNumCols; ++J) {
	 auto &Col = ColumnInfo[J];
	 if (Col.ValidLen == false)
	    continue;

	 size_t const Idx = I / ((ListSize + J) / (J + 1));
	 size_t const RealColLen = List[I].size() + (Idx == J ? 0 : ColumnSpace);
	 if (Col.RemainingWidths[Idx] < RealColLen) {
	    Col.LineWidth += RealColLen - Col.RemainingWidths[Idx];
	    Col.RemainingWidths[Idx] = RealColLen;
	    Col.ValidLen = Col.LineWidth < ScreenWidth;
	 }
      }
   }
   size_t NumCols = MaxNumCols;
   while (NumCols > 1 && ColumnInfo[NumCols - 1].ValidLen == false)
      --NumCols;

   size_t const NumRows = ListSize / NumCols + (ListSize % NumCols != 0);
   auto const &LineFormat = ColumnInfo[NumCols - 1];
   for (size_t Row = 0; Row < NumRows; ++Row) {
      size_t Col = 0;
      size_t I = Row;
      out << string(Indent, ' ');
      while (true) {
	 out << List[I];

	 size_t const CurLen = List[I].size();
	 size_t const MaxLen = LineFormat.RemainingWidths[Col++];
	 I += NumRows;
	 if (I >= ListSize)
	    break;

	 out << string(MaxLen - CurLen, ' ');
      }
      out << endl;
   }
}
									/*}}}*/
