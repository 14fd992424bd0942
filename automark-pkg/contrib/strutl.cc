// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   String Util - Some useful string functions.

   These are here for the config parser, the command line parser and the
   output code which all need some of the same small helpers.

   This source is placed in the Public Domain, do with it what you will
   It was originally written by Jason Gunthorpe <jgg@gpu.srv.ualberta.ca>

   ##################################################################### */
									/*}}}*/
// Includes								/*{{{*/
#include <config.h>

#include <automark-pkg/strutl.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>
									/*}}}*/
using namespace std;

// Strip, Endswith, Startswith and Join					/*{{{*/
namespace AutoMark {
   namespace String {
std::string Strip(const std::string &str)
{
   auto const notspace = [](unsigned char const c) { return isspace(c) == 0; };
   auto const start = std::find_if(str.begin(), str.end(), notspace);
   if (start == str.end())
      return "";
   auto const end = std::find_if(str.rbegin(), str.rend(), notspace).base();
   return std::string(start, end);
}
bool Endswith(const std::string &s, const std::string &end)
{
   return end.size() <= s.size() &&
      s.compare(s.size() - end.size(), end.size(), end) == 0;
}
bool Startswith(const std::string &s, const std::string &start)
{
   return start.size() <= s.size() && s.compare(0, start.size(), start) == 0;
}
std::string Join(std::vector<std::string> list, const std::string &sep)
{
   std::string joined;
   for (auto it = list.begin(); it != list.end(); ++it)
   {
      if (it != list.begin())
	 joined.append(sep);
      joined.append(*it);
   }
   return joined;
}
   }
}
									/*}}}*/
// ParseQuoteWord - Parse a single word out of a string			/*{{{*/
// ---------------------------------------------------------------------
/* This parses a single word out of the string, a word ends at the first
   whitespace which isn't enclosed in double quotes. The quotes are
   dropped from the result and String is moved behind the word. */
bool ParseQuoteWord(const char *&String,string &Res)
{
   const char *C = String;
   for (; *C != 0 && isspace(*C) != 0; ++C);
   if (*C == 0)
      return false;

   Res.clear();
   bool InQuote = false;
   for (; *C != 0 && (InQuote == true || isspace(*C) == 0); ++C)
   {
      if (*C == '"')
      {
	 InQuote = !InQuote;
	 continue;
      }
      Res.push_back(*C);
   }
   if (InQuote == true)
      return false;

   // skip the trailing whitespace
   for (; *C != 0 && isspace(*C) != 0; ++C);
   String = C;
   return true;
}
									/*}}}*/
// StringToBool - Converts a string into a boolean			/*{{{*/
// ---------------------------------------------------------------------
/* This inspects the string to see if it is true or if it is false and
   then returns the result. Several variants on true/false are checked. */
int StringToBool(const string &Text,int Default)
{
   if (Text == "0")
      return 0;
   if (Text == "1")
      return 1;

   static char const * const Negatives[] = { "no", "false", "without", "off", "disable" };
   static char const * const Positives[] = { "yes", "true", "with", "on", "enable" };
   for (auto const N : Negatives)
      if (strcasecmp(Text.c_str(), N) == 0)
	 return 0;
   for (auto const P : Positives)
      if (strcasecmp(Text.c_str(), P) == 0)
	 return 1;

   return Default;
}
									/*}}}*/
// VectorizeString - split a string into a string vector by token	/*{{{*/
vector<string> VectorizeString(string const &haystack, char const &split)
{
   vector<string> exploded;
   if (haystack.empty() == true)
      return exploded;
   string::size_type start = 0;
   while (true)
   {
      string::size_type const end = haystack.find(split, start);
      if (end == string::npos)
      {
	 exploded.emplace_back(haystack, start);
	 break;
      }
      exploded.emplace_back(haystack, start, end - start);
      start = end + 1;
      if (start == haystack.length())
	 break;
   }
   return exploded;
}
									/*}}}*/
// ioprintf - C format string outputter to C++ iostreams		/*{{{*/
// ---------------------------------------------------------------------
/* This is used to make the internationalization strings easier to translate
   and to allow reordering of parameters */
static string iovprintf(const char *format, va_list &args)
{
   va_list copy;
   va_copy(copy, args);
   vector<char> S(400);
   int const n = vsnprintf(S.data(), S.size(), format, args);
   if (n > -1 && static_cast<size_t>(n) >= S.size())
   {
      S.resize(n + 1);
      vsnprintf(S.data(), S.size(), format, copy);
   }
   va_end(copy);
   if (n < 0)
      return string();
   return string(S.data(), n);
}
void ioprintf(ostream &out,const char *format,...)
{
   va_list args;
   va_start(args,format);
   out << iovprintf(format, args);
   va_end(args);
}
void strprintf(string &out,const char *format,...)
{
   va_list args;
   va_start(args,format);
   out = iovprintf(format, args);
   va_end(args);
}
									/*}}}*/
// stringcasecmp - case insensitive string compare			/*{{{*/
int stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd)
{
   for (; A != AEnd && B != BEnd; ++A, ++B)
      if (tolower(static_cast<unsigned char>(*A)) != tolower(static_cast<unsigned char>(*B)))
	 break;

   if (A == AEnd && B == BEnd)
      return 0;
   if (A == AEnd)
      return 1;
   if (B == BEnd)
      return -1;
   if (tolower(static_cast<unsigned char>(*A)) < tolower(static_cast<unsigned char>(*B)))
      return -1;
   return 1;
}
									/*}}}*/
// SubstVar - Substitute a string for another string			/*{{{*/
string SubstVar(const string &Str,const string &Subst,const string &Contents)
{
   if (Subst.empty() == true)
      return Str;

   string Temp;
   string::size_type OldPos = 0;
   string::size_type Pos;
   while ((Pos = Str.find(Subst, OldPos)) != string::npos)
   {
      Temp.append(Str, OldPos, Pos - OldPos).append(Contents);
      OldPos = Pos + Subst.length();
   }
   Temp.append(Str, OldPos, string::npos);
   return Temp;
}
									/*}}}*/
