// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Global error mechanism

   We use a simple STL list to store each error record. A PendingFlag
   is kept which indicates when the list contains a severe error.

   This source is placed in the Public Domain, do with it what you will
   It was originally written by Jason Gunthorpe.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/error.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <list>
#include <string>
#include <vector>
#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
									/*}}}*/

// Global Error Object							/*{{{*/
GlobalError *_GetErrorObj()
{
   static thread_local GlobalError Obj;
   return &Obj;
}
									/*}}}*/
// VFormat - printf into a std::string of the needed size		/*{{{*/
static std::string VFormat(const char *Description, va_list args)
{
   va_list copy;
   va_copy(copy, args);
   std::vector<char> S(400);
   int const n = vsnprintf(S.data(), S.size(), Description, args);
   if (n > -1 && static_cast<size_t>(n) >= S.size())
   {
      S.resize(n + 1);
      vsnprintf(S.data(), S.size(), Description, copy);
   }
   va_end(copy);
   if (n < 0)
      return Description;
   return std::string(S.data(), n);
}
									/*}}}*/
// GlobalError::GlobalError - Constructor				/*{{{*/
GlobalError::GlobalError() : PendingFlag(false) {}
									/*}}}*/
// GlobalError::FatalE, Errno, WarningE, NoticeE and DebugE - Add to the list/*{{{*/
#define GEMessage(NAME, TYPE) \
bool GlobalError::NAME (const char *Function, const char *Description,...) { \
	int const errsv = errno; \
	va_list args; \
	va_start(args,Description); \
	std::string Text = VFormat(Description, args); \
	va_end(args); \
	Text.append(" - ").append(Function).append(" (").append(std::to_string(errsv)) \
	   .append(": ").append(strerror(errsv)).append(")"); \
	InsertFormatted(TYPE, std::move(Text)); \
	return false; \
}
GEMessage(FatalE, FATAL)
GEMessage(Errno, ERROR)
GEMessage(WarningE, WARNING)
GEMessage(NoticeE, NOTICE)
GEMessage(DebugE, DEBUG)
#undef GEMessage
									/*}}}*/
// GlobalError::Fatal, Error, Warning, Notice and Debug - Add to the list/*{{{*/
#define GEMessage(NAME, TYPE) \
bool GlobalError::NAME (const char *Description,...) { \
	va_list args; \
	va_start(args,Description); \
	InsertFormatted(TYPE, VFormat(Description, args)); \
	va_end(args); \
	return false; \
}
GEMessage(Fatal, FATAL)
GEMessage(Error, ERROR)
GEMessage(Warning, WARNING)
GEMessage(Notice, NOTICE)
GEMessage(Debug, DEBUG)
#undef GEMessage
									/*}}}*/
// GlobalError::Insert - Add a errotype message to the list		/*{{{*/
bool GlobalError::Insert(MsgType const &type, const char *Description,...)
{
   va_list args;
   va_start(args,Description);
   InsertFormatted(type, VFormat(Description, args));
   va_end(args);
   return false;
}
									/*}}}*/
// GlobalError::InsertFormatted - Insert a new item at the end		/*{{{*/
void GlobalError::InsertFormatted(MsgType type, std::string Text)
{
   Messages.emplace_back(std::move(Text), type);
   Item const &m = Messages.back();

   if (type == ERROR || type == FATAL)
      PendingFlag = true;

   if (type == FATAL || type == DEBUG)
      std::clog << m << std::endl;
}
									/*}}}*/
// GlobalError::PopMessage - Pulls a single message out			/*{{{*/
bool GlobalError::PopMessage(std::string &Text) {
   if (Messages.empty() == true)
      return false;

   Item const msg = Messages.front();
   Messages.pop_front();

   bool const Ret = (msg.Type == ERROR || msg.Type == FATAL);
   Text = msg.Text;
   if (PendingFlag == false || Ret == false)
      return Ret;

   // check if another error message is pending
   if (std::any_of(Messages.begin(), Messages.end(), [](Item const &m) {
	    return m.Type == ERROR || m.Type == FATAL; }))
      return Ret;

   PendingFlag = false;
   return Ret;
}
									/*}}}*/
// GlobalError::DumpErrors - Dump all of the errors/warns to cerr	/*{{{*/
void GlobalError::DumpErrors(std::ostream &out, MsgType const &threshold,
			     bool const &mergeStack) {
   if (mergeStack == true)
      for (auto s = Stacks.rbegin(); s != Stacks.rend(); ++s)
	 std::copy(s->Messages.rbegin(), s->Messages.rend(), std::front_inserter(Messages));

   for (auto const &m : Messages)
      if (m.Type >= threshold)
	 out << m << std::endl;

   Discard();
}
									/*}}}*/
// GlobalError::Discard - Discard					/*{{{*/
void GlobalError::Discard() {
   Messages.clear();
   PendingFlag = false;
}
									/*}}}*/
// GlobalError::empty - does our error list include anything?		/*{{{*/
bool GlobalError::empty(MsgType const &threshold) const {
   if (PendingFlag == true)
      return false;

   if (Messages.empty() == true)
      return true;

   return std::find_if(Messages.begin(), Messages.end(), [&threshold](Item const &m) {
      return m.Type >= threshold;
   }) == Messages.end();
}
									/*}}}*/
// GlobalError::PushToStack						/*{{{*/
void GlobalError::PushToStack() {
   Stacks.emplace_back(Messages, PendingFlag);
   Discard();
}
									/*}}}*/
// GlobalError::RevertToStack						/*{{{*/
void GlobalError::RevertToStack() {
   Discard();
   MsgStack pack = Stacks.back();
   Messages = pack.Messages;
   PendingFlag = pack.PendingFlag;
   Stacks.pop_back();
}
									/*}}}*/
// GlobalError::MergeWithStack						/*{{{*/
void GlobalError::MergeWithStack() {
   MsgStack pack = Stacks.back();
   Messages.splice(Messages.begin(), pack.Messages);
   PendingFlag = PendingFlag || pack.PendingFlag;
   Stacks.pop_back();
}
									/*}}}*/
// GlobalError::Item::operator<<					/*{{{*/
std::ostream &operator<<(std::ostream &out, GlobalError::Item const &i)
{
   static constexpr auto COLOR_RESET = "\033[0m";
   static constexpr auto COLOR_NOTICE = "\033[33m";  // normal yellow
   static constexpr auto COLOR_WARN = "\033[1;33m";  // bold yellow
   static constexpr auto COLOR_ERROR = "\033[1;31m"; // bold red

   bool const use_color = _config->FindB("Automark::Color", false);
   char const *color = nullptr;
   char prefix = 'D';
   switch (i.Type)
   {
   case GlobalError::FATAL:
   case GlobalError::ERROR:
      color = COLOR_ERROR;
      prefix = 'E';
      break;
   case GlobalError::WARNING:
      color = COLOR_WARN;
      prefix = 'W';
      break;
   case GlobalError::NOTICE:
      color = COLOR_NOTICE;
      prefix = 'N';
      break;
   case GlobalError::DEBUG:
      break;
   }

   if (use_color && color != nullptr)
      out << color << prefix << ": " << COLOR_RESET;
   else
      out << prefix << ": ";

   // continuation lines are indented below the text
   std::string::size_type line_start = 0;
   std::string::size_type line_end;
   while ((line_end = i.Text.find_first_of("\n\r", line_start)) != std::string::npos)
   {
      if (line_start != 0)
	 out << std::endl << "   ";
      out << i.Text.substr(line_start, line_end - line_start);
      line_start = i.Text.find_first_not_of("\n\r", line_end + 1);
      if (line_start == std::string::npos)
	 break;
   }
   if (line_start == 0)
      out << i.Text;
   else if (line_start != std::string::npos)
      out << std::endl << "   " << i.Text.substr(line_start);

   return out;
}
									/*}}}*/
