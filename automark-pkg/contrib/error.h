// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Global error mechanism

   This class has a single (thread local) instance. When a function
   needs to report a problem, such as an unreadable input file or a
   detection result disagreeing with what the caller knows, it calls a
   member in this class to add a message to a stack of messages.

   All reporting functions return false so the usual idiom is
     if (Input.is_open() == false)
        return _error->Errno("open", _("Could not open %s"), File);

   A Warning should not force the return of false. Things did not fail,
   but they might have had unexpected problems. Messages are kept in a
   FIFO so Pop will return the oldest item first.

   This file had this historic note, but now includes further changes
   under the GPL-2.0+:

   This source is placed in the Public Domain, do with it what you will
   It was originally written by Jason Gunthorpe.

   ##################################################################### */
									/*}}}*/
#ifndef AUTOMARKLIB_ERROR_H
#define AUTOMARKLIB_ERROR_H

#include <automark-pkg/macros.h>

#include <iostream>
#include <list>
#include <string>

#include <cstdarg>
#include <cstddef>

class AUTOMARK_PUBLIC GlobalError					/*{{{*/
{
public:									/*{{{*/
	/** \brief a message can have one of following severity */
	enum MsgType {
		/** \brief Message will be printed instantly as the result
			can not be trusted anymore, e.g. on inconsistencies */
		FATAL = 40,
		/** \brief An error does hinder the correct execution and should be corrected */
		ERROR = 30,
		/** \brief indicates problem that can lead to errors later on */
		WARNING = 20,
		/** \brief deprecation warnings, old fallback behavior, … */
		NOTICE = 10,
		/** \brief for developers only in areas it is hard to print something directly */
		DEBUG = 0
	};

	/** \brief add a fatal error message with errno to the list
	 *
	 *  \param Function name of the function generating the error
	 *  \param Description format string for the error message
	 *
	 *  \return \b false
	 */
	bool FatalE(const char *Function,const char *Description,...) AUTOMARK_PRINTF(3) AUTOMARK_COLD;

	/** \brief add an Error message with errno to the list
	 *
	 *  \param Function name of the function generating the error
	 *  \param Description format string for the error message
	 *
	 *  \return \b false
	 */
	bool Errno(const char *Function,const char *Description,...) AUTOMARK_PRINTF(3) AUTOMARK_COLD;

	/** \brief add a warning message with errno to the list
	 *
	 *  \param Function Name of the function generates the warning.
	 *  \param Description Format string for the warning message.
	 *
	 *  \return \b false
	 */
	bool WarningE(const char *Function,const char *Description,...) AUTOMARK_PRINTF(3) AUTOMARK_COLD;
	bool NoticeE(const char *Function,const char *Description,...) AUTOMARK_PRINTF(3) AUTOMARK_COLD;
	bool DebugE(const char *Function,const char *Description,...) AUTOMARK_PRINTF(3) AUTOMARK_COLD;

	/** \brief add a fatal error message to the list
	 *
	 *  A fatal message is printed directly to std::clog in addition to
	 *  adding it to the list. It is used for problems which mean the
	 *  computed result is wrong, so it should be seen even if the
	 *  caller never gets around to dump the list.
	 *
	 *  \param Description Format string for the fatal error message.
	 *
	 *  \return \b false
	 */
	bool Fatal(const char *Description,...) AUTOMARK_PRINTF(2) AUTOMARK_COLD;

	/** \brief add an Error message to the list
	 *
	 *  \param Description Format string for the error message.
	 *
	 *  \return \b false
	 */
	bool Error(const char *Description,...) AUTOMARK_PRINTF(2) AUTOMARK_COLD;

	/** \brief add a warning message to the list
	 *
	 *  A warning should be considered less severe than an error and
	 *  may be ignored by the client.
	 *
	 *  \param Description Format string for the message
	 *
	 *  \return \b false
	 */
	bool Warning(const char *Description,...) AUTOMARK_PRINTF(2) AUTOMARK_COLD;

	/** \brief add a notice message to the list
	 *
	 *  \param Description Format string for the message
	 *
	 *  \return \b false
	 */
	bool Notice(const char *Description,...) AUTOMARK_PRINTF(2) AUTOMARK_COLD;

	/** \brief add a debug message to the list
	 *
	 *  \param Description Format string for the message
	 *
	 *  \return \b false
	 */
	bool Debug(const char *Description,...) AUTOMARK_PRINTF(2) AUTOMARK_COLD;

	/** \brief adds an error message with the given type
	 *
	 * \param type of the error message
	 * \param Description of the error
	 */
	bool Insert(MsgType const &type, const char* Description,...) AUTOMARK_PRINTF(3) AUTOMARK_COLD;

	/** \brief is an error in the list?
	 *
	 *  \return \b true if an error is included in the list, \b false otherwise
	 */
	inline bool PendingError() const AUTOMARK_PURE {return PendingFlag;};

	/** \brief is the list empty?
	 *
	 *  Can be used to check if the current stack level doesn't include
	 *  anything equal or more severe than a given threshold, defaulting
	 *  to warning level.
	 *
	 *  \param threshold minimum level considered
	 *
	 *  \return \b true if the list is empty, \b false otherwise
	 */
	bool empty(MsgType const &threshold = WARNING) const AUTOMARK_PURE;

	/** \brief returns and removes the first message in the list
	 *
	 *  \param[out] Text message of the first item
	 *
	 *  \return \b true if the message was an error, \b false otherwise
	 */
	bool PopMessage(std::string &Text);

	/** \brief clears the list of messages */
	void Discard();

	/** \brief outputs the list of messages to the given stream
	 *
	 *  Note that all messages are discarded, even undisplayed ones.
	 *
	 *  \param[out] out output stream to write the messages in
	 *  \param threshold minimum level considered
	 *  \param mergeStack if true recursively dumps the entire stack
	 */
	void DumpErrors(std::ostream &out, MsgType const &threshold = WARNING,
			bool const &mergeStack = true);

	/** \brief dumps the list of messages to std::cerr */
	void inline DumpErrors(MsgType const &threshold) {
		DumpErrors(std::cerr, threshold);
	}
	void inline DumpErrors() {
		DumpErrors(WARNING);
	}

	/** \brief put the current Messages into the stack
	 *
	 *  All "old" messages will be pushed into a stack to
	 *  them later back, but for now the Message query will be
	 *  empty and performs as no messages were present before.
	 *
	 * The stack can be as deep as you want - all stack operations
	 * will only operate on the last element in the stack.
	 */
	void PushToStack();

	/** \brief throw away all current messages */
	void RevertToStack();

	/** \brief merge current and stack together */
	void MergeWithStack();

	/** \brief return the deep of the stack */
	size_t StackCount() const AUTOMARK_PURE {
		return Stacks.size();
	}

	GlobalError();
									/*}}}*/
private:								/*{{{*/
	struct Item {
		std::string Text;
		MsgType Type;

		Item(std::string Text, MsgType const &Type) :
			Text(std::move(Text)), Type(Type) {};

		AUTOMARK_HIDDEN friend std::ostream &operator<<(std::ostream &out, Item const &i);
	};

	AUTOMARK_HIDDEN friend std::ostream &operator<<(std::ostream &out, Item const &i);

	AUTOMARK_HIDDEN void InsertFormatted(MsgType type, std::string Text);

	std::list<Item> Messages;
	bool PendingFlag;

	struct MsgStack {
		std::list<Item> Messages;
		bool const PendingFlag;

		MsgStack(std::list<Item> const &Messages, bool const &Pending) :
			 Messages(Messages), PendingFlag(Pending) {};
	};

	std::list<MsgStack> Stacks;
									/*}}}*/
};
									/*}}}*/

// The 'extra-ansi' syntax is used to help with collisions.
AUTOMARK_PUBLIC GlobalError *_GetErrorObj();
static struct {
	inline GlobalError* operator ->() { return _GetErrorObj(); }
} _error AUTOMARK_UNUSED;

#endif
