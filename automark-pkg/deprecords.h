/*
 * deprecords.h - dependency records from package metadata text
 *
 * SPDX-License-Identifier: GPL-2.0+
 */
#ifndef AUTOMARKLIB_DEPRECORDS_H
#define AUTOMARKLIB_DEPRECORDS_H

#include <automark-pkg/macros.h>

#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <vector>

class Configuration;

namespace AutoMark
{

/** \brief the dependency information of one concrete package
 *
 * Version constraints are dropped and alternatives are flattened, so
 * Depends holds every package named by any dependency field. */
struct DepRecord
{
   std::string Name;
   std::set<std::string> Depends;
   /// virtual names this package satisfies, in order of appearance
   std::vector<std::string> Provides;

   bool empty() const { return Depends.empty() && Provides.empty(); }
};

/**
 * \brief Parser for deb822 style package metadata blocks
 *
 * Blocks are separated by blank lines and consist of "Label: value"
 * fields. A value can be continued on lines starting with whitespace,
 * each continuation adds another comma separated chunk to the value.
 *
 * Which fields feed the dependency set and which one lists the provided
 * names is read from Automark::Cycles::Dependency-Fields and
 * Automark::Cycles::Provides-Field. Everything the parser doesn't
 * understand is skipped without an error.
 */
class AUTOMARK_PUBLIC DepRecordParser
{
   public:
   typedef std::map<std::string, DepRecord> RecordMap;

   private:
   enum class State
   {
      BetweenBlocks,
      InBlock,
      InField,
   };
   enum class FieldKind
   {
      Dependency,
      Provides,
   };

   std::vector<std::string> DependencyFields;
   std::string ProvidesField;
   bool Debug;

   State state;
   FieldKind field;
   std::string fieldValue;
   DepRecord current;
   RecordMap records;

   void EndField();
   void EndBlock();
   void StartField(std::string const &Label, std::string const &Value);

   public:
   /** \brief feed one line of input (without the newline) */
   void ParseLine(std::string const &Line);
   /** \brief the end of a stream also ends the block in progress */
   void Finish();

   /** \brief parse a whole stream
    *
    * \return false if reading failed, the records parsed so far are kept */
   bool Read(std::istream &In);
   bool Read(std::string const &Text);

   RecordMap const &Records() const { return records; }
   size_t size() const { return records.size(); }
   bool empty() const { return records.empty(); }

   explicit DepRecordParser(Configuration const &Cnf);
   DepRecordParser();
};

/** \brief split a field value into package names
 *
 * Parenthesized parts (version constraints), stray closing parentheses
 * and all whitespace are removed, the rest is split on ',' and '|' and
 * empty names dropped. */
AUTOMARK_PUBLIC std::vector<std::string> SplitDependencyValue(std::string const &Value);

} // namespace AutoMark

#endif
