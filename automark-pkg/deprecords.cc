/*
 * deprecords.cc - dependency records from package metadata text
 *
 * SPDX-License-Identifier: GPL-2.0+
 */

#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/deprecords.h>
#include <automark-pkg/error.h>
#include <automark-pkg/strutl.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>

#include <automarki18n.h>

using std::string;

namespace AutoMark
{

static bool IsBlankLine(string const &Line)
{
   return std::all_of(Line.begin(), Line.end(), [](unsigned char const c) { return isspace(c) != 0; });
}

static string JoinNames(std::set<string> const &Names)
{
   return String::Join(std::vector<string>(Names.begin(), Names.end()), " ");
}

std::vector<string> SplitDependencyValue(string const &Value)
{
   // drop the version constraints and all whitespace in one go
   string stripped;
   stripped.reserve(Value.size());
   int depth = 0;
   for (char const c : Value)
   {
      if (c == '(')
	 ++depth;
      else if (c == ')')
      {
	 if (depth != 0)
	    --depth;
      }
      else if (depth == 0 && isspace(static_cast<unsigned char>(c)) == 0)
	 stripped.push_back(c);
   }

   std::vector<string> names;
   string name;
   for (char const c : stripped)
   {
      if (c != ',' && c != '|')
      {
	 name.push_back(c);
	 continue;
      }
      if (name.empty() == false)
	 names.push_back(name);
      name.clear();
   }
   if (name.empty() == false)
      names.push_back(name);
   return names;
}

DepRecordParser::DepRecordParser(Configuration const &Cnf) : Debug(Cnf.FindB("Debug::Automark::Parser", false)),
							     state(State::BetweenBlocks), field(FieldKind::Dependency)
{
   DependencyFields = Cnf.FindVector("Automark::Cycles::Dependency-Fields", "PreDepends,Pre-Depends,Depends,Recommends");
   ProvidesField = Cnf.Find("Automark::Cycles::Provides-Field", "Provides");
}
DepRecordParser::DepRecordParser() : DepRecordParser(*_config)
{
}

void DepRecordParser::EndField()
{
   if (state != State::InField)
      return;
   state = State::InBlock;

   for (auto &name : SplitDependencyValue(fieldValue))
   {
      if (field == FieldKind::Dependency)
	 current.Depends.insert(std::move(name));
      else if (std::find(current.Provides.begin(), current.Provides.end(), name) == current.Provides.end())
	 current.Provides.push_back(std::move(name));
   }
   fieldValue.clear();
}

void DepRecordParser::EndBlock()
{
   EndField();
   if (state == State::BetweenBlocks)
      return;
   state = State::BetweenBlocks;

   DepRecord record;
   std::swap(record, current);
   if (record.Name.empty() == true || record.empty() == true)
      return;

   if (unlikely(Debug))
      std::clog << "Parser: record " << record.Name << " depends on [" << JoinNames(record.Depends)
		<< "] provides [" << String::Join(record.Provides, " ") << "]" << std::endl;

   auto const found = records.find(record.Name);
   if (found == records.end())
   {
      records.emplace(record.Name, std::move(record));
      return;
   }

   // a package listed twice contributes both of its blocks
   auto &merged = found->second;
   merged.Depends.insert(record.Depends.begin(), record.Depends.end());
   for (auto &name : record.Provides)
      if (std::find(merged.Provides.begin(), merged.Provides.end(), name) == merged.Provides.end())
	 merged.Provides.push_back(std::move(name));
}

void DepRecordParser::StartField(string const &Label, string const &Value)
{
   if (stringcasecmp(Label, "Package") == 0)
   {
      if (current.Name.empty() == false)
      {
	 EndBlock();
	 state = State::InBlock;
      }
      current.Name = String::Strip(Value);
      return;
   }

   if (stringcasecmp(Label, ProvidesField) == 0)
      field = FieldKind::Provides;
   else if (std::any_of(DependencyFields.begin(), DependencyFields.end(),
			[&](string const &F) { return stringcasecmp(Label, F) == 0; }))
      field = FieldKind::Dependency;
   else
      return;

   state = State::InField;
   fieldValue = Value;
}

void DepRecordParser::ParseLine(string const &Line)
{
   if (IsBlankLine(Line) == true)
   {
      EndBlock();
      return;
   }

   if (isspace(static_cast<unsigned char>(Line[0])) != 0)
   {
      // continuation of the field in progress, if there is one
      if (state == State::InField)
	 fieldValue.append(",").append(Line);
      return;
   }

   if (state == State::BetweenBlocks)
      state = State::InBlock;
   EndField();

   string::size_type const colon = Line.find(':');
   if (colon == string::npos)
      return;

   StartField(String::Strip(Line.substr(0, colon)), Line.substr(colon + 1));
}

void DepRecordParser::Finish()
{
   EndBlock();
}

bool DepRecordParser::Read(std::istream &In)
{
   string Line;
   while (std::getline(In, Line))
   {
      if (Line.empty() == false && Line.back() == '\r')
	 Line.pop_back();
      ParseLine(Line);
   }
   Finish();

   if (In.bad() == true)
      return _error->Error(_("Reading the package metadata failed"));
   return true;
}

bool DepRecordParser::Read(string const &Text)
{
   std::istringstream In(Text);
   return Read(In);
}

} // namespace AutoMark
