// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   This class provides a configuration file and command line parser
   for a tree-oriented configuration environment. All runtime configuration
   is stored in here.

   This source is placed in the Public Domain, do with it what you will
   It was originally written by Jason Gunthorpe <jgg@debian.org>.

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/error.h>
#include <automark-pkg/fileutl.h>
#include <automark-pkg/strutl.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stack>
#include <string>
#include <vector>

#include <ctype.h>
#include <stdlib.h>
#include <string.h>

#include <automarki18n.h>
									/*}}}*/
using namespace std;

Configuration *_config = new Configuration;

// Configuration::Configuration - Constructor				/*{{{*/
Configuration::Configuration() : Root(new Item)
{
}
									/*}}}*/
// Configuration::~Configuration - Destructor				/*{{{*/
Configuration::~Configuration() = default;
									/*}}}*/
// Configuration::Lookup - Lookup a single item				/*{{{*/
// ---------------------------------------------------------------------
/* This will lookup a single item by name below another item. It is a
   helper function for the main lookup function. An empty name matches
   nothing, with Create it appends a new anonymous list item. */
Configuration::Item *Configuration::Lookup(Item *Head,const char *S,
					   unsigned long const &Len,bool const &Create)
{
   if (Len != 0)
   {
      for (auto const &I : Head->Children)
	 if (Len == I->Tag.length() && stringcasecmp(I->Tag,S,S + Len) == 0)
	    return I.get();
   }

   if (Create == false)
      return nullptr;

   auto I = std::make_unique<Item>();
   I->Tag.assign(S,Len);
   I->Parent = Head;
   Head->Children.push_back(std::move(I));
   return Head->Children.back().get();
}
									/*}}}*/
// Configuration::Lookup - Lookup a fully scoped item			/*{{{*/
// ---------------------------------------------------------------------
/* This performs a fully scoped lookup of a given name, possibly creating
   new items */
Configuration::Item *Configuration::Lookup(const char *Name,bool const &Create)
{
   if (Name == nullptr)
      return Root.get();

   const char *Start = Name;
   const char *End = Start + strlen(Name);
   const char *TagEnd = Name;
   Item *Itm = Root.get();
   for (; End - TagEnd >= 2; TagEnd++)
   {
      if (TagEnd[0] == ':' && TagEnd[1] == ':')
      {
	 Itm = Lookup(Itm,Start,TagEnd - Start,Create);
	 if (Itm == nullptr)
	    return nullptr;
	 TagEnd = Start = TagEnd + 2;
      }
   }

   // This must be a trailing ::, we create unique items in a list
   if (End - Start == 0 && Create == false)
      return nullptr;

   return Lookup(Itm,Start,End - Start,Create);
}
									/*}}}*/
// Configuration::Find - Find a value					/*{{{*/
string Configuration::Find(const char *Name,const char *Default) const
{
   const Item *Itm = Lookup(Name);
   if (Itm == nullptr || Itm->Value.empty() == true)
   {
      if (Default == nullptr)
	 return "";
      return Default;
   }
   return Itm->Value;
}
									/*}}}*/
// Configuration::FindFile - Find a Filename				/*{{{*/
// ---------------------------------------------------------------------
/* Directories are stored as the base dir in the Parent node and the
   sub directory in sub nodes with the final node being the end filename.
   Absolute and explicitly relative values stop the composition. */
string Configuration::FindFile(const char *Name,const char *Default) const
{
   const Item *RootItem = Lookup("RootDir");
   string result = (RootItem == nullptr) ? "" : RootItem->Value;
   if (result.empty() == false && result.back() != '/')
      result.push_back('/');

   const Item *Itm = Lookup(Name);
   if (Itm == nullptr || Itm->Value.empty() == true)
   {
      if (Default != nullptr)
	 result.append(Default);
      return result;
   }

   string val = Itm->Value;
   for (; Itm->Parent != nullptr; Itm = Itm->Parent)
   {
      if (val[0] == '/' || AutoMark::String::Startswith(val, "./") ||
	    AutoMark::String::Startswith(val, "../") || AutoMark::String::Startswith(val, "~/"))
	 break;
      if (Itm->Parent->Value.empty() == true)
	 continue;
      if (Itm->Parent->Value.back() != '/')
	 val.insert(0, "/");
      val.insert(0, Itm->Parent->Value);
   }
   if (result.empty() == false && val[0] == '/')
      val.erase(0, 1);
   return result.append(val);
}
									/*}}}*/
// Configuration::FindDir - Find a directory name			/*{{{*/
// ---------------------------------------------------------------------
/* This is like findfile execept the result is terminated in a / */
string Configuration::FindDir(const char *Name,const char *Default) const
{
   string Res = FindFile(Name,Default);
   if (Res.empty() == false && Res.back() != '/')
      Res.push_back('/');
   return Res;
}
									/*}}}*/
// Configuration::FindVector - Find a vector of values			/*{{{*/
// ---------------------------------------------------------------------
/* Returns a vector of config values under the given item. A value set on
   the item itself is split on commas instead. */
vector<string> Configuration::FindVector(const char *Name, std::string const &Default) const
{
   auto const Split = [](string const &List) {
      vector<string> Vec;
      for (auto const &V : VectorizeString(List, ','))
      {
	 string const S = AutoMark::String::Strip(V);
	 if (S.empty() == false)
	    Vec.push_back(S);
      }
      return Vec;
   };

   const Item *Top = Lookup(Name);
   if (Top == nullptr)
      return Split(Default);
   if (Top->Value.empty() == false)
      return Split(Top->Value);

   vector<string> Vec;
   for (auto const &I : Top->Children)
      Vec.push_back(I->Value);
   return Vec;
}
									/*}}}*/
// Configuration::FindI - Find an integer value				/*{{{*/
int Configuration::FindI(const char *Name,int const &Default) const
{
   const Item *Itm = Lookup(Name);
   if (Itm == nullptr || Itm->Value.empty() == true)
      return Default;

   char *End;
   int const Res = strtol(Itm->Value.c_str(),&End,0);
   if (End == Itm->Value.c_str())
      return Default;
   return Res;
}
									/*}}}*/
// Configuration::FindB - Find a boolean type				/*{{{*/
bool Configuration::FindB(const char *Name,bool const &Default) const
{
   const Item *Itm = Lookup(Name);
   if (Itm == nullptr || Itm->Value.empty() == true)
      return Default;

   return StringToBool(Itm->Value,Default) == 1;
}
									/*}}}*/
// Configuration::CndSet - Conditional Set a value			/*{{{*/
// ---------------------------------------------------------------------
/* This will not overwrite */
void Configuration::CndSet(const char *Name,const string &Value)
{
   Item *Itm = Lookup(Name,true);
   if (Itm == nullptr)
      return;
   if (Itm->Value.empty() == true)
      Itm->Value = Value;
}
void Configuration::CndSet(const char *Name,int const Value)
{
   CndSet(Name, std::to_string(Value));
}
									/*}}}*/
// Configuration::Set - Set a value					/*{{{*/
void Configuration::Set(const char *Name,const string &Value)
{
   Item *Itm = Lookup(Name,true);
   if (Itm == nullptr)
      return;
   Itm->Value = Value;
}
void Configuration::Set(const char *Name,int const &Value)
{
   Set(Name, std::to_string(Value));
}
									/*}}}*/
// Configuration::Clear - Clear a single value from a list		/*{{{*/
void Configuration::Clear(string const &Name, string const &Value)
{
   Item *Top = Lookup(Name.c_str(),false);
   if (Top == nullptr)
      return;

   auto &Children = Top->Children;
   Children.erase(std::remove_if(Children.begin(), Children.end(),
	    [&Value](std::unique_ptr<Item> const &I) { return I->Value == Value; }),
	 Children.end());
}
									/*}}}*/
// Configuration::Clear - Clear everything				/*{{{*/
void Configuration::Clear()
{
   Root.reset(new Item);
}
									/*}}}*/
// Configuration::Clear - Clear an entire tree				/*{{{*/
void Configuration::Clear(string const &Name)
{
   Item *Top = Lookup(Name.c_str(),false);
   if (Top == nullptr)
      return;
   if (Top == Root.get())
   {
      Clear();
      return;
   }

   // drop the whole subtree and the node itself if it is a leaf now
   Top->Value.clear();
   Top->Children.clear();
   Item *Parent = Top->Parent;
   auto &Siblings = Parent->Children;
   Siblings.erase(std::remove_if(Siblings.begin(), Siblings.end(),
	    [Top](std::unique_ptr<Item> const &I) { return I.get() == Top; }),
	 Siblings.end());
}
									/*}}}*/
// Configuration::Exists - Returns true if the Name exists		/*{{{*/
bool Configuration::Exists(const char *Name) const
{
   const Item *Itm = Lookup(Name);
   return Itm != nullptr;
}
									/*}}}*/
// Configuration::Dump - Dump the config				/*{{{*/
// ---------------------------------------------------------------------
/* Dump the entire configuration space in apt.conf(5) syntax so that the
   output can be read back in with ReadConfigFile */
static void DumpItem(std::ostream &str, Configuration::Item const &Itm)
{
   for (auto const &Child : Itm.Children)
   {
      string const Tag = Child->FullTag();
      if (Child->Value.empty() == false || Child->Children.empty() == true)
	 str << Tag << " \"" << Child->Value << "\";" << std::endl;
      DumpItem(str, *Child);
   }
}
void Configuration::Dump(ostream& str)
{
   DumpItem(str, *Root);
}
									/*}}}*/
// Configuration::Item::FullTag - Return the fully scoped tag		/*{{{*/
// ---------------------------------------------------------------------
/* Stop sets an optional max recursion depth if this item is being viewed as
   part of a sub tree. */
string Configuration::Item::FullTag(const Item *Stop) const
{
   if (Parent == nullptr || Parent->Parent == nullptr || Parent == Stop)
      return Tag;
   return Parent->FullTag(Stop) + "::" + Tag;
}
									/*}}}*/

// ReadConfigFile - Read a configuration file				/*{{{*/
// ---------------------------------------------------------------------
/* The configuration format is very much like the named.conf format
   used in bind8: a tag, an optional quoted value and a terminating
   semicolon, blocks opened with { and closed with }; grouping all
   items in it below the tag of the block. */
static void leaveCurrentScope(std::stack<std::string> &Stack, std::string &ParentTag)
{
   if (Stack.empty())
      ParentTag.clear();
   else
   {
      ParentTag = Stack.top();
      Stack.pop();
   }
}
// StripComments - remove comments from a line, tracking /* */ state	/*{{{*/
static string StripComments(string const &Line, bool &InComment)
{
   string Fragment;
   bool InQuote = false;
   for (string::size_type I = 0; I < Line.length(); ++I)
   {
      if (InComment == true)
      {
	 if (Line.compare(I, 2, "*/") == 0)
	 {
	    InComment = false;
	    ++I;
	 }
	 continue;
      }
      if (Line[I] == '"')
	 InQuote = !InQuote;
      else if (InQuote == false)
      {
	 if (Line.compare(I, 2, "//") == 0)
	    break;
	 if (Line.compare(I, 2, "/*") == 0)
	 {
	    InComment = true;
	    ++I;
	    continue;
	 }
	 if (Line[I] == '#' && Line.compare(I, 6, "#clear") != 0 &&
	       Line.compare(I, 8, "#include") != 0)
	    break;
      }
      Fragment.push_back(Line[I]);
   }
   return Fragment;
}
									/*}}}*/
bool ReadConfigFile(Configuration &Conf,const string &FName,unsigned const &Depth)
{
   std::ifstream F(FName.c_str());
   if (F.is_open() == false)
      return _error->Errno("ifstream::ifstream",_("Opening configuration file %s"),FName.c_str());

   string LineBuffer;
   std::stack<std::string> Stack;
   string ParentTag;

   unsigned int CurLine = 0;
   bool InComment = false;
   string Input;
   while (std::getline(F, Input))
   {
      ++CurLine;
      string const Fragment = AutoMark::String::Strip(
	    StripComments(SubstVar(Input, "\t", "        "), InComment));
      if (Fragment.empty() == true)
	 continue;

      // The line has actual content; interpret what it means.
      bool InQuote = false;
      string::size_type Start = 0;
      for (string::size_type I = 0; I < Fragment.length(); ++I)
      {
	 char const TermChar = Fragment[I];
	 if (TermChar == '"')
	    InQuote = !InQuote;
	 if (InQuote == true || (TermChar != '{' && TermChar != ';' && TermChar != '}'))
	    continue;

	 // Put the last fragment into the buffer
	 string const Part = AutoMark::String::Strip(Fragment.substr(Start, I - Start));
	 if (LineBuffer.empty() == false && Part.empty() == false)
	    LineBuffer += ' ';
	 LineBuffer += Part;
	 Start = I + 1;

	 // Syntax Error
	 if (TermChar == '{' && LineBuffer.empty() == true)
	    return _error->Error(_("Syntax error %s:%u: Block starts with no name."),FName.c_str(),CurLine);

	 // No string on this line
	 if (LineBuffer.empty() == true)
	 {
	    if (TermChar == '}')
	       leaveCurrentScope(Stack, ParentTag);
	    continue;
	 }

	 // Parse off the tag and the word
	 string Tag;
	 const char *Pos = LineBuffer.c_str();
	 if (ParseQuoteWord(Pos,Tag) == false)
	    return _error->Error(_("Syntax error %s:%u: Malformed tag"),FName.c_str(),CurLine);

	 string Word;
	 bool NoWord = false;
	 if (ParseQuoteWord(Pos,Word) == false)
	 {
	    if (TermChar != '{')
	    {
	       Word = Tag;
	       Tag = "";
	    }
	    else
	       NoWord = true;
	 }
	 if (strlen(Pos) != 0)
	    return _error->Error(_("Syntax error %s:%u: Extra junk after value"),FName.c_str(),CurLine);

	 // Go down a level
	 if (TermChar == '{')
	 {
	    Stack.push(ParentTag);
	    if (ParentTag.empty() == true)
	       ParentTag = Tag;
	    else
	       ParentTag.append("::").append(Tag);
	    Tag.clear();
	 }

	 // Generate the item name
	 string Item;
	 if (ParentTag.empty() == true)
	    Item = Tag;
	 else if (TermChar != '{' || Tag.empty() == false)
	    Item = ParentTag + "::" + Tag;
	 else
	    Item = ParentTag;

	 // Specials
	 if (Tag.length() >= 1 && Tag[0] == '#')
	 {
	    if (ParentTag.empty() == false)
	       return _error->Error(_("Syntax error %s:%u: Directives can only be done at the top level"),FName.c_str(),CurLine);
	    Tag.erase(Tag.begin());
	    if (Tag == "clear")
	       Conf.Clear(Word);
	    else if (Tag == "include")
	    {
	       if (Depth > 10)
		  return _error->Error(_("Syntax error %s:%u: Too many nested includes"),FName.c_str(),CurLine);
	       bool const Res = (Word.length() > 2 && Word.back() == '/') ?
		  ReadConfigDir(Conf,Word,Depth+1) : ReadConfigFile(Conf,Word,Depth+1);
	       if (Res == false)
		  return _error->Error(_("Syntax error %s:%u: Included from here"),FName.c_str(),CurLine);
	    }
	    else
	       return _error->Error(_("Syntax error %s:%u: Unsupported directive '%s'"),FName.c_str(),CurLine,Tag.c_str());
	 }
	 else if (Tag.empty() == true && NoWord == false && Word == "#clear")
	    return _error->Error(_("Syntax error %s:%u: clear directive requires an option tree as argument"),FName.c_str(),CurLine);
	 else if (NoWord == false)
	    Conf.Set(Item,Word);

	 LineBuffer.clear();

	 // Move up a tag, but only if there is no bit to parse
	 if (TermChar == '}')
	    leaveCurrentScope(Stack, ParentTag);
      }

      // Store the remaining text, if any, in the current line buffer.
      string const Rest = AutoMark::String::Strip(Fragment.substr(Start));
      if (Rest.empty() == false)
      {
	 if (LineBuffer.empty() == false)
	    LineBuffer += ' ';
	 LineBuffer += Rest;
      }
   }

   if (LineBuffer.empty() == false)
      return _error->Error(_("Syntax error %s:%u: Extra junk at end of file"),FName.c_str(),CurLine);
   if (F.bad() == true)
      return _error->Errno("getline",_("Read error in configuration file %s"),FName.c_str());

   return true;
}
									/*}}}*/
// ReadConfigDir - Read a directory of config files			/*{{{*/
bool ReadConfigDir(Configuration &Conf,const string &Dir,unsigned const &Depth)
{
   std::vector<std::string> const List = GetListOfFilesInDir(Dir, "conf", true);

   // Read the files
   for (auto const &I : List)
      if (ReadConfigFile(Conf,I,Depth) == false)
	 return false;
   return true;
}
									/*}}}*/
