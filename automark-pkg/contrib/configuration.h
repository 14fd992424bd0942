// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   This class provides a configuration file and command line parser
   for a tree-oriented configuration environment. All runtime configuration
   is stored in here.

   Each configuration name is given as a fully scoped string such as
     Automark::Cycles::Pending-File
   And has associated with it a text string. The Configuration class only
   provides storage and lookup for this tree, ReadConfigFile provides
   the parser for the apt.conf(5) style configuration files.

   Most things can get by quite happily with,
     cout << _config->Find("Foo::Bar") << endl;

   A special extension, support for ordered lists is provided by using the
   special syntax, "block::list::" the trailing :: designates the
   item as a list. To access the list you must use the tree function on
   "block::list" or FindVector.

   This source is placed in the Public Domain, do with it what you will
   It was originally written by Jason Gunthorpe <jgg@debian.org>.

   ##################################################################### */
									/*}}}*/
#ifndef AUTOMARKLIB_CONFIGURATION_H
#define AUTOMARKLIB_CONFIGURATION_H

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <automark-pkg/macros.h>


class AUTOMARK_PUBLIC Configuration
{
   public:

   struct Item
   {
      std::string Value;
      std::string Tag;
      Item *Parent;
      std::vector<std::unique_ptr<Item>> Children;

      std::string FullTag(const Item *Stop = nullptr) const;

      Item() : Parent(nullptr) {};
   };

   private:

   std::unique_ptr<Item> Root;

   Item *Lookup(Item *Head,const char *S,unsigned long const &Len,bool const &Create);
   Item *Lookup(const char *Name,const bool &Create);
   inline const Item *Lookup(const char *Name) const
   {
      return const_cast<Configuration *>(this)->Lookup(Name,false);
   }

   public:

   std::string Find(const char *Name,const char *Default = 0) const;
   std::string Find(std::string const &Name,const char *Default = 0) const {return Find(Name.c_str(),Default);};
   std::string Find(std::string const &Name, std::string const &Default) const {return Find(Name.c_str(),Default.c_str());};
   std::string FindFile(const char *Name,const char *Default = 0) const;
   std::string FindDir(const char *Name,const char *Default = 0) const;
   /** return a list of child options
    *
    * Options like Automark::Cycles::Dependency-Fields are handled as
    * lists which can be overridden and have a default. For the later
    * two a comma separated list of values is supported.
    *
    * \param Name of the parent node
    * \param Default list of values separated by commas */
   std::vector<std::string> FindVector(const char *Name, std::string const &Default = "") const;
   std::vector<std::string> FindVector(std::string const &Name, std::string const &Default = "") const { return FindVector(Name.c_str(), Default); };

   int FindI(const char *Name,int const &Default = 0) const;
   int FindI(std::string const &Name,int const &Default = 0) const {return FindI(Name.c_str(),Default);};
   bool FindB(const char *Name,bool const &Default = false) const;
   bool FindB(std::string const &Name,bool const &Default = false) const {return FindB(Name.c_str(),Default);};

   inline void Set(const std::string &Name,const std::string &Value) {Set(Name.c_str(),Value);};
   void CndSet(const char *Name,const std::string &Value);
   void CndSet(const char *Name,const int Value);
   void Set(const char *Name,const std::string &Value);
   void Set(const char *Name,const int &Value);

   inline bool Exists(const std::string &Name) const {return Exists(Name.c_str());};
   bool Exists(const char *Name) const;

   // clear a whole tree
   void Clear(const std::string &Name);
   void Clear();

   // remove a certain value from a list (e.g. the list of "Automark::Cycles::Dependency-Fields")
   void Clear(std::string const &List, std::string const &Value);

   inline const Item *Tree(const char *Name) const {return Lookup(Name);};

   inline void Dump() { Dump(std::clog); };
   void Dump(std::ostream& str);

   Configuration();
   ~Configuration();
};

AUTOMARK_PUBLIC extern Configuration *_config;

AUTOMARK_PUBLIC bool ReadConfigFile(Configuration &Conf,const std::string &FName,
		    unsigned const &Depth = 0);

AUTOMARK_PUBLIC bool ReadConfigDir(Configuration &Conf,const std::string &Dir,
		   unsigned const &Depth = 0);

#endif
