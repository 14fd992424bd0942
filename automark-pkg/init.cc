// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the package library

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/error.h>
#include <automark-pkg/fileutl.h>
#include <automark-pkg/init.h>
#include <automark-pkg/macros.h>
#include <automark-pkg/strutl.h>

#include <string>

#include <stdlib.h>
#include <string.h>

#include <automarki18n.h>
									/*}}}*/

#define Stringfy_(x) # x
#define Stringfy(x)  Stringfy_(x)
const char *pkgVersion = PACKAGE_VERSION;
const char *pkgLibVersion = Stringfy(AUTOMARK_PKG_MAJOR) "."
                            Stringfy(AUTOMARK_PKG_MINOR) "."
                            Stringfy(AUTOMARK_PKG_RELEASE);

// pkgInitConfig - Initialize the configuration class			/*{{{*/
// ---------------------------------------------------------------------
/* Directories are specified in such a way that the FindDir function will
   understand them. That is, if they don't start with a / then their parent
   is prepended, this allows a fair degree of flexability. */
bool pkgInitConfig(Configuration &Cnf)
{
   Cnf.CndSet("Dir","/");

   // Configuration
   Cnf.CndSet("Dir::Etc", &CONF_DIR[1]);
   Cnf.CndSet("Dir::Etc::main","automark.conf");
   Cnf.CndSet("Dir::Etc::parts","automark.conf.d");
   Cnf.CndSet("Dir::Locale", LOCALE_INSTALL_DIR);

   // The fields which make up the edges of the graph
   if (Cnf.Exists("Automark::Cycles::Dependency-Fields") == false)
   {
      Cnf.Set("Automark::Cycles::Dependency-Fields::", "PreDepends");
      Cnf.Set("Automark::Cycles::Dependency-Fields::", "Pre-Depends");
      Cnf.Set("Automark::Cycles::Dependency-Fields::", "Depends");
      Cnf.Set("Automark::Cycles::Dependency-Fields::", "Recommends");
   }
   Cnf.CndSet("Automark::Cycles::Provides-Field", "Provides");

   bool Res = true;

   // Read an alternate config file
   const char *Cfg = getenv("AUTOMARK_CONFIG");
   if (Cfg != nullptr && strlen(Cfg) != 0)
   {
      if (RealFileExists(Cfg) == true)
	 Res &= ReadConfigFile(Cnf,Cfg);
      else
	 _error->WarningE("RealFileExists",_("Unable to read %s"),Cfg);
   }

   // Read the configuration parts dir
   std::string const Parts = Cnf.FindDir("Dir::Etc::parts", "/dev/null");
   if (DirectoryExists(Parts) == true)
      Res &= ReadConfigDir(Cnf,Parts);

   // Read the main config file
   std::string const FName = Cnf.FindFile("Dir::Etc::main", "/dev/null");
   if (RealFileExists(FName) == true)
      Res &= ReadConfigFile(Cnf,FName);

   if (Res == false)
      return false;

   if (Cnf.FindB("Debug::pkgInitConfig",false) == true)
      Cnf.Dump();

#ifdef USE_NLS
   if (Cnf.Exists("Dir::Locale"))
      bindtextdomain(AUTOMARK_DOMAIN,Cnf.FindDir("Dir::Locale").c_str());
#endif

   return true;
}
									/*}}}*/
