#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/init.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

TEST(InitTest,LibraryVersion)
{
   EXPECT_STREQ(AUTOMARK_TEST_PKG_VERSION, pkgLibVersion);
   EXPECT_STREQ(PACKAGE_VERSION, pkgVersion);
}
TEST(InitTest,Defaults)
{
   Configuration Cnf;
   Cnf.Set("Automark::Cycles::Provides-Field", "Provides-Virtual");
   EXPECT_TRUE(pkgInitConfig(Cnf));

   EXPECT_EQ("/", Cnf.Find("Dir"));
   EXPECT_EQ("automark.conf", Cnf.Find("Dir::Etc::main"));
   EXPECT_EQ("automark.conf.d", Cnf.Find("Dir::Etc::parts"));
   EXPECT_EQ(std::vector<std::string>({"PreDepends", "Pre-Depends", "Depends", "Recommends"}),
	 Cnf.FindVector("Automark::Cycles::Dependency-Fields"));
   EXPECT_EQ("Provides-Virtual", Cnf.Find("Automark::Cycles::Provides-Field"));
}
