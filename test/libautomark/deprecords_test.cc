#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/deprecords.h>
#include <automark-pkg/error.h>

#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using AutoMark::DepRecordParser;
typedef std::set<std::string> NameSet;
typedef std::vector<std::string> NameList;

TEST(DepRecordsTest,SplitValue)
{
   EXPECT_EQ(NameList({"a", "b", "c"}), AutoMark::SplitDependencyValue(" a (>= 1.0) | b , ,c"));
   EXPECT_EQ(NameList({"libc6", "debconf", "debconf-2.0"}),
	 AutoMark::SplitDependencyValue("libc6 (>= 2.34), debconf (>= 0.5) | debconf-2.0"));
   // whitespace inside a name is removed, not a separator
   EXPECT_EQ(NameList({"ab"}), AutoMark::SplitDependencyValue("a b"));
   // an unbalanced parenthesis swallows the rest
   EXPECT_EQ(NameList({"b"}), AutoMark::SplitDependencyValue("b (>= 1, c"));
   // a closing parenthesis without an opening one is dropped
   EXPECT_EQ(NameList({"b"}), AutoMark::SplitDependencyValue("b)"));
   EXPECT_EQ(NameList({"b", "c"}), AutoMark::SplitDependencyValue("b (>= 1)), c)"));
   EXPECT_TRUE(AutoMark::SplitDependencyValue(")").empty());
   EXPECT_TRUE(AutoMark::SplitDependencyValue("").empty());
   EXPECT_TRUE(AutoMark::SplitDependencyValue(" , | (= 1) ").empty());
}
TEST(DepRecordsTest,Basic)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read(R"(Package: a
Depends: b (>= 1.0), c | d
Recommends: e
PreDepends: f
Suggests: g
Description: a package

Package: b
Provides: v1, v2 (= 1)
)"));
   ASSERT_EQ(2u, Parser.size());
   auto const &records = Parser.Records();
   auto const &a = records.at("a");
   EXPECT_EQ("a", a.Name);
   EXPECT_EQ(NameSet({"b", "c", "d", "e", "f"}), a.Depends);
   EXPECT_TRUE(a.Provides.empty());
   auto const &b = records.at("b");
   EXPECT_TRUE(b.Depends.empty());
   EXPECT_EQ(NameList({"v1", "v2"}), b.Provides);
}
TEST(DepRecordsTest,ContinuationLines)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read("Package: a\n"
	    "Depends: b,\n"
	    " c (<< 2)\n"
	    "\td | e\n"
	    "Provides: x\n"
	    "  y\n"));
   ASSERT_EQ(1u, Parser.size());
   auto const &a = Parser.Records().at("a");
   EXPECT_EQ(NameSet({"b", "c", "d", "e"}), a.Depends);
   EXPECT_EQ(NameList({"x", "y"}), a.Provides);
}
TEST(DepRecordsTest,BlocksWithoutRelations)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read("Package: lonely\n"
	    "Description: nothing to see\n"
	    "\n"
	    "Depends: orphaned\n"
	    "\n"
	    "Package: a\n"
	    "Depends:\n"
	    "\n"
	    "Package: b\n"
	    "Depends: (>= 1)\n"));
   EXPECT_TRUE(Parser.empty());
   EXPECT_TRUE(_error->empty());
}
TEST(DepRecordsTest,MalformedLines)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read(" leading continuation\n"
	    "Package: a\n"
	    "Depends: b\n"
	    "garbage without a colon\n"
	    " c\n"
	    "Description: long\n"
	    " d\n"
	    "Recommends: e\n"));
   ASSERT_EQ(1u, Parser.size());
   EXPECT_EQ(NameSet({"b", "e"}), Parser.Records().at("a").Depends);
   EXPECT_TRUE(_error->empty());
}
TEST(DepRecordsTest,LabelsAreCaseInsensitive)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read("package: a\n"
	    "pre-depends: b\n"
	    "DEPENDS: c\n"
	    "recommends: d\n"
	    "PROVIDES: v\n"));
   ASSERT_EQ(1u, Parser.size());
   auto const &a = Parser.Records().at("a");
   EXPECT_EQ(NameSet({"b", "c", "d"}), a.Depends);
   EXPECT_EQ(NameList({"v"}), a.Provides);
}
TEST(DepRecordsTest,BlockBoundaries)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read("Package: a\n"
	    "Depends: b\n"
	    "   \n"
	    "Package: c\n"
	    "Depends: d\n"
	    "Package: e\n"
	    "Depends: f\r\n"
	    "\r\n"
	    "\n"
	    "\n"
	    "Package: g\n"
	    "Depends: h"));
   auto const &records = Parser.Records();
   ASSERT_EQ(4u, records.size());
   EXPECT_EQ(NameSet({"b"}), records.at("a").Depends);
   EXPECT_EQ(NameSet({"d"}), records.at("c").Depends);
   EXPECT_EQ(NameSet({"f"}), records.at("e").Depends);
   EXPECT_EQ(NameSet({"h"}), records.at("g").Depends);
}
TEST(DepRecordsTest,DuplicatesAreMerged)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read("Package: a\nDepends: b\nProvides: v, w\n\n"
	    "Package: a\nDepends: c\nProvides: w, x\n"));
   ASSERT_EQ(1u, Parser.size());
   auto const &a = Parser.Records().at("a");
   EXPECT_EQ(NameSet({"b", "c"}), a.Depends);
   EXPECT_EQ(NameList({"v", "w", "x"}), a.Provides);
}
TEST(DepRecordsTest,ConfiguredFields)
{
   Configuration Cnf;
   Cnf.Set("Automark::Cycles::Dependency-Fields::", "Depends");
   Cnf.Set("Automark::Cycles::Dependency-Fields::", "Suggests");
   Cnf.Set("Automark::Cycles::Provides-Field", "Enhances");
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read("Package: a\n"
	    "Depends: b\n"
	    "Recommends: c\n"
	    "Suggests: d\n"
	    "Provides: e\n"
	    "Enhances: f\n"));
   ASSERT_EQ(1u, Parser.size());
   auto const &a = Parser.Records().at("a");
   EXPECT_EQ(NameSet({"b", "d"}), a.Depends);
   EXPECT_EQ(NameList({"f"}), a.Provides);
}
TEST(DepRecordsTest,StreamsEndBlocks)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   std::istringstream first("Package: a\nDepends: b\n");
   std::istringstream second(" c\nPackage: d\nDepends: e\n");
   EXPECT_TRUE(Parser.Read(first));
   EXPECT_TRUE(Parser.Read(second));
   auto const &records = Parser.Records();
   ASSERT_EQ(2u, records.size());
   EXPECT_EQ(NameSet({"b"}), records.at("a").Depends);
   EXPECT_EQ(NameSet({"e"}), records.at("d").Depends);

   std::istringstream empty("");
   EXPECT_TRUE(Parser.Read(empty));
   EXPECT_EQ(2u, Parser.size());
}
TEST(DepRecordsTest,EmptyInput)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read(""));
   EXPECT_TRUE(Parser.empty());
   EXPECT_TRUE(Parser.Read("\n\n   \n"));
   EXPECT_TRUE(Parser.empty());
}
