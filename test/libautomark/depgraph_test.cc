#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/depgraph.h>
#include <automark-pkg/deprecords.h>

#include <set>
#include <string>

#include <gtest/gtest.h>

using AutoMark::DepGraph;
using AutoMark::DepRecordParser;
typedef std::set<std::string> NameSet;

static DepRecordParser::RecordMap ParseRecords(std::string const &Text)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read(Text));
   return Parser.Records();
}

TEST(DepGraphTest,Nodes)
{
   DepGraph G;
   EXPECT_TRUE(G.empty());
   G.AddEdge("a", "b");
   G.AddEdge("a", "c");
   G.AddNode("d");
   G.AddNode("a");
   EXPECT_EQ(2u, G.size());
   EXPECT_TRUE(G.Contains("a"));
   EXPECT_FALSE(G.Contains("b"));
   EXPECT_EQ(NameSet({"b", "c"}), G.Depends("a"));
   EXPECT_TRUE(G.Depends("d").empty());
   EXPECT_TRUE(G.Depends("missing").empty());
   EXPECT_EQ(NameSet({"a", "d"}), G.Names());
}
TEST(DepGraphTest,FromRecords)
{
   auto const records = ParseRecords("Package: x\nDepends: v\n\nPackage: y\nProvides: v\n");
   DepGraph const G(records);
   EXPECT_EQ(NameSet({"x", "y"}), G.Names());
   EXPECT_EQ(NameSet({"v"}), G.Depends("x"));
   EXPECT_TRUE(G.Depends("y").empty());
}
TEST(DepGraphTest,ResolveProvides)
{
   auto const records = ParseRecords("Package: x\nDepends: v, w\n\n"
	 "Package: y\nProvides: v\n\n"
	 "Package: z\nDepends: x\nProvides: v, w\n");
   DepGraph G(records);
   EXPECT_EQ(2u, AutoMark::ResolveProvides(G, records));
   // the virtual names stay until the reducer prunes them
   EXPECT_EQ(NameSet({"v", "w", "y", "z"}), G.Depends("x"));
   EXPECT_TRUE(G.Depends("y").empty());
   EXPECT_EQ(NameSet({"x"}), G.Depends("z"));

   // a second run finds nothing new
   EXPECT_EQ(0u, AutoMark::ResolveProvides(G, records));
}
TEST(DepGraphTest,ProvidesAreNotChained)
{
   // y is both a package and a name provided by z
   auto const records = ParseRecords("Package: x\nDepends: v\n\n"
	 "Package: y\nDepends: x\nProvides: v\n\n"
	 "Package: z\nDepends: x\nProvides: y\n");
   DepGraph G(records);
   AutoMark::ResolveProvides(G, records);
   EXPECT_EQ(NameSet({"v", "y"}), G.Depends("x"));
   EXPECT_EQ(NameSet({"x"}), G.Depends("y"));
}
TEST(DepGraphTest,SelfProvide)
{
   auto const records = ParseRecords("Package: p\nDepends: v\nProvides: v\n");
   DepGraph G(records);
   EXPECT_EQ(1u, AutoMark::ResolveProvides(G, records));
   EXPECT_EQ(NameSet({"p", "v"}), G.Depends("p"));
}
TEST(DepGraphTest,NoProviders)
{
   auto const records = ParseRecords("Package: a\nDepends: b\n\nPackage: b\nDepends: a\n");
   DepGraph G(records);
   DepGraph const before = G;
   EXPECT_EQ(0u, AutoMark::ResolveProvides(G, records));
   EXPECT_EQ(before, G);
}
