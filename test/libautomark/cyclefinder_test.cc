#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/cyclefinder.h>
#include <automark-pkg/depgraph.h>
#include <automark-pkg/deprecords.h>

#include <algorithm>
#include <iostream>
#include <iterator>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using AutoMark::DepGraph;
using AutoMark::DepRecordParser;
typedef std::set<std::string> NameSet;
typedef std::vector<std::string> NameList;

class ClogCapture {
   std::ostringstream out;
   std::streambuf *old;
   public:
   ClogCapture() : old(std::clog.rdbuf(out.rdbuf())) {}
   ~ClogCapture() { std::clog.rdbuf(old); }
   std::string str() const { return out.str(); }
};

static DepGraph WorkedExample()
{
   DepGraph G;
   G.AddEdge("A", "B");
   G.AddEdge("B", "A");
   G.AddEdge("C", "D");
   G.AddNode("D");
   return G;
}
static DepGraph MixedGraph()
{
   DepGraph G;
   // two cycles
   G.AddEdge("a", "b");
   G.AddEdge("b", "c");
   G.AddEdge("c", "a");
   G.AddEdge("g", "h");
   G.AddEdge("h", "g");
   // held by a cycle without being part of it
   G.AddEdge("d", "a");
   G.AddEdge("d", "f");
   // chains ending without a cycle
   G.AddEdge("e", "f");
   G.AddNode("f");
   G.AddEdge("i", "e");
   G.AddEdge("j", "not-a-candidate");
   return G;
}
static void ExpectResidualInvariant(DepGraph const &G)
{
   for (auto const &N : G)
   {
      EXPECT_FALSE(N.second.empty()) << N.first;
      for (auto const &D : N.second)
	 EXPECT_TRUE(G.Contains(D)) << N.first << " -> " << D;
   }
}

TEST(CycleFinderTest,WorkedExample)
{
   DepGraph G = WorkedExample();
   EXPECT_EQ(NameSet({"C", "D"}), AutoMark::ReduceAcyclic(G));
   EXPECT_EQ(NameSet({"A", "B"}), G.Names());
   EXPECT_EQ(NameList({"A, B"}), AutoMark::GroupCycles(G));
}
TEST(CycleFinderTest,RemovalPasses)
{
   DepGraph G = WorkedExample();
   _config->Set("Debug::Automark::Reduce", true);
   std::string trace;
   {
      ClogCapture capture;
      AutoMark::ReduceAcyclic(G);
      trace = capture.str();
   }
   _config->Clear("Debug::Automark::Reduce");

   EXPECT_EQ("Reduce: pass 1 removes D\n"
	 "Reduce: pass 1 removed 1 of 4 nodes\n"
	 "Reduce: pass 2 removes C\n"
	 "Reduce: pass 2 removed 1 of 3 nodes\n"
	 "Reduce: pass 3 removed 0 of 2 nodes\n", trace);
}
TEST(CycleFinderTest,VirtualResolution)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read("Package: X\nDepends: v\n\nPackage: Y\nProvides: v\n"));

   DepGraph G(Parser.Records());
   AutoMark::ResolveProvides(G, Parser.Records());
   _config->Set("Debug::Automark::Reduce", true);
   std::string trace;
   NameSet acyclic;
   {
      ClogCapture capture;
      acyclic = AutoMark::ReduceAcyclic(G);
      trace = capture.str();
   }
   _config->Clear("Debug::Automark::Reduce");

   EXPECT_EQ(NameSet({"X", "Y"}), acyclic);
   EXPECT_TRUE(G.empty());
   EXPECT_NE(std::string::npos, trace.find("Reduce: pass 1 removes Y\n"));
   EXPECT_NE(std::string::npos, trace.find("Reduce: pass 2 removes X\n"));
}
TEST(CycleFinderTest,SharedEdgeMerging)
{
   DepGraph G;
   G.AddEdge("A", "B");
   G.AddEdge("B", "A");
   G.AddEdge("A", "C");
   G.AddEdge("B", "D");
   G.AddEdge("D", "B");
   EXPECT_TRUE(AutoMark::ReduceAcyclic(G).empty());
   EXPECT_EQ(NameSet({"B"}), G.Depends("A"));

   auto const groups = AutoMark::CycleGroups(G);
   ASSERT_EQ(1u, groups.size());
   EXPECT_EQ(NameSet({"A", "B", "D"}), groups[0]);
   EXPECT_EQ(NameList({"A, B, D"}), AutoMark::GroupCycles(G));
}
TEST(CycleFinderTest,Idempotence)
{
   DepGraph G = MixedGraph();
   AutoMark::ReduceAcyclic(G);
   DepGraph const once = G;
   EXPECT_TRUE(AutoMark::ReduceAcyclic(G).empty());
   EXPECT_EQ(once, G);
}
TEST(CycleFinderTest,Conservation)
{
   DepGraph G = MixedGraph();
   NameSet const all = G.Names();
   NameSet const acyclic = AutoMark::ReduceAcyclic(G);
   NameSet const residual = G.Names();

   EXPECT_EQ(NameSet({"e", "f", "i", "j"}), acyclic);
   EXPECT_EQ(NameSet({"a", "b", "c", "d", "g", "h"}), residual);

   NameSet both;
   std::set_intersection(acyclic.begin(), acyclic.end(), residual.begin(), residual.end(),
	 std::inserter(both, both.begin()));
   EXPECT_TRUE(both.empty());
   NameSet united = acyclic;
   united.insert(residual.begin(), residual.end());
   EXPECT_EQ(all, united);

   ExpectResidualInvariant(G);
}
TEST(CycleFinderTest,Partition)
{
   DepGraph G = MixedGraph();
   AutoMark::ReduceAcyclic(G);

   auto const groups = AutoMark::CycleGroups(G);
   NameSet seen;
   size_t members = 0;
   for (auto const &Group : groups)
   {
      EXPECT_FALSE(Group.empty());
      members += Group.size();
      seen.insert(Group.begin(), Group.end());
   }
   EXPECT_EQ(members, seen.size());
   EXPECT_EQ(G.Names(), seen);

   // d holds on to the first cycle, but the walk from a was first
   EXPECT_EQ(NameList({"a, b, c", "d", "g, h"}), AutoMark::GroupCycles(G));
}
TEST(CycleFinderTest,GroupsAreSortedByText)
{
   DepGraph G;
   G.AddEdge("b", "zz");
   G.AddEdge("zz", "b");
   G.AddEdge("ba", "ba");
   EXPECT_TRUE(AutoMark::ReduceAcyclic(G).empty());
   EXPECT_EQ(NameList({"b, zz", "ba"}), AutoMark::GroupCycles(G));
}
TEST(CycleFinderTest,SelfLoop)
{
   DepGraph G;
   G.AddEdge("p", "p");
   G.AddEdge("q", "p");
   EXPECT_TRUE(AutoMark::ReduceAcyclic(G).empty());
   EXPECT_EQ(NameList({"p", "q"}), AutoMark::GroupCycles(G));
}
TEST(CycleFinderTest,LongChain)
{
   DepGraph G;
   NameSet all;
   for (int i = 0; i < 50; ++i)
   {
      std::string const name = "pkg" + std::to_string(i);
      all.insert(name);
      if (i != 49)
	 G.AddEdge(name, "pkg" + std::to_string(i + 1));
      else
	 G.AddNode(name);
   }
   EXPECT_EQ(all, AutoMark::ReduceAcyclic(G));
   EXPECT_TRUE(G.empty());
   EXPECT_TRUE(AutoMark::GroupCycles(G).empty());
}
TEST(CycleFinderTest,EmptyGraph)
{
   DepGraph G;
   EXPECT_TRUE(AutoMark::ReduceAcyclic(G).empty());
   EXPECT_TRUE(AutoMark::CycleGroups(G).empty());
   EXPECT_TRUE(AutoMark::GroupCycles(G).empty());
}
TEST(CycleFinderTest,FindCycles)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read("Package: a\nDepends: b (>= 1) | c\n\n"
	    "Package: b\nPre-Depends: a\n\n"
	    "Package: c\nDepends: mail-transport-agent\n\n"
	    "Package: d\nDepends: libc6\n\n"
	    "Package: postfix\nDepends: c\nProvides: mail-transport-agent\n\n"
	    "Package: broken\nDescription: no relations at all\n"));

   auto const report = AutoMark::FindCycles(Parser.Records());
   EXPECT_EQ(NameSet({"d"}), report.Acyclic);
   EXPECT_EQ(NameSet({"a", "b", "c", "postfix"}), report.Residual);
   EXPECT_EQ(NameList({"a, b, c, postfix"}), report.Cycles);
   EXPECT_EQ(NameSet({"a", "b", "c", "d", "postfix"}), report.Nodes());
}
TEST(CycleFinderTest,FormatCycle)
{
   EXPECT_EQ("a", AutoMark::FormatCycle({"a"}));
   EXPECT_EQ("a, b, c", AutoMark::FormatCycle({"c", "a", "b"}));
}
TEST(CycleFinderTest,StrayParenthesisIsNoEdge)
{
   Configuration Cnf;
   DepRecordParser Parser(Cnf);
   EXPECT_TRUE(Parser.Read("Package: a\nDepends: b)\n\nPackage: b)\nDepends: a\n"));

   auto const report = AutoMark::FindCycles(Parser.Records());
   EXPECT_EQ(NameSet({"a", "b)"}), report.Acyclic);
   EXPECT_TRUE(report.Residual.empty());
   EXPECT_TRUE(report.Cycles.empty());
}
