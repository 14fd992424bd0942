/*
 * cyclefinder.cc - find the packages held back by dependency cycles
 *
 * SPDX-License-Identifier: GPL-2.0+
 *
 * Packages a previous pass wanted to mark as automatically installed
 * but couldn't because something still depends on them either hang off
 * a chain ending in a package nothing keeps or are caught in a cycle.
 * The first kind is peeled off layer by layer, what remains is grouped
 * so the cycles can be shown to the user.
 */

#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/cyclefinder.h>
#include <automark-pkg/strutl.h>

#include <algorithm>
#include <iostream>
#include <string>

using std::string;

namespace AutoMark
{

std::set<string> ReduceAcyclic(DepGraph &Graph)
{
   bool const debug = _config->FindB("Debug::Automark::Reduce", false);

   std::set<string> acyclic;
   for (unsigned int pass = 1;; ++pass)
   {
      for (auto &N : Graph)
	 for (auto D = N.second.begin(); D != N.second.end();)
	 {
	    if (Graph.Contains(*D) == false)
	       D = N.second.erase(D);
	    else
	       ++D;
	 }

      size_t removed = 0;
      for (auto N = Graph.begin(); N != Graph.end();)
      {
	 if (N->second.empty() == false)
	 {
	    ++N;
	    continue;
	 }
	 if (unlikely(debug))
	    std::clog << "Reduce: pass " << pass << " removes " << N->first << std::endl;
	 acyclic.insert(N->first);
	 N = Graph.erase(N);
	 ++removed;
      }

      if (unlikely(debug))
	 std::clog << "Reduce: pass " << pass << " removed " << removed << " of " << (removed + Graph.size()) << " nodes" << std::endl;
      if (removed == 0)
	 break;
   }
   return acyclic;
}

std::vector<std::set<string>> CycleGroups(DepGraph const &Graph)
{
   std::vector<std::set<string>> groups;
   std::set<string> visited;
   for (auto const &Start : Graph)
   {
      if (visited.insert(Start.first).second == false)
	 continue;

      std::set<string> group;
      std::vector<string> stack{Start.first};
      while (stack.empty() == false)
      {
	 string const node = std::move(stack.back());
	 stack.pop_back();
	 group.insert(node);
	 for (auto const &dep : Graph.Depends(node))
	    if (Graph.Contains(dep) == true && visited.insert(dep).second == true)
	       stack.push_back(dep);
      }
      groups.push_back(std::move(group));
   }
   return groups;
}

string FormatCycle(std::set<string> const &Group)
{
   return String::Join(std::vector<string>(Group.begin(), Group.end()), ", ");
}

std::vector<string> GroupCycles(DepGraph const &Graph)
{
   bool const debug = _config->FindB("Debug::Automark::Cycles", false);

   std::vector<string> cycles;
   for (auto const &G : CycleGroups(Graph))
   {
      cycles.push_back(FormatCycle(G));
      if (unlikely(debug))
	 std::clog << "Cycles: group of " << G.size() << ": " << cycles.back() << std::endl;
   }
   std::sort(cycles.begin(), cycles.end());
   return cycles;
}

std::set<string> CycleReport::Nodes() const
{
   std::set<string> nodes = Residual;
   nodes.insert(Acyclic.begin(), Acyclic.end());
   return nodes;
}

CycleReport FindCycles(DepRecordParser::RecordMap const &Records)
{
   DepGraph graph(Records);
   ResolveProvides(graph, Records);

   CycleReport report;
   report.Acyclic = ReduceAcyclic(graph);
   report.Residual = graph.Names();
   report.Cycles = GroupCycles(graph);
   return report;
}

} // namespace AutoMark
