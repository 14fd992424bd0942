/*
 * depgraph.cc - the dependency graph of the candidate packages
 *
 * SPDX-License-Identifier: GPL-2.0+
 */

#include <config.h>

#include <automark-pkg/configuration.h>
#include <automark-pkg/depgraph.h>

#include <iostream>
#include <string>

using std::string;

namespace AutoMark
{

DepGraph::DepGraph(DepRecordParser::RecordMap const &Records)
{
   for (auto const &R : Records)
      AddRecord(R.second);
}

std::set<string> &DepGraph::AddNode(string const &Name)
{
   return nodes[Name];
}

void DepGraph::AddEdge(string const &From, string const &To)
{
   nodes[From].insert(To);
}

void DepGraph::AddRecord(DepRecord const &Record)
{
   auto &depends = AddNode(Record.Name);
   depends.insert(Record.Depends.begin(), Record.Depends.end());
}

std::set<string> const &DepGraph::Depends(string const &Name) const
{
   static std::set<string> const none;
   auto const node = nodes.find(Name);
   if (node == nodes.end())
      return none;
   return node->second;
}

std::set<string> DepGraph::Names() const
{
   std::set<string> names;
   for (auto const &N : nodes)
      names.insert(names.end(), N.first);
   return names;
}

size_t ResolveProvides(DepGraph &Graph, DepRecordParser::RecordMap const &Records)
{
   bool const debug = _config->FindB("Debug::Automark::Resolver", false);

   std::map<string, std::set<string>> providers;
   for (auto const &R : Records)
      for (auto const &virt : R.second.Provides)
	 providers[virt].insert(R.first);
   if (providers.empty() == true)
      return 0;

   size_t added = 0;
   for (auto &N : Graph)
   {
      // look up the names as they were before this package gained edges
      std::set<string> const before = N.second;
      for (auto const &dep : before)
      {
	 auto const P = providers.find(dep);
	 if (P == providers.end())
	    continue;
	 for (auto const &provider : P->second)
	 {
	    if (N.second.insert(provider).second == false)
	       continue;
	    ++added;
	    if (unlikely(debug))
	       std::clog << "Resolver: " << N.first << " -> " << provider << " (provides " << dep << ")" << std::endl;
	 }
      }
   }
   return added;
}

} // namespace AutoMark
