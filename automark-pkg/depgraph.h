/*
 * depgraph.h - the dependency graph of the candidate packages
 *
 * SPDX-License-Identifier: GPL-2.0+
 */
#ifndef AUTOMARKLIB_DEPGRAPH_H
#define AUTOMARKLIB_DEPGRAPH_H

#include <automark-pkg/deprecords.h>
#include <automark-pkg/macros.h>

#include <map>
#include <set>
#include <string>

namespace AutoMark
{

/**
 * \brief Mapping of each package to the names it depends on
 *
 * Targets don't need to be nodes of the graph themselves: dependencies
 * on packages outside of the candidate set and on virtual names stay
 * around until the reducer prunes them. Iteration is in name order.
 */
class AUTOMARK_PUBLIC DepGraph
{
   public:
   typedef std::map<std::string, std::set<std::string>> NodeMap;
   typedef NodeMap::iterator iterator;
   typedef NodeMap::const_iterator const_iterator;

   private:
   NodeMap nodes;

   public:
   /** \brief add Name as a node, keeping its edges if it exists already */
   std::set<std::string> &AddNode(std::string const &Name);
   void AddEdge(std::string const &From, std::string const &To);
   void AddRecord(DepRecord const &Record);

   bool Contains(std::string const &Name) const { return nodes.find(Name) != nodes.end(); }
   /** \brief the targets of Name, empty for names which aren't nodes */
   std::set<std::string> const &Depends(std::string const &Name) const;
   std::set<std::string> Names() const;

   iterator begin() { return nodes.begin(); }
   iterator end() { return nodes.end(); }
   const_iterator begin() const { return nodes.begin(); }
   const_iterator end() const { return nodes.end(); }
   iterator erase(iterator const &Node) { return nodes.erase(Node); }
   size_t size() const { return nodes.size(); }
   bool empty() const { return nodes.empty(); }

   bool operator==(DepGraph const &Other) const { return nodes == Other.nodes; }
   bool operator!=(DepGraph const &Other) const { return nodes != Other.nodes; }

   DepGraph() = default;
   explicit DepGraph(DepRecordParser::RecordMap const &Records);
};

/**
 * \brief redirect dependencies on virtual names to their providers
 *
 * Every package depending on a name v gains an edge to each package
 * providing v. The edge to v itself is kept, the reducer drops it later
 * as v is no node of its own. Provides are not chained: names added here
 * are not looked up again.
 *
 * \return the number of edges added
 */
AUTOMARK_PUBLIC size_t ResolveProvides(DepGraph &Graph, DepRecordParser::RecordMap const &Records);

} // namespace AutoMark

#endif
