/*
 * cyclefinder.h - find the packages held back by dependency cycles
 *
 * SPDX-License-Identifier: GPL-2.0+
 */
#ifndef AUTOMARKLIB_CYCLEFINDER_H
#define AUTOMARKLIB_CYCLEFINDER_H

#include <automark-pkg/depgraph.h>
#include <automark-pkg/deprecords.h>
#include <automark-pkg/macros.h>

#include <set>
#include <string>
#include <vector>

namespace AutoMark
{

/**
 * \brief strip the graph down to the nodes taking part in a cycle
 *
 * Each pass first drops every edge whose target isn't a node and then
 * removes the nodes left without any edges. A node only emptied by the
 * removals of one pass goes in the next one. This is repeated until a
 * pass removes nothing, leaving only nodes whose targets are all nodes.
 *
 * \return the removed nodes, their dependencies end without a cycle
 */
AUTOMARK_PUBLIC std::set<std::string> ReduceAcyclic(DepGraph &Graph);

/** \brief partition the graph into groups of nodes reachable from each other
 *
 * Nodes are visited in name order, a depth-first walk from each node
 * not seen yet collects all nodes reachable from it which no earlier
 * walk collected. Cycles sharing a node therefore end up in one group. */
AUTOMARK_PUBLIC std::vector<std::set<std::string>> CycleGroups(DepGraph const &Graph);

/** \brief the display string of a group, members joined by ", " */
AUTOMARK_PUBLIC std::string FormatCycle(std::set<std::string> const &Group);

/** \brief the display strings of CycleGroups, sorted */
AUTOMARK_PUBLIC std::vector<std::string> GroupCycles(DepGraph const &Graph);

/** \brief all outputs of a detection run */
struct AUTOMARK_PUBLIC CycleReport
{
   /// packages which can be marked as automatically installed
   std::set<std::string> Acyclic;
   /// the nodes which are part of or depend on a cycle
   std::set<std::string> Residual;
   std::vector<std::string> Cycles;

   /** \brief residual and acyclic nodes together */
   std::set<std::string> Nodes() const;
};

/** \brief run the resolver, the reducer and the enumerator on the records */
AUTOMARK_PUBLIC CycleReport FindCycles(DepRecordParser::RecordMap const &Records);

} // namespace AutoMark

#endif
