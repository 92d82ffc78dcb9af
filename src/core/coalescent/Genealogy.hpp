#ifndef GENEALOGY_H
#define GENEALOGY_H

#include "Partition.hpp"

#include <boost/graph/adjacency_list.hpp>
#include <boost/optional.hpp>
#include <array>
#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

namespace coalescent {

/** Pair of representatives whose sets were merged in one coalescence event. */
typedef std::array<std::size_t, 2> MergeStep;

/** Node of the ancestry graph.
 *  Tips have generation 0, the ancestor created by the g-th event has
 *  generation g and is labelled by the smaller of the merged representatives.
 */
struct AncestryNode
{
  std::size_t generation;
  std::size_t representative;
};

/** Undirected ancestry graph, edge weights are branch lengths (time). */
typedef boost::adjacency_list<
  boost::vecS,
  boost::vecS,
  boost::undirectedS,
  AncestryNode,
  boost::property<boost::edge_weight_t, double>
> AncestryGraph;

typedef boost::graph_traits<AncestryGraph>::vertex_descriptor AncestryVertex;
typedef boost::graph_traits<AncestryGraph>::edge_descriptor AncestryEdge;

/** Realized history of a coalescent process run to completion.
 *
 *  Describes the ancestors of a group of individuals back to their most recent
 *  common ancestor: every partition visited, the pair of sets merged at each
 *  event and the waiting time before each event. Created by
 *  CoalescentProcess::sampleGenealogy() and not modified afterwards; const
 *  queries may be called from several threads at once.
 */
class Genealogy
{
public:
  /** \param path        partitions from all singletons to a single set
   *  \param steps       merged representatives per event
   *  \param time_steps  waiting time before each event (positive)
   *
   *  Throws std::invalid_argument unless every state of the path results
   *  from merging the two sets named by the corresponding step.
   */
  Genealogy(
    std::vector<Partition> path,
    std::vector<MergeStep> steps,
    std::vector<double> time_steps);
  Genealogy(const Genealogy& other);
  Genealogy& operator=(const Genealogy& other);

  const std::vector<Partition>& getPath() const;
  const std::vector<MergeStep>& getSteps() const;
  const std::vector<double>& getTimeSteps() const;
  /** Number of individuals in the sample. */
  std::size_t getGroupSize() const;
  /** Number of coalescence events. */
  std::size_t getNumEvents() const;

  /** Time from the sample to its most recent common ancestor. */
  double depth() const;
  /** Sum of all branch lengths. */
  double length() const;
  /** Distance between two individuals through their most recent common ancestor.
   *
   *  To compute the mean over all pairs, prefer meanPairwiseDivergence().
   */
  double divergence(std::size_t index_1, std::size_t index_2) const;
  /** Mean divergence over all pairs of individuals, in linear time. */
  double meanPairwiseDivergence() const;

  /** Absolute time of each event (cumulative waiting times). */
  std::vector<double> getEventTimes() const;
  /** Number of lineages over time, starting with (0, n). */
  std::vector<std::pair<double, std::size_t>> getLineageCounts() const;
  /** Representative of the lineage carrying individual i in each state of the path. */
  std::vector<std::size_t> getTrajectory(std::size_t index) const;

  /** Has the ancestry graph been built yet? */
  bool hasGraph() const;
  /** Ancestry graph; built on first request and cached afterwards. */
  const AncestryGraph& getGraph() const;

private:
  void _checkIndex(std::size_t index) const;
  void _computeGraph() const;

  std::vector<Partition> m_vecPath;
  std::vector<MergeStep> m_vecSteps;
  std::vector<double> m_vecTimeSteps;
  mutable boost::optional<AncestryGraph> m_graph;
  mutable std::mutex m_mtxGraph;
};

} // namespace coalescent

#endif // GENEALOGY_H
