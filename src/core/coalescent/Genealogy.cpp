#include "Genealogy.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>

using namespace std;

namespace coalescent {

Genealogy::Genealogy(
  vector<Partition> path,
  vector<MergeStep> steps,
  vector<double> time_steps)
: m_vecPath(std::move(path)),
  m_vecSteps(std::move(steps)),
  m_vecTimeSteps(std::move(time_steps))
{
  if (m_vecPath.empty()) {
    throw invalid_argument("Genealogy: path must contain at least the initial state");
  }
  if (m_vecSteps.size() != m_vecTimeSteps.size() || m_vecSteps.size()+1 != m_vecPath.size()) {
    throw invalid_argument("Genealogy: mismatched lengths (path: " + to_string(m_vecPath.size()) +
      ", steps: " + to_string(m_vecSteps.size()) + ", time steps: " + to_string(m_vecTimeSteps.size()) + ")");
  }
  size_t n = m_vecPath[0].size();
  for (size_t i=0; i<m_vecPath.size(); ++i) {
    if (m_vecPath[i].size() != n || m_vecPath[i].numSets() + i != n) {
      throw invalid_argument("Genealogy: state " + to_string(i) + " is not reachable by " + to_string(i) + " merges");
    }
  }
  for (size_t i=0; i<m_vecSteps.size(); ++i) {
    size_t a = m_vecSteps[i][0];
    size_t b = m_vecSteps[i][1];
    if (a >= n || b >= n || m_vecPath[i].sameSet(a, b)) {
      throw invalid_argument("Genealogy: step " + to_string(i) + " does not join two sets of state " + to_string(i));
    }
    Partition next = m_vecPath[i];
    next.merge(a, b);
    if (next != m_vecPath[i+1]) {
      throw invalid_argument("Genealogy: state " + to_string(i+1) + " does not follow from step " + to_string(i));
    }
  }
  for (double t : m_vecTimeSteps) {
    if (!(t > 0) || !std::isfinite(t)) {
      throw invalid_argument("Genealogy: waiting times must be positive and finite");
    }
  }
}

Genealogy::Genealogy(const Genealogy& other)
: m_vecPath(other.m_vecPath),
  m_vecSteps(other.m_vecSteps),
  m_vecTimeSteps(other.m_vecTimeSteps)
{
  std::lock_guard<std::mutex> lock(other.m_mtxGraph);
  m_graph = other.m_graph;
}

Genealogy& Genealogy::operator=(const Genealogy& other) {
  if (this == &other) {
    return *this;
  }
  m_vecPath = other.m_vecPath;
  m_vecSteps = other.m_vecSteps;
  m_vecTimeSteps = other.m_vecTimeSteps;
  boost::optional<AncestryGraph> graph;
  {
    std::lock_guard<std::mutex> lock(other.m_mtxGraph);
    graph = other.m_graph;
  }
  std::lock_guard<std::mutex> lock(m_mtxGraph);
  m_graph = graph;
  return *this;
}

const vector<Partition>& Genealogy::getPath() const {
  return m_vecPath;
}

const vector<MergeStep>& Genealogy::getSteps() const {
  return m_vecSteps;
}

const vector<double>& Genealogy::getTimeSteps() const {
  return m_vecTimeSteps;
}

size_t Genealogy::getGroupSize() const {
  return m_vecPath[0].size();
}

size_t Genealogy::getNumEvents() const {
  return m_vecSteps.size();
}

double Genealogy::depth() const {
  double total = 0.0;
  for (double t : m_vecTimeSteps) {
    total += t;
  }
  return total;
}

double Genealogy::length() const {
  size_t group_size = getGroupSize();
  double total = 0.0;
  // during the i-th interval (group_size - i) lineages are alive
  for (size_t i=0; i<m_vecTimeSteps.size(); ++i) {
    total += double(group_size - i) * m_vecTimeSteps[i];
  }
  return total;
}

void Genealogy::_checkIndex(size_t index) const {
  if (index >= getGroupSize()) {
    throw out_of_range("Genealogy: individual " + to_string(index) + " out of range (group size " + to_string(getGroupSize()) + ")");
  }
}

double Genealogy::divergence(size_t index_1, size_t index_2) const {
  _checkIndex(index_1);
  _checkIndex(index_2);
  size_t counter = 0;
  for (const Partition& state : m_vecPath) {
    if (state.sameSet(index_1, index_2)) {
      break;
    }
    counter++;
  }
  double time_to_mrca = 0.0;
  for (size_t i=0; i<counter; ++i) {
    time_to_mrca += m_vecTimeSteps[i];
  }
  return 2.0 * time_to_mrca;
}

double Genealogy::meanPairwiseDivergence() const {
  size_t group_size = getGroupSize();
  if (group_size < 2) {
    return 0.0;
  }
  double cumulative_time = 0.0;
  double cumulative_divergence = 0.0;

  for (size_t i=0; i<m_vecSteps.size(); ++i) {
    const MergeStep& step = m_vecSteps[i];
    const Partition& state = m_vecPath[i];
    cumulative_time += m_vecTimeSteps[i];

    // every pair across the two merging sets coalesces here
    double num_pairs = double(state.sizeOfSet(step[0])) * double(state.sizeOfSet(step[1]));
    cumulative_divergence += (2.0 * cumulative_time) * num_pairs;
  }

  return cumulative_divergence * 2.0 / (double(group_size) * double(group_size - 1));
}

vector<double> Genealogy::getEventTimes() const {
  vector<double> times;
  double t = 0.0;
  for (double dt : m_vecTimeSteps) {
    t += dt;
    times.push_back(t);
  }
  return times;
}

vector<pair<double, size_t>> Genealogy::getLineageCounts() const {
  vector<pair<double, size_t>> counts;
  counts.push_back(make_pair(0.0, m_vecPath[0].numSets()));
  double t = 0.0;
  for (size_t i=0; i<m_vecTimeSteps.size(); ++i) {
    t += m_vecTimeSteps[i];
    counts.push_back(make_pair(t, m_vecPath[i+1].numSets()));
  }
  return counts;
}

vector<size_t> Genealogy::getTrajectory(size_t index) const {
  _checkIndex(index);
  vector<size_t> trajectory;
  trajectory.reserve(m_vecPath.size());
  for (const Partition& state : m_vecPath) {
    trajectory.push_back(state.find(index));
  }
  return trajectory;
}

bool Genealogy::hasGraph() const {
  std::lock_guard<std::mutex> lock(m_mtxGraph);
  return bool(m_graph);
}

const AncestryGraph& Genealogy::getGraph() const {
  std::lock_guard<std::mutex> lock(m_mtxGraph);
  if (!m_graph) {
    _computeGraph();
  }
  return *m_graph;
}

void Genealogy::_computeGraph() const {
  size_t group_size = getGroupSize();
  AncestryGraph graph;

  if (m_vecSteps.empty()) {
    if (group_size > 0) {
      AncestryNode node = { 0, 0 };
      add_vertex(node, graph);
    }
    m_graph = graph;
    return;
  }

  map<pair<size_t, size_t>, AncestryVertex> node_indices;
  // generation in which each representative was last updated
  vector<size_t> rep_generation(group_size, 0);
  for (size_t i=0; i<group_size; ++i) {
    AncestryNode node = { 0, i };
    node_indices[make_pair(size_t(0), i)] = add_vertex(node, graph);
  }

  Partition state(group_size);
  for (size_t g=0; g<m_vecSteps.size(); ++g) {
    double time_step = m_vecTimeSteps[g];
    const MergeStep& step = m_vecSteps[g];

    size_t rep_1 = state.find(step[0]);
    size_t rep_2 = state.find(step[1]);
    size_t rep_new = std::min(rep_1, rep_2);

    // add parent node
    AncestryNode node = { g+1, rep_new };
    AncestryVertex v_parent = add_vertex(node, graph);
    node_indices[make_pair(g+1, rep_new)] = v_parent;

    // connect it to the current nodes of both lineages
    AncestryVertex v_child_1 = node_indices.at(make_pair(rep_generation[rep_1], rep_1));
    AncestryVertex v_child_2 = node_indices.at(make_pair(rep_generation[rep_2], rep_2));
    add_edge(v_parent, v_child_1, time_step, graph);
    add_edge(v_parent, v_child_2, time_step, graph);

    rep_generation[rep_new] = g+1;
    state.merge(step[0], step[1]);
  }

  m_graph = graph;
}

} // namespace coalescent
