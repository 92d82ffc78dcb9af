#include "treeio.hpp"
#include "stringio.hpp"

#include <boost/graph/graphviz.hpp>
#include <fstream>
#include <stdexcept>
#include <vector>

using namespace std;
using stringio::format;
using coalescent::AncestryGraph;
using coalescent::AncestryVertex;
using coalescent::AncestryEdge;
using coalescent::Genealogy;

namespace treeio {

namespace {

/** Open output file, fail loudly if that is not possible. */
void openOutput(ofstream& fs, const string& filename) {
  fs.open(filename.c_str());
  if (!fs.good()) {
    throw runtime_error("Could not open file '" + filename + "' for writing.");
  }
}

/** Labels ancestry nodes as "g<generation>_<representative>". */
struct AncestryNodeWriter
{
  const AncestryGraph& m_graph;
  AncestryNodeWriter(const AncestryGraph& g) : m_graph(g) {}
  void operator()(ostream& os, const AncestryVertex& v) const {
    const coalescent::AncestryNode& node = m_graph[v];
    os << "[label=\"" << format("g%lu_%lu", (unsigned long)node.generation, (unsigned long)node.representative) << "\"";
    if (node.generation == 0) {
      os << ",style=filled,color=tomato";
    }
    os << "]";
  }
};

struct AncestryEdgeWriter
{
  const AncestryGraph& m_graph;
  AncestryEdgeWriter(const AncestryGraph& g) : m_graph(g) {}
  void operator()(ostream& os, const AncestryEdge& e) const {
    double w = get(boost::edge_weight, m_graph, e);
    os << "[label=\"" << format("%0.4f", w) << "\"]";
  }
};

void printNewickRec(
  const AncestryGraph& g,
  AncestryVertex v,
  const vector<double>& gen_times,
  ostream& os)
{
  size_t gen = g[v].generation;
  vector<AncestryVertex> children;
  AncestryGraph::adjacency_iterator it, it_end;
  for (boost::tie(it, it_end) = adjacent_vertices(v, g); it != it_end; ++it) {
    if (g[*it].generation < gen) {
      children.push_back(*it);
    }
  }
  if (children.size() > 0) {
    os << "(";
    bool first = true;
    for (AncestryVertex c : children) {
      if (!first) {
        os << ",";
      }
      printNewickRec(g, c, gen_times, os);
      os << format(":%g", gen_times[gen] - gen_times[g[c].generation]);
      first = false;
    }
    os << ")";
  } else {
    os << g[v].representative;
  }
}

} // namespace

void printNewick(const Genealogy& genealogy, ostream& os) {
  const AncestryGraph& g = genealogy.getGraph();
  if (num_vertices(g) > 0) {
    // absolute time of each generation
    vector<double> gen_times(1, 0.0);
    for (double t : genealogy.getEventTimes()) {
      gen_times.push_back(t);
    }
    // most ancestral node was added last
    AncestryVertex root = num_vertices(g) - 1;
    printNewickRec(g, root, gen_times, os);
  }
  os << ';' << endl;
}

void printNewick(const Genealogy& genealogy, const string filename) {
  ofstream fs;
  openOutput(fs, filename);
  printNewick(genealogy, fs);
  fs.close();
}

void printDot(const Genealogy& genealogy, ostream& os) {
  const AncestryGraph& g = genealogy.getGraph();
  boost::write_graphviz(os, g, AncestryNodeWriter(g), AncestryEdgeWriter(g));
}

void printDot(const Genealogy& genealogy, const string filename) {
  ofstream fs;
  openOutput(fs, filename);
  printDot(genealogy, fs);
  fs.close();
}

void writeLineageCounts(const Genealogy& genealogy, ostream& os) {
  os << "time,lineages" << endl;
  for (auto point : genealogy.getLineageCounts()) {
    os << format("%g,%lu", point.first, (unsigned long)point.second) << endl;
  }
}

void writeLineageCounts(const Genealogy& genealogy, const string filename) {
  ofstream fs;
  openOutput(fs, filename);
  writeLineageCounts(genealogy, fs);
  fs.close();
}

void writeTrajectories(const Genealogy& genealogy, ostream& os) {
  size_t n = genealogy.getGroupSize();
  vector<vector<size_t>> trajectories;
  os << "time";
  for (size_t i=0; i<n; ++i) {
    os << "," << i;
    trajectories.push_back(genealogy.getTrajectory(i));
  }
  os << endl;

  vector<double> times(1, 0.0);
  for (double t : genealogy.getEventTimes()) {
    times.push_back(t);
  }
  for (size_t k=0; k<times.size(); ++k) {
    os << format("%g", times[k]);
    for (size_t i=0; i<n; ++i) {
      os << "," << trajectories[i][k];
    }
    os << endl;
  }
}

void writeTrajectories(const Genealogy& genealogy, const string filename) {
  ofstream fs;
  openOutput(fs, filename);
  writeTrajectories(genealogy, fs);
  fs.close();
}

} // namespace treeio
