/**
 * Simulation of sample genealogies under the n-coalescent.
 *
 * Samples genealogies of a group of individuals back to their most recent
 * common ancestor, reports their statistics and exports them for plotting,
 * or compares replicate statistics with their theoretical expectations.
 */
#include "core/coalescent.hpp"
#include "core/config/ConfigStore.hpp"
#include "core/model/DataFrame.hpp"
#include "core/random.hpp"
#include "core/stats.hpp"
#include "core/stringio.hpp"
#include "core/treeio.hpp"

#include <boost/filesystem.hpp>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace std;
using config::ConfigStore;
using coalescent::CoalescentProcess;
using coalescent::Genealogy;
using model::DataFrame;
using stringio::format;
namespace fs = boost::filesystem;

/** Output file name, numbered when there is more than one replicate. */
string getOutputFilename(
  const fs::path& dir_out,
  const string& name,
  const string& ext,
  size_t idx,
  size_t n_reps)
{
  string fn = (n_reps > 1) ? format("%s_%lu.%s", name.c_str(), (unsigned long)idx, ext.c_str()) : name + "." + ext;
  return (dir_out / fn).string();
}

int runStudy(ConfigStore& config, RandomNumberGenerator<>& rng, const fs::path& dir_out) {
  vector<size_t> group_sizes = config.getStudyGroupSizes();
  size_t n_reps = config.getValue<long>("replicates");
  int verbosity = config.getValue<int>("verbosity");

  if (n_reps < 2) {
    fprintf(stderr, "\n[WARN] Only one replicate per group size, consider increasing '--replicates'.\n");
  }
  if (verbosity > 0) {
    fprintf(stderr, "\nSimulating %lu genealogies for each of %lu group sizes...\n", (unsigned long)n_reps, (unsigned long)group_sizes.size());
  }
  DataFrame<double> df = stats::compareWithTheory(group_sizes, n_reps, rng.getRandomSeed(), config.threads);
  if (verbosity > 0) {
    fprintf(stderr, "\nEmpirical mean vs expectation:\n%s", df.to_string().c_str());
  }

  string fn_out = (dir_out / "theory_comparison.csv").string();
  df.writeCSV(fn_out);
  if (verbosity > 0) {
    fprintf(stderr, "\n[INFO] Comparison written to '%s'.\n", fn_out.c_str());
  }
  return EXIT_SUCCESS;
}

int runGenealogies(ConfigStore& config, RandomNumberGenerator<>& rng, const fs::path& dir_out) {
  size_t n_samples = config.getValue<long>("samples");
  size_t n_reps = config.getValue<long>("replicates");
  bool out_dot = config.getValue<bool>("out-dot");
  bool out_newick = config.getValue<bool>("out-newick");
  bool out_path = config.getValue<bool>("out-path");
  int verbosity = config.getValue<int>("verbosity");

  CoalescentProcess process(n_samples, rng);
  vector<stats::GenealogyStats> vec_stats;
  vector<string> rownames;
  vector<vector<double>> data;

  for (size_t r=0; r<n_reps; r++) {
    if (verbosity > 1) {
      fprintf(stderr, "\nSampling genealogy %lu of %lu...\n", (unsigned long)(r+1), (unsigned long)n_reps);
    }
    Genealogy genealogy = process.sampleGenealogy(rng);

    stats::GenealogyStats s;
    s.depth = genealogy.depth();
    s.length = genealogy.length();
    s.pairwise_divergence = genealogy.meanPairwiseDivergence();
    vec_stats.push_back(s);
    rownames.push_back(to_string(r));
    data.push_back({ s.depth, s.length, s.pairwise_divergence });

    if (verbosity > 1) {
      fprintf(stderr, "  depth: %.4f, length: %.4f, mean pairwise divergence: %.4f\n", s.depth, s.length, s.pairwise_divergence);
      fprintf(stderr, "\nNewick representation of genealogy:\n");
      treeio::printNewick(genealogy, cerr);
    }

    if (out_newick) {
      treeio::printNewick(genealogy, getOutputFilename(dir_out, "genealogy", "tre", r, n_reps));
    }
    if (out_dot) {
      treeio::printDot(genealogy, getOutputFilename(dir_out, "genealogy", "dot", r, n_reps));
    }
    if (out_path) {
      treeio::writeLineageCounts(genealogy, getOutputFilename(dir_out, "lineages", "csv", r, n_reps));
      treeio::writeTrajectories(genealogy, getOutputFilename(dir_out, "trajectories", "csv", r, n_reps));
    }
  }

  DataFrame<double> df({ "depth", "length", "divergence" }, rownames, data);
  string fn_stats = (dir_out / "genealogies.csv").string();
  df.writeCSV(fn_stats);

  if (verbosity > 0) {
    stats::Summary sum_depth = stats::summarizeDepth(vec_stats);
    stats::Summary sum_length = stats::summarizeLength(vec_stats);
    stats::Summary sum_div = stats::summarizePairwiseDivergence(vec_stats);
    fprintf(stderr, "\nSummary over %lu genealogies of %lu individuals:\n", (unsigned long)n_reps, (unsigned long)n_samples);
    fprintf(stderr, "  depth:\t\t%.4f (var %.4f, expected %.4f)\n", sum_depth.mean, sum_depth.variance, stats::expectedDepth(n_samples));
    fprintf(stderr, "  length:\t\t%.4f (var %.4f, expected %.4f)\n", sum_length.mean, sum_length.variance, stats::expectedLength(n_samples));
    fprintf(stderr, "  divergence:\t\t%.4f (var %.4f, expected %.4f)\n", sum_div.mean, sum_div.variance, stats::expectedPairwiseDivergence(n_samples));
    fprintf(stderr, "\n[INFO] Statistics written to '%s'.\n", fn_stats.c_str());
  }

  return EXIT_SUCCESS;
}

int main (int argc, char* argv[])
{
  // user params (defined in config file or command line)
  ConfigStore config;
  bool args_ok = config.parseArgs(argc, argv);
  if (!args_ok) { return EXIT_FAILURE; }

  long seed = config.getValue<long>("seed");
  fs::path dir_out(config.getValue<string>("out-dir"));

  try {
    // create output directory
    if (!fs::exists(dir_out)) {
      fs::create_directories(dir_out);
    }

    RandomNumberGenerator<> rng(seed);
    if (config.getValue<bool>("study")) {
      return runStudy(config, rng, dir_out);
    }
    return runGenealogies(config, rng, dir_out);
  }
  catch (const std::exception& e) {
    fprintf(stderr, "\n[ERROR] %s\n", e.what());
    return EXIT_FAILURE;
  }
}
