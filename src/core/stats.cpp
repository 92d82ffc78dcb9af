#include "stats.hpp"
#include "coalescent.hpp"
#include "random.hpp"

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <cmath>
#include <stdexcept>

using namespace std;
using namespace boost::accumulators;
using coalescent::CoalescentProcess;
using coalescent::Genealogy;
using model::DataFrame;

namespace stats {

double expectedDepth(size_t n) {
  if (n < 2) {
    return 0.0;
  }
  return 2.0 * (1.0 - 1.0/double(n));
}

double varianceDepth(size_t n) {
  double var = 0.0;
  for (size_t k=2; k<=n; ++k) {
    double mean_k = 2.0 / (double(k) * double(k-1));
    var += mean_k * mean_k;
  }
  return var;
}

double expectedLength(size_t n) {
  double harmonic = 0.0;
  for (size_t j=1; j<n; ++j) {
    harmonic += 1.0 / double(j);
  }
  return 2.0 * harmonic;
}

double approxExpectedLength(size_t n) {
  if (n < 2) {
    return 0.0;
  }
  double m = double(n - 1);
  return 2.0 * (log(m) + EULER_GAMMA + 1.0/(2.0*m));
}

double varianceLength(size_t n) {
  double var = 0.0;
  for (size_t j=1; j<n; ++j) {
    var += 4.0 / (double(j) * double(j));
  }
  return var;
}

double expectedPairwiseDivergence(size_t n) {
  return (n < 2) ? 0.0 : 2.0;
}

vector<GenealogyStats> simulateReplicates(
  size_t n,
  size_t replicates,
  long seed,
  int threads)
{
  if (threads < 1) {
    throw invalid_argument("simulateReplicates: number of threads must be positive");
  }
  // one seed per replicate, drawn up front
  RandomNumberGenerator<> rng_master(seed);
  vector<long> seeds(replicates);
  for (size_t i=0; i<replicates; ++i) {
    seeds[i] = rng_master.getRandomSeed();
  }

  vector<GenealogyStats> results(replicates);
  long num_reps = static_cast<long>(replicates);
#pragma omp parallel for num_threads(threads) schedule(dynamic)
  for (long i=0; i<num_reps; ++i) {
    RandomNumberGenerator<> rng(seeds[i]);
    CoalescentProcess process(n, rng);
    Genealogy genealogy = process.sampleGenealogy(rng);
    GenealogyStats s;
    s.depth = genealogy.depth();
    s.length = genealogy.length();
    s.pairwise_divergence = genealogy.meanPairwiseDivergence();
    results[i] = s;
  }

  return results;
}

namespace {

template <typename Getter>
Summary summarize(const vector<GenealogyStats>& reps, Getter get_value) {
  accumulator_set<double, boost::accumulators::stats<tag::mean, tag::variance>> acc;
  for (const GenealogyStats& s : reps) {
    acc(get_value(s));
  }
  Summary summary;
  summary.count = reps.size();
  summary.mean = reps.empty() ? 0.0 : boost::accumulators::mean(acc);
  summary.variance = reps.empty() ? 0.0 : boost::accumulators::variance(acc);
  return summary;
}

double getDepth(const GenealogyStats& s) { return s.depth; }
double getLength(const GenealogyStats& s) { return s.length; }
double getPairwiseDivergence(const GenealogyStats& s) { return s.pairwise_divergence; }

} // namespace

Summary summarizeDepth(const vector<GenealogyStats>& reps) {
  return summarize(reps, getDepth);
}

Summary summarizeLength(const vector<GenealogyStats>& reps) {
  return summarize(reps, getLength);
}

Summary summarizePairwiseDivergence(const vector<GenealogyStats>& reps) {
  return summarize(reps, getPairwiseDivergence);
}

DataFrame<double> compareWithTheory(
  const vector<size_t>& group_sizes,
  size_t replicates,
  long seed,
  int threads)
{
  vector<string> colnames = {
    "depth", "depth_expected",
    "length", "length_expected",
    "divergence", "divergence_expected"
  };
  vector<string> rownames;
  vector<vector<double>> data;

  RandomNumberGenerator<> rng_master(seed);
  for (size_t n : group_sizes) {
    vector<GenealogyStats> reps = simulateReplicates(n, replicates, rng_master.getRandomSeed(), threads);
    vector<double> row = {
      summarizeDepth(reps).mean, expectedDepth(n),
      summarizeLength(reps).mean, expectedLength(n),
      summarizePairwiseDivergence(reps).mean, expectedPairwiseDivergence(n)
    };
    rownames.push_back(to_string(n));
    data.push_back(row);
  }

  return DataFrame<double>(colnames, rownames, data);
}

} // namespace stats
