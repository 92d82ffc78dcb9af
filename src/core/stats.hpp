#ifndef STATS_H
#define STATS_H

#include "model/DataFrame.hpp"

#include <cstddef>
#include <string>
#include <vector>

/** Replicate studies comparing simulated genealogies with coalescent theory. */
namespace stats {

/** Euler-Mascheroni constant */
const double EULER_GAMMA = 0.57721566490153286;

/** Expected time to the most recent common ancestor of n individuals. */
double expectedDepth(std::size_t n);
/** Variance of the time to the most recent common ancestor. */
double varianceDepth(std::size_t n);
/** Expected total branch length: 2 * H(n-1). */
double expectedLength(std::size_t n);
/** Asymptotic form of the expected total branch length:
 *  2 * (ln(n-1) + gamma + 1/(2(n-1))).
 */
double approxExpectedLength(std::size_t n);
/** Variance of the total branch length. */
double varianceLength(std::size_t n);
/** Expected mean pairwise divergence (each pair coalesces at rate 1). */
double expectedPairwiseDivergence(std::size_t n);

/** Statistics of one simulated genealogy. */
struct GenealogyStats
{
  double depth;
  double length;
  double pairwise_divergence;
};

/** Empirical mean and variance of a quantity. */
struct Summary
{
  std::size_t count;
  double mean;
  double variance;
};

/** Simulate independent genealogies of n individuals.
 *
 *  Each replicate runs on its own generator, seeded from a master generator
 *  initialized with 'seed', so results do not depend on the number of threads.
 *  \param threads  number of parallel threads (OpenMP)
 */
std::vector<GenealogyStats> simulateReplicates(
  std::size_t n,
  std::size_t replicates,
  long seed,
  int threads = 1);

/** Empirical mean and variance of depths, lengths, pairwise divergences. */
Summary summarizeDepth(const std::vector<GenealogyStats>& reps);
Summary summarizeLength(const std::vector<GenealogyStats>& reps);
Summary summarizePairwiseDivergence(const std::vector<GenealogyStats>& reps);

/** Compare empirical means with their expectations for several group sizes.
 *  Rows are labelled by group size, columns hold empirical and expected
 *  values of depth, length and mean pairwise divergence.
 */
model::DataFrame<double> compareWithTheory(
  const std::vector<std::size_t>& group_sizes,
  std::size_t replicates,
  long seed,
  int threads = 1);

} // namespace stats

#endif /* STATS_H */
