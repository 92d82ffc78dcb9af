#ifndef COALESCENTPROCESS_H
#define COALESCENTPROCESS_H

#include "Genealogy.hpp"
#include "Partition.hpp"
#include "../random.hpp"

#include <boost/optional.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace coalescent {

/** One transition of the process: waiting time and merged representatives. */
struct CoalescenceEvent
{
  double time_step;
  MergeStep lineages;
};

/** Point of a sample path: waiting time and the state reached after it. */
typedef std::pair<double, Partition> PathPoint;

/** n-coalescent process on the partitions of {0,...,n-1}.
 *
 *  Starts with n singletons; each pair of current sets merges at rate 1, so
 *  with k sets the next event happens after an exponential waiting time of
 *  rate k(k-1)/2. The process ends when a single set remains.
 *
 *  Owns its state and its random source; copying a process copies both.
 */
class CoalescentProcess
{
public:
  CoalescentProcess(std::size_t group_size, RandomNumberGenerator<> rng);

  const Partition& getState() const;
  void setState(const Partition& state);
  RandomNumberGenerator<>& getRng();
  void setRng(const RandomNumberGenerator<>& rng);
  std::size_t getGroupSize() const;
  /** True if no further events can happen (at most one set left). */
  bool isTerminal() const;

  /** Draw the next event without changing the state (only the random source advances).
   *  \return empty if the process is in its terminal state
   */
  boost::optional<CoalescenceEvent> peekNextStep();
  /** Draw the next event and apply it to the state.
   *  \return empty if the process is in its terminal state
   */
  boost::optional<CoalescenceEvent> nextStep();

  /** Sample a complete path from n singletons to a single set.
   *
   *  The state of this process is not touched: the path is generated by an
   *  independent process running on a copy of 'rng', whose final state is
   *  written back to 'rng'.
   *  \return (0, initial state) followed by (waiting time, state) per event
   */
  std::vector<PathPoint> samplePath(RandomNumberGenerator<>& rng) const;
  /** Sample the genealogy of n individuals (see samplePath()). */
  Genealogy sampleGenealogy(RandomNumberGenerator<>& rng) const;
  /** Sample a path from the current state using the process' own random source.
   *  The state is restored afterwards, the random source stays advanced.
   */
  std::vector<PathPoint> generateRealization();

private:
  std::size_t m_groupSize;
  Partition m_state;
  RandomNumberGenerator<> m_rng;
};

} // namespace coalescent

#endif // COALESCENTPROCESS_H
