#include "CoalescentProcess.hpp"

#include <functional>
#include <iostream>

using namespace std;

namespace coalescent {

CoalescentProcess::CoalescentProcess(size_t group_size, RandomNumberGenerator<> rng)
: m_groupSize(group_size),
  m_state(group_size),
  m_rng(rng)
{}

const Partition& CoalescentProcess::getState() const {
  return m_state;
}

void CoalescentProcess::setState(const Partition& state) {
  m_state = state;
}

RandomNumberGenerator<>& CoalescentProcess::getRng() {
  return m_rng;
}

void CoalescentProcess::setRng(const RandomNumberGenerator<>& rng) {
  m_rng = rng;
}

size_t CoalescentProcess::getGroupSize() const {
  return m_groupSize;
}

bool CoalescentProcess::isTerminal() const {
  return m_state.numSets() <= 1;
}

boost::optional<CoalescenceEvent> CoalescentProcess::peekNextStep() {
  size_t k = m_state.numSets();
  if (k <= 1) {
    return boost::none;
  }

  // waiting time until the first of k(k-1)/2 pairs coalesces
  double rate = double(k) * double(k-1) / 2.0;
  CoalescenceEvent event;
  std::function<double()> random_exp = m_rng.getRandomExponential(rate);
  // waiting times are strictly positive
  do {
    event.time_step = random_exp();
  } while (event.time_step <= 0.0);

  // pick two of the current sets, resolve them to their representatives
  vector<size_t> set_indices = m_rng.getRandomSample(k, 2);
  event.lineages[0] = m_state.getSetRepresentative(set_indices[0]);
  event.lineages[1] = m_state.getSetRepresentative(set_indices[1]);

  return event;
}

boost::optional<CoalescenceEvent> CoalescentProcess::nextStep() {
  boost::optional<CoalescenceEvent> event = peekNextStep();
  if (event) {
    m_state.merge(event->lineages[0], event->lineages[1]);
#ifdef DEBUG
    cerr << "[DEBUG] t+" << event->time_step << ": " << m_state << endl;
#endif
  }
  return event;
}

vector<PathPoint> CoalescentProcess::samplePath(RandomNumberGenerator<>& rng) const {
  CoalescentProcess process(m_groupSize, rng);
  vector<PathPoint> path;
  path.reserve(m_groupSize > 0 ? m_groupSize : 1);
  path.push_back(make_pair(0.0, process.getState()));
  while (boost::optional<CoalescenceEvent> event = process.nextStep()) {
    path.push_back(make_pair(event->time_step, process.getState()));
  }
  rng = process.getRng();
  return path;
}

Genealogy CoalescentProcess::sampleGenealogy(RandomNumberGenerator<>& rng) const {
  CoalescentProcess process(m_groupSize, rng);
  vector<Partition> path;
  vector<MergeStep> steps;
  vector<double> time_steps;
  if (m_groupSize > 1) {
    path.reserve(m_groupSize);
    steps.reserve(m_groupSize-1);
    time_steps.reserve(m_groupSize-1);
  }
  path.push_back(process.getState());
  while (boost::optional<CoalescenceEvent> event = process.nextStep()) {
    path.push_back(process.getState());
    steps.push_back(event->lineages);
    time_steps.push_back(event->time_step);
  }
  rng = process.getRng();
  return Genealogy(std::move(path), std::move(steps), std::move(time_steps));
}

vector<PathPoint> CoalescentProcess::generateRealization() {
  Partition initial_state = m_state;
  vector<PathPoint> path;
  path.push_back(make_pair(0.0, initial_state));
  while (boost::optional<CoalescenceEvent> event = nextStep()) {
    path.push_back(make_pair(event->time_step, m_state));
  }
  m_state = initial_state;
  return path;
}

} // namespace coalescent
