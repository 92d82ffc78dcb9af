#include "Partition.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

using namespace std;

namespace coalescent {

Partition::Partition() : m_numElements(0), m_sets(0) {}

Partition::Partition(size_t n) :
  m_numElements(n),
  m_sets(n),
  m_vecSize(n, 1),
  m_vecMin(n),
  m_vecNext(n),
  m_vecReps(n)
{
  for (size_t i=0; i<n; ++i) {
    m_vecMin[i] = i;
    m_vecNext[i] = i;
    m_vecReps[i] = i;
  }
}

size_t Partition::size() const {
  return m_numElements;
}

size_t Partition::numSets() const {
  return m_vecReps.size();
}

void Partition::_checkElement(size_t i) const {
  if (i >= m_numElements) {
    throw out_of_range("Partition: element " + to_string(i) + " out of range (size " + to_string(m_numElements) + ")");
  }
}

size_t Partition::_root(size_t i) const {
  return m_sets.find_set(i);
}

size_t Partition::find(size_t i) const {
  _checkElement(i);
  return m_vecMin[_root(i)];
}

bool Partition::sameSet(size_t a, size_t b) const {
  _checkElement(a);
  _checkElement(b);
  return _root(a) == _root(b);
}

size_t Partition::sizeOfSet(size_t i) const {
  _checkElement(i);
  return m_vecSize[_root(i)];
}

void Partition::merge(size_t a, size_t b) {
  _checkElement(a);
  _checkElement(b);
  size_t ra = _root(a);
  size_t rb = _root(b);
  if (ra == rb) {
    return;
  }
  size_t size_joint = m_vecSize[ra] + m_vecSize[rb];
  size_t min_joint = std::min(m_vecMin[ra], m_vecMin[rb]);
  size_t rep_drop = std::max(m_vecMin[ra], m_vecMin[rb]);
  // splice the two member lists into one cycle
  std::swap(m_vecNext[ra], m_vecNext[rb]);

  m_sets.link(ra, rb);
  size_t r = _root(ra);
  m_vecSize[r] = size_joint;
  m_vecMin[r] = min_joint;

  // point every member of the joined set directly at its root
  vector<size_t> members;
  members.reserve(size_joint);
  size_t j = r;
  do {
    members.push_back(j);
    j = m_vecNext[j];
  } while (j != r);
  m_sets.compress_sets(members.begin(), members.end());

  auto it = lower_bound(m_vecReps.begin(), m_vecReps.end(), rep_drop);
  m_vecReps.erase(it);
}

size_t Partition::getSetRepresentative(size_t k) const {
  if (k >= m_vecReps.size()) {
    throw out_of_range("Partition: set index " + to_string(k) + " out of range (" + to_string(m_vecReps.size()) + " sets)");
  }
  return m_vecReps[k];
}

const vector<size_t>& Partition::getRepresentatives() const {
  return m_vecReps;
}

vector<size_t> Partition::getMembers(size_t i) const {
  _checkElement(i);
  vector<size_t> members;
  size_t j = i;
  do {
    members.push_back(j);
    j = m_vecNext[j];
  } while (j != i);
  sort(members.begin(), members.end());
  return members;
}

vector<vector<size_t>> Partition::getSets() const {
  vector<vector<size_t>> sets;
  for (size_t rep : m_vecReps) {
    sets.push_back(getMembers(rep));
  }
  return sets;
}

bool Partition::operator==(const Partition& other) const {
  if (m_numElements != other.m_numElements || numSets() != other.numSets()) {
    return false;
  }
  for (size_t i=0; i<m_numElements; ++i) {
    if (find(i) != other.find(i)) {
      return false;
    }
  }
  return true;
}

bool Partition::operator!=(const Partition& other) const {
  return !(*this == other);
}

ostream& operator<<(ostream& lhs, const Partition& p) {
  for (auto set : p.getSets()) {
    lhs << "{";
    for (size_t j=0; j<set.size(); ++j) {
      lhs << (j>0 ? "," : "") << set[j];
    }
    lhs << "}";
  }
  return lhs;
}

} // namespace coalescent
