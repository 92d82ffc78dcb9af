#ifndef PARTITION_H
#define PARTITION_H

#include <boost/pending/disjoint_sets.hpp>
#include <cstddef>
#include <ostream>
#include <vector>

namespace coalescent {

/** Set partition of the elements {0,...,n-1}.
 *
 *  Starts with n singletons; sets can only be merged, never split.
 *  Every set is represented by its smallest member and sets are enumerated
 *  in ascending order of their representatives.
 *
 *  Every merge leaves the union-find forest fully compressed (each element
 *  points at its root), so const queries do not modify the forest and a
 *  Partition can be read from several threads at once.
 */
class Partition
{
public:
  Partition();
  Partition(std::size_t n);
  /** Number of elements. */
  std::size_t size() const;
  /** Number of disjoint sets. */
  std::size_t numSets() const;
  /** Representative (smallest member) of the set containing element i. */
  std::size_t find(std::size_t i) const;
  /** Do elements a and b belong to the same set? */
  bool sameSet(std::size_t a, std::size_t b) const;
  /** Number of elements in the set containing element i. */
  std::size_t sizeOfSet(std::size_t i) const;
  /** Join the sets containing elements a and b. */
  void merge(std::size_t a, std::size_t b);
  /** Representative of the k-th set in enumeration order. */
  std::size_t getSetRepresentative(std::size_t k) const;
  /** Representatives of all sets in enumeration order. */
  const std::vector<std::size_t>& getRepresentatives() const;
  /** Members of the set containing element i (ascending). */
  std::vector<std::size_t> getMembers(std::size_t i) const;
  /** All sets in enumeration order. */
  std::vector<std::vector<std::size_t>> getSets() const;

  bool operator==(const Partition& other) const;
  bool operator!=(const Partition& other) const;

private:
  /** Root of element i in the union-find forest. */
  std::size_t _root(std::size_t i) const;
  void _checkElement(std::size_t i) const;

  std::size_t m_numElements;
  /** find_set() is non-const, but never writes on a compressed forest */
  mutable boost::disjoint_sets_with_storage<> m_sets;
  /** set size, valid for roots */
  std::vector<std::size_t> m_vecSize;
  /** smallest member, valid for roots */
  std::vector<std::size_t> m_vecMin;
  /** circular list linking the members of each set */
  std::vector<std::size_t> m_vecNext;
  /** representatives of current sets, ascending */
  std::vector<std::size_t> m_vecReps;
};

// streaming operator for easy printing
std::ostream& operator<<(std::ostream&, const Partition&);

} // namespace coalescent

#endif // PARTITION_H
