#ifndef EXCLUSIONINDEX_H
#define EXCLUSIONINDEX_H

#include "Window.hpp"
#include "types.hpp"
#include <boost/icl/interval.hpp>
#include <boost/icl/interval_set.hpp>
#include <map>
#include <string>
#include <vector>

namespace seqio {

/** Occupied positions of a chromosome, stored as a set of closed intervals. */
typedef
boost::icl::interval_set<TCoord>
TOccupiedSet;

/**
 * Keeps track of genomic regions that are already taken.
 *
 * One interval set per chromosome. Insertion and overlap queries are
 * logarithmic in the number of stored (merged) intervals. Not safe for
 * concurrent modification.
 */
class ExclusionIndex
{
public:
  ExclusionIndex();
  /** Initialize index with a list of occupied windows. */
  ExclusionIndex(const std::vector<Window>& windows);

  /** Mark positions covered by a window as occupied. */
  void insert(const Window& win);
  /** Does a window overlap any occupied position on its chromosome? */
  bool overlaps(const Window& win) const;
  /** Number of occupied positions on a chromosome. */
  TCoord occupiedLength(const std::string& id_chr) const;
  /** Number of windows inserted so far. */
  size_t size() const;

private:
  std::map<std::string, TOccupiedSet> m_chr_occupied;
  size_t m_num_windows;
};

} // namespace seqio

#endif // EXCLUSIONINDEX_H
