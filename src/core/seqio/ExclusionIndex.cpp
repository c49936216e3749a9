#include "ExclusionIndex.hpp"

using namespace std;
using boost::icl::interval;

namespace seqio {

ExclusionIndex::ExclusionIndex() : m_num_windows(0) {}

ExclusionIndex::ExclusionIndex(const vector<Window>& windows) : m_num_windows(0)
{
  for (auto const & win : windows)
    insert(win);
}

void
ExclusionIndex::insert(const Window& win)
{
  m_chr_occupied[win.id_chr] += interval<TCoord>::closed(win.start, win.end);
  m_num_windows++;
}

bool
ExclusionIndex::overlaps(const Window& win) const
{
  auto it_chr = m_chr_occupied.find(win.id_chr);
  if (it_chr == m_chr_occupied.end())
    return false;
  const TOccupiedSet& occupied = it_chr->second;
  return occupied.find(interval<TCoord>::closed(win.start, win.end)) != occupied.end();
}

TCoord
ExclusionIndex::occupiedLength(const string& id_chr) const
{
  auto it_chr = m_chr_occupied.find(id_chr);
  if (it_chr == m_chr_occupied.end())
    return 0;
  return boost::icl::cardinality(it_chr->second);
}

size_t
ExclusionIndex::size() const
{
  return m_num_windows;
}

} // namespace seqio
