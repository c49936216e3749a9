#include "WindowSampler.hpp"
#include "../errors.hpp"
#include <cstdio>
#include <functional>

using namespace std;
using seqio::ExclusionIndex;
using seqio::TCoord;
using seqio::Window;

namespace sampling {

WindowSampler::WindowSampler (
  const seqio::TChromLengths& chr_len,
  const TCoord width,
  const unsigned max_attempts,
  const int verbosity
)
: m_chr_len(chr_len),
  m_width(width),
  m_max_attempts(max_attempts),
  m_verbosity(verbosity),
  m_num_exhausted(0)
{
  seqio::checkWindowWidth(width);
  if (max_attempts == 0)
    throw error::ConfigurationError("number of sampling attempts must be positive");
}

vector<Window>
WindowSampler::sample (
  const vector<Window>& peak_windows,
  RandomNumberGenerator<>& rng
) {
  vector<Window> controls;
  m_num_exhausted = 0;
  // all peaks are occupied from the start
  m_index = ExclusionIndex(peak_windows);

  // chromosomes are picked proportional to their number of peaks
  vector<string> vec_chr_pool;
  for (auto const & win : peak_windows)
    vec_chr_pool.push_back(win.id_chr);

  for (size_t i=0; i<peak_windows.size(); ++i) {
    const string& id_chr = rng.select(vec_chr_pool);
    Window win;
    if (placeWindow(id_chr, rng, win)) {
      m_index.insert(win);
      controls.push_back(win);
    } else {
      m_num_exhausted++;
      if (m_verbosity > 0)
        fprintf(stderr, "[WARN] No free control window on '%s' after %u attempts, skipping slot %lu.\n",
                id_chr.c_str(), m_max_attempts, i+1);
    }
  }

  return controls;
}

bool
WindowSampler::placeWindow (
  const string& id_chr,
  RandomNumberGenerator<>& rng,
  Window& out
) {
  auto it_len = m_chr_len.find(id_chr);
  TCoord chr_len = (it_len == m_chr_len.end() ? 0 : it_len->second);
  TCoord max_start = chr_len - m_width;
  // chromosome shorter than window: no valid start position
  if (max_start < 0)
    return false;

  function<TCoord()> r_start = rng.getRandomFunctionInt<TCoord>(0, max_start);
  for (unsigned a=0; a<m_max_attempts; ++a) {
    TCoord start = r_start();
    Window win(id_chr, start, start+m_width-1);
    if (!m_index.overlaps(win)) {
      out = win;
      return true;
    }
  }
  return false;
}

size_t WindowSampler::numExhausted() const {
  return m_num_exhausted;
}

const ExclusionIndex& WindowSampler::exclusionIndex() const {
  return m_index;
}

} // namespace sampling
