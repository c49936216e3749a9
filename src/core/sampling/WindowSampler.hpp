#ifndef WINDOWSAMPLER_H
#define WINDOWSAMPLER_H

#include "../random.hpp"
#include "../seqio/ExclusionIndex.hpp"
#include "../seqio/Window.hpp"
#include "../seqio/types.hpp"
#include <string>
#include <vector>

/** Generation of background (control) regions. */
namespace sampling {

/**
 * Samples control windows that avoid peak windows and each other.
 *
 * For every peak a chromosome is chosen uniformly from the chromosomes
 * of all peaks (i.e. proportional to the number of peaks it carries),
 * followed by up to `max_attempts` uniform draws of a start position.
 * The first draw that does not overlap an occupied region is accepted and
 * becomes occupied itself. Slots for which no free window is found are
 * skipped, so fewer controls than peaks may be returned.
 */
class WindowSampler
{
public:
  /**
   * \param chr_len       chromosome lengths
   * \param width         window width (positive, odd)
   * \param max_attempts  number of draws per control slot
   * \param verbosity     detail level of log messages (0: silent)
   * \throws error::ConfigurationError for even width or zero attempts
   */
  WindowSampler (
    const seqio::TChromLengths& chr_len,
    const seqio::TCoord width,
    const unsigned max_attempts = 1000,
    const int verbosity = 1
  );

  /**
   * Sample one control window per peak window slot.
   * \param peak_windows  windows to avoid (all peaks)
   * \param rng           random number generator
   * \returns             accepted control windows in slot order
   */
  std::vector<seqio::Window>
  sample (
    const std::vector<seqio::Window>& peak_windows,
    RandomNumberGenerator<>& rng
  );

  /** Number of slots skipped in the last call to sample(). */
  size_t numExhausted() const;
  /** Occupied regions after the last call to sample(). */
  const seqio::ExclusionIndex& exclusionIndex() const;

private:
  seqio::TChromLengths  m_chr_len;
  seqio::TCoord         m_width;
  unsigned              m_max_attempts;
  int                   m_verbosity;
  size_t                m_num_exhausted;
  seqio::ExclusionIndex m_index;

  /** Try to place a single control window on a chromosome. */
  bool
  placeWindow (
    const std::string& id_chr,
    RandomNumberGenerator<>& rng,
    seqio::Window& out
  );
};

} // namespace sampling

#endif // WINDOWSAMPLER_H
