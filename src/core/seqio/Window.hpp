#ifndef WINDOW_H
#define WINDOW_H

#include "types.hpp"
#include <string>

namespace seqio {

/**
 * Represents a fixed-width genomic window.
 *
 * Coordinates are positions in the chromosome sequence, both ends
 * inclusive, so that width() == end - start + 1.
 */
struct Window
{
  std::string id_chr; // chromosome id
  TCoord      start;  // first position (inclusive)
  TCoord      end;    // last position (inclusive)

  Window();
  Window(const std::string& id_chr, TCoord start, TCoord end);

  /** Number of positions covered. */
  TCoord width() const;
  /** Sequence identifier derived from coordinates: "{chrom}:{start}-{end}". */
  std::string id() const;
  /** Do both windows share at least one position on the same chromosome? */
  bool overlaps(const Window& other) const;

  /**
   * Recover a window from a sequence identifier created by id().
   * Chromosome names may themselves contain ':'.
   * \returns true on success, false if the identifier is malformed.
   */
  static bool fromId(const std::string& id, Window& out);
};

bool operator==(const Window& lhs, const Window& rhs);

/** A called peak, optionally annotated with its summit offset. */
struct Peak
{
  std::string id_chr;
  TCoord      start;
  TCoord      end;
  TCoord      summit; // offset of signal maximum relative to start (0 if unknown)

  Peak();
  Peak(const std::string& id_chr, TCoord start, TCoord end, TCoord summit = 0);

  /**
   * Window of given (odd) width centered on the peak summit.
   * The result may extend beyond chromosome limits; this is detected
   * when the sequence is extracted.
   */
  Window centeredWindow(TCoord width) const;
};

/** Throws error::ConfigurationError unless width is a positive odd number. */
void checkWindowWidth(TCoord width);

} // namespace seqio

#endif // WINDOW_H
