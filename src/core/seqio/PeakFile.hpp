#ifndef PEAKFILE_H
#define PEAKFILE_H

#include "Window.hpp"
#include "types.hpp"
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace seqio {

/** Column layouts accepted for peak files. */
enum PeakSchema {
  /** chromosome, start, end in columns 0-2, summit offset in column 9 */
  SCHEMA_SUMMIT,
  /** chromosome, start, end in columns 0-2; summit offset defaults to 0 */
  SCHEMA_BASIC
};

/** Outcome of parsing peak records with a single schema. */
struct PeakParseResult {
  bool              success;
  PeakSchema        schema;
  std::vector<Peak> peaks;
  size_t            line_num; // 1-based line number of first offending line (0 on success)
  std::string       message;  // reason for failure

  PeakParseResult(PeakSchema schema);
};

/**
 * Handles input of peak files.
 *
 * A peak file is whitespace-delimited with columns:
 *   0. seq_id : Identifier for a sequence (e.g. chromosome)
 *   1. start  : Start coordinate
 *   2. end    : End coordinate
 *   9. summit : Offset of the peak summit relative to start (optional)
 *
 * Lines are first parsed using SCHEMA_SUMMIT; if that fails for any line
 * the whole file is parsed again using SCHEMA_BASIC.
 * Empty lines and 'track'/'browser'/'#' header lines are ignored.
 */
struct PeakFile {

/** Name of the file peaks were read from. */
std::string m_filename;
/** Schema that was used to parse the records. */
PeakSchema m_schema;
/** Parsed peaks in file order. */
std::vector<Peak> m_vec_peaks;

/** default c'tor */
PeakFile();
/** Read peaks from file. Throws error::IOError, error::ParseError. */
PeakFile(const std::string& filename);

/** Read peaks from stream. Throws error::ParseError. */
void read(std::istream& input, const std::string& name = "<stream>");

/** Parse data lines using a given schema. */
static PeakParseResult
parseLines (
  const std::vector<std::string>& lines,
  const std::vector<size_t>& line_nums,
  const PeakSchema schema
);

/** Remove peaks located on chromosomes not contained in allowlist. 
 *  \returns number of removed peaks.
 */
size_t filterChromosomes(const std::set<std::string>& chr_allowlist);

/** Summit-centered windows of given width, in peak order. */
std::vector<Window> getWindows(const TCoord width) const;

};

} /* namespace seqio */

#endif /* PEAKFILE_H */
