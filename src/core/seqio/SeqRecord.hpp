#ifndef SEQRECORD_H
#define SEQRECORD_H

#include "types.hpp"
#include <string>

namespace seqio {

/**
 * A named nucleotide sequence.
 *
 * Used both for whole chromosomes (genome FASTA) and for window
 * sequences, whose id is "{chrom}:{start}-{end}".
 */
struct SeqRecord
{
  std::string id;          /** identifier (header up to the first whitespace) */
  std::string description; /** rest of the header line, may be empty */
  std::string seq;

  SeqRecord(const std::string& id, const std::string& desc, const std::string& seq);
  SeqRecord(const std::string& id, const std::string& seq);

  /** Number of nucleotides. */
  TCoord length() const;
};

} // namespace seqio

#endif // SEQRECORD_H
