#ifndef SEQIO_H
#define SEQIO_H

#include "seqio/ExclusionIndex.hpp"
#include "seqio/GenomeReference.hpp"
#include "seqio/PeakFile.hpp"
#include "seqio/SeqCollection.hpp"
#include "seqio/SeqRecord.hpp"
#include "seqio/Window.hpp"
#include "seqio/types.hpp"
#include "stringio.hpp"
#include <iostream>
#include <memory> // shared_ptr
#include <set>
#include <string>
#include <vector>

/** Handles sequence and interval files (read, write, extract). */
namespace seqio {

/** Chromosome ids to import (allowlist). */
typedef std::set<std::string> TChromSet;

/** 
 * Read sequences from FASTA file. 
 * \param records        output parameter; list of records.
 * \param filename       filename to read records from.
 * \param use_allowlist  only import sequences listed in chr_allowlist.
 * \param chr_allowlist  sequence ids to import.
 * \throws error::IOError, error::ParseError
 */
void readFasta (
  std::vector<std::shared_ptr<SeqRecord>>& records,
  const std::string& filename,
  const bool use_allowlist = false,
  const TChromSet& chr_allowlist = TChromSet()
);
/** 
 * Reads sequences from istream. 
 * \param records        output parameter; list of records.
 * \param input_stream   input stream to read records from.
 * \param use_allowlist  only import sequences listed in chr_allowlist.
 * \param chr_allowlist  sequence ids to import.
 * \throws error::ParseError
 */
void readFasta (
  std::vector<std::shared_ptr<SeqRecord>>& records,
  std::istream& inputstream,
  const bool use_allowlist = false,
  const TChromSet& chr_allowlist = TChromSet()
);
/** Read sequences from FASTA file into an ordered collection. */
SeqCollection readSeqCollection(const std::string& filename);
/** Read sequences from istream into an ordered collection. */
SeqCollection readSeqCollection(std::istream& input);

/** Writes sequences to file. */
int writeFasta(const std::vector<std::shared_ptr<SeqRecord>>&, const std::string fn, int len_line = 60);
/** Writes sequences to ostream. */
int writeFasta(const std::vector<std::shared_ptr<SeqRecord>>&, std::ostream& os, int len_line = 60);

/** Writes windows as tab-separated lines (chromosome, start, end). */
int writeWindows(const std::vector<Window>&, const std::string fn);
/** Writes windows as tab-separated lines (chromosome, start, end). */
int writeWindows(const std::vector<Window>&, std::ostream& os);
/** Reads windows from tab-separated lines (chromosome, start, end). */
std::vector<Window> readWindows(std::istream& input);

/**
 * Extract sequences for a list of windows.
 * Record ids are derived from window coordinates (Window::id()),
 * records appear in window order.
 * \throws error::BoundsError if any window exceeds its chromosome.
 */
SeqCollection
extractSequences (
  const GenomeReference& genome,
  const std::vector<Window>& windows
);

} /* namespace seqio */

#endif /* SEQIO_H */
