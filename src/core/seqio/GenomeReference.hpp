#ifndef GENOMEREFERENCE_H
#define GENOMEREFERENCE_H

#include "ChromosomeReference.hpp"
#include "SeqRecord.hpp"
#include "Window.hpp"
#include "types.hpp"
#include <iostream>
#include <map>
#include <memory> // shared_ptr
#include <set>
#include <string>
#include <vector>

namespace seqio {

/** Stores reference chromosomes and provides access to their sequences. */
struct GenomeReference
{
  unsigned num_records;
  unsigned long length;                   /** total length of all sequences */
  /** Reference chromosomes that make up the genome */
  std::map<std::string, std::shared_ptr<ChromosomeReference>> chromosomes;
  /** Vector of chromosome IDs in input order (paired with length vector) */
  std::vector<std::string> vec_chr_id;
  /** Vector of chromosome lengths (paired with chromosome ID vector) */
  std::vector<TCoord> vec_chr_len;

  /** default c'tor */
  GenomeReference();
  /** load reference sequences from FASTA file */
  GenomeReference(const std::string& fn_fasta);
  /** load reference sequences from FASTA file, keeping only listed chromosomes. */
  GenomeReference(
    const std::string& fn_fasta,
    const std::set<std::string>& chr_allowlist
  );

  /** Adds a chromosome sequence to this GenomeReference. */
  void addChromosome(std::shared_ptr<SeqRecord> rec);

  /** Is there a chromosome with the given id? */
  bool hasChromosome(const std::string& id_chr) const;

  /** Chromosome lengths indexed by chromosome id. */
  TChromLengths getChromosomeLengths() const;

  /**
   * Get nucleotide sequence covered by a window.
   *
   * \param win  window (start and end inclusive)
   * \returns    sequence of length win.width()
   * \throws     error::BoundsError if the window exceeds the chromosome
   *             or the chromosome is unknown.
   */
  std::string getSequence(const Window& win) const;

}; // struct GenomeReference

} // namespace seqio

#endif // GENOMEREFERENCE_H
