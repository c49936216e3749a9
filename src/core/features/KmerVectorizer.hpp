#ifndef KMERVECTORIZER_H
#define KMERVECTORIZER_H

#include "../model/SparseMatrix.hpp"
#include <string>
#include <unordered_map>
#include <vector>

/** Conversion of DNA sequences into numeric feature vectors. */
namespace features {

/** k-mer counts, one row per sequence, one column per vocabulary entry. */
typedef model::SparseMatrix<double> FeatureMatrix;

/**
 * Counts overlapping k-mers of a range of lengths.
 *
 * The vocabulary is fixed by fit(): it consists of all distinct k-mers
 * observed in the fitted sequences (case-sensitive), with columns assigned
 * in lexicographic order. transform() only counts k-mers that are part of
 * the vocabulary; unknown k-mers are ignored.
 */
class KmerVectorizer
{
public:
  /**
   * \param k_min  shortest k-mer length (>= 1)
   * \param k_max  longest k-mer length (>= k_min)
   * \throws error::ConfigurationError on invalid range
   */
  KmerVectorizer(const unsigned k_min = 6, const unsigned k_max = 8);

  /** Establish vocabulary from sequences. Replaces any previous vocabulary. */
  void fit(const std::vector<std::string>& seqs);
  /** Count vocabulary k-mers per sequence. Requires a fitted vocabulary. */
  FeatureMatrix transform(const std::vector<std::string>& seqs) const;
  /** fit() followed by transform() on the same sequences. */
  FeatureMatrix fitTransform(const std::vector<std::string>& seqs);

  /** Has a vocabulary been established? */
  bool isFitted() const;
  /** Vocabulary entries ordered by column index. */
  const std::vector<std::string>& vocabulary() const;
  /** Column index of a k-mer, -1 if not part of the vocabulary. */
  long columnOf(const std::string& kmer) const;
  unsigned kMin() const;
  unsigned kMax() const;

private:
  unsigned m_k_min;
  unsigned m_k_max;
  bool m_is_fitted;
  std::vector<std::string> m_vec_kmers;
  std::unordered_map<std::string, size_t> m_idx_kmer;
};

} // namespace features

#endif // KMERVECTORIZER_H
