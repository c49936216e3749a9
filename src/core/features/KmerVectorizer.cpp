#include "KmerVectorizer.hpp"
#include "../errors.hpp"
#include "../stringio.hpp"
#include <map>
#include <set>
#include <stdexcept>

using namespace std;

namespace features {

KmerVectorizer::KmerVectorizer(const unsigned k_min, const unsigned k_max)
: m_k_min(k_min), m_k_max(k_max), m_is_fitted(false)
{
  if (k_min < 1 || k_max < k_min)
    throw error::ConfigurationError(stringio::format(
      "invalid k-mer length range [%u, %u]", k_min, k_max));
}

void
KmerVectorizer::fit(const vector<string>& seqs)
{
  // std::set keeps k-mers in lexicographic order
  set<string> kmers;
  for (auto const & seq : seqs) {
    for (unsigned k=m_k_min; k<=m_k_max; ++k) {
      if (seq.length() < k) break;
      for (size_t i=0; i+k<=seq.length(); ++i)
        kmers.insert(seq.substr(i, k));
    }
  }

  m_vec_kmers.assign(kmers.begin(), kmers.end());
  m_idx_kmer.clear();
  m_idx_kmer.reserve(m_vec_kmers.size());
  for (size_t j=0; j<m_vec_kmers.size(); ++j)
    m_idx_kmer[m_vec_kmers[j]] = j;
  m_is_fitted = true;
}

FeatureMatrix
KmerVectorizer::transform(const vector<string>& seqs) const
{
  if (!m_is_fitted)
    throw logic_error("KmerVectorizer::transform() called before fit()");

  FeatureMatrix mtx(m_vec_kmers.size());
  for (auto const & seq : seqs) {
    map<size_t, double> counts;
    for (unsigned k=m_k_min; k<=m_k_max; ++k) {
      if (seq.length() < k) break;
      for (size_t i=0; i+k<=seq.length(); ++i) {
        auto it = m_idx_kmer.find(seq.substr(i, k));
        if (it != m_idx_kmer.end())
          counts[it->second] += 1.0;
      }
    }
    mtx.appendRow(counts);
  }
  return mtx;
}

FeatureMatrix
KmerVectorizer::fitTransform(const vector<string>& seqs)
{
  fit(seqs);
  return transform(seqs);
}

bool KmerVectorizer::isFitted() const {
  return m_is_fitted;
}

const vector<string>& KmerVectorizer::vocabulary() const {
  return m_vec_kmers;
}

long KmerVectorizer::columnOf(const string& kmer) const {
  auto it = m_idx_kmer.find(kmer);
  return (it == m_idx_kmer.end() ? -1 : static_cast<long>(it->second));
}

unsigned KmerVectorizer::kMin() const { return m_k_min; }
unsigned KmerVectorizer::kMax() const { return m_k_max; }

} // namespace features
