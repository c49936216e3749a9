#ifndef ENSEMBLECLASSIFIER_H
#define ENSEMBLECLASSIFIER_H

#include "LogisticRegression.hpp"
#include "../random.hpp"
#include <vector>

namespace learn {

/**
 * Ensemble of logistic regression learners trained on identical data.
 *
 * Learners see the same rows and labels (no bootstrap resampling) and
 * differ only in their random initialization and visiting order.
 * Predicted probabilities are averaged over all learners.
 */
class EnsembleClassifier
{
public:
  /**
   * \param n_learners  ensemble size (>= 1)
   * \param params      SGD parameters shared by all learners
   * \param n_threads   maximum number of learners trained in parallel (>= 1)
   * \throws error::ConfigurationError on invalid sizes or negative lambda
   */
  EnsembleClassifier (
    const unsigned n_learners,
    const SgdParams& params,
    const unsigned n_threads = 1
  );

  /**
   * Train all learners.
   * One seed per learner is drawn from rng before training starts, so the
   * result does not depend on the number of threads.
   * \throws see checkTrainingData()
   */
  void
  fit (
    const FeatureMatrix& X,
    const std::vector<int>& y,
    RandomNumberGenerator<>& rng
  );

  /** Mean probability of class 1 across learners for row i. */
  double predictProba(const FeatureMatrix& X, const size_t i) const;
  /** Mean probability of class 1 across learners for all rows. */
  std::vector<double> predictProba(const FeatureMatrix& X) const;

  bool isFitted() const;
  size_t size() const;
  const std::vector<LogisticRegression>& learners() const;
  const SgdParams& params() const;

private:
  unsigned m_n_learners;
  SgdParams m_params;
  unsigned m_n_threads;
  std::vector<LogisticRegression> m_vec_learners;

  void checkFeatures(const FeatureMatrix& X) const;
};

} // namespace learn

#endif // ENSEMBLECLASSIFIER_H
