#include "EnsembleClassifier.hpp"
#include "../errors.hpp"
#include "../stringio.hpp"
#include <stdexcept>

using namespace std;

namespace learn {

EnsembleClassifier::EnsembleClassifier (
  const unsigned n_learners,
  const SgdParams& params,
  const unsigned n_threads
)
: m_n_learners(n_learners),
  m_params(params),
  m_n_threads(n_threads)
{
  if (n_learners < 1)
    throw error::ConfigurationError("ensemble size must be positive");
  if (n_threads < 1)
    throw error::ConfigurationError("number of threads must be positive");
  if (params.lambda < 0)
    throw error::ConfigurationError("regularization weight must not be negative");
  if (params.epochs < 1)
    throw error::ConfigurationError("number of epochs must be positive");
  if (params.eta0 <= 0)
    throw error::ConfigurationError("learning rate must be positive");
}

void
EnsembleClassifier::fit (
  const FeatureMatrix& X,
  const vector<int>& y,
  RandomNumberGenerator<>& rng
) {
  // validate up front: exceptions must not leave the parallel region
  checkTrainingData(X, y);

  vector<unsigned long> vec_seeds(m_n_learners);
  for (unsigned m=0; m<m_n_learners; ++m)
    vec_seeds[m] = rng.getRandomSeed();

  vector<LogisticRegression> learners(m_n_learners);
  #pragma omp parallel for num_threads(m_n_threads) schedule(dynamic)
  for (int m=0; m<(int)m_n_learners; ++m) {
    RandomNumberGenerator<> rng_learner(vec_seeds[m]);
    learners[m].fit(X, y, m_params, rng_learner);
  }

  m_vec_learners.swap(learners);
}

double
EnsembleClassifier::predictProba(const FeatureMatrix& X, const size_t i) const {
  checkFeatures(X);
  double sum_p = 0.0;
  for (auto const & learner : m_vec_learners)
    sum_p += learner.predictProba(X, i);
  return sum_p / m_vec_learners.size();
}

vector<double>
EnsembleClassifier::predictProba(const FeatureMatrix& X) const {
  checkFeatures(X);
  vector<double> probs(X.numRows(), 0.0);
  for (auto const & learner : m_vec_learners)
    for (size_t i=0; i<X.numRows(); ++i)
      probs[i] += learner.predictProba(X, i);
  for (double& p : probs)
    p /= m_vec_learners.size();
  return probs;
}

bool EnsembleClassifier::isFitted() const {
  return !m_vec_learners.empty();
}

size_t EnsembleClassifier::size() const {
  return m_n_learners;
}

const vector<LogisticRegression>& EnsembleClassifier::learners() const {
  return m_vec_learners;
}

const SgdParams& EnsembleClassifier::params() const {
  return m_params;
}

void
EnsembleClassifier::checkFeatures(const FeatureMatrix& X) const {
  if (!isFitted())
    throw logic_error("EnsembleClassifier used for prediction before fit()");
  if (X.n_cols != m_vec_learners.front().numFeatures())
    throw invalid_argument(stringio::format(
      "feature matrix has %lu columns, model expects %lu",
      X.n_cols, m_vec_learners.front().numFeatures()));
}

} // namespace learn
