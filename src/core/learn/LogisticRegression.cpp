#include "LogisticRegression.hpp"
#include "../errors.hpp"
#include "../stringio.hpp"
#include <cmath>
#include <functional>
#include <numeric> // iota()
#include <stdexcept>

using namespace std;

namespace learn {

SgdParams::SgdParams()
: lambda(1e-4), epochs(10), eta0(0.01), init_scale(0.01) {}

double sigmoid(const double x) {
  if (x >= 0) {
    return 1.0 / (1.0 + exp(-x));
  }
  double e = exp(x);
  return e / (1.0 + e);
}

void checkTrainingData(const FeatureMatrix& X, const vector<int>& y) {
  if (X.numRows() != y.size())
    throw invalid_argument(stringio::format(
      "number of rows (%lu) does not match number of labels (%lu)", X.numRows(), y.size()));
  if (X.numRows() == 0)
    throw error::InsufficientDataError("no training examples");
  size_t n_pos = 0;
  for (int lbl : y) {
    if (lbl != 0 && lbl != 1)
      throw invalid_argument(stringio::format("invalid class label %d (expected 0 or 1)", lbl));
    n_pos += lbl;
  }
  if (n_pos == 0 || n_pos == y.size())
    throw error::InsufficientDataError("training labels contain a single class only");
}

LogisticRegression::LogisticRegression()
: m_scale(1.0), m_bias(0.0) {}

void
LogisticRegression::initialize (
  const size_t n_features,
  const double init_scale,
  RandomNumberGenerator<>& rng
) {
  m_vec_v.assign(n_features, 0.0);
  m_scale = 1.0;
  m_bias = 0.0;
  if (init_scale > 0) {
    function<double()> r_init = rng.getRandomFunctionDouble(-init_scale, init_scale);
    for (double& v : m_vec_v)
      v = r_init();
  }
}

double
LogisticRegression::learningRate(const SgdParams& params, const unsigned long t) {
  return params.eta0 / (1.0 + params.eta0 * params.lambda * t);
}

void
LogisticRegression::update (
  const FeatureMatrix& X,
  const size_t i,
  const int y,
  const double eta,
  const double lambda
) {
  // gradient of log-loss w.r.t. the linear score
  double g = predictProba(X, i) - y;

  // L2 shrinkage applied to all weights at once
  m_scale *= (1.0 - eta * lambda);
  if (fabs(m_scale) < 1e-9)
    rescale();

  // loss gradient only touches non-zero features
  double step = eta * g / m_scale;
  for (size_t k=X.row_ptr[i]; k<X.row_ptr[i+1]; ++k)
    m_vec_v[X.col_idx[k]] -= step * X.values[k];
  m_bias -= eta * g;
}

void
LogisticRegression::fit (
  const FeatureMatrix& X,
  const vector<int>& y,
  const SgdParams& params,
  RandomNumberGenerator<>& rng
) {
  checkTrainingData(X, y);
  initialize(X.n_cols, params.init_scale, rng);

  vector<size_t> order(X.numRows());
  iota(order.begin(), order.end(), 0);
  unsigned long t = 0;
  for (unsigned e=0; e<params.epochs; ++e) {
    rng.shuffle(order);
    for (size_t i : order) {
      update(X, i, y[i], learningRate(params, t), params.lambda);
      t++;
    }
  }
  rescale();
}

double
LogisticRegression::decisionFunction(const FeatureMatrix& X, const size_t i) const {
  return m_scale * X.dot(i, m_vec_v) + m_bias;
}

double
LogisticRegression::predictProba(const FeatureMatrix& X, const size_t i) const {
  return sigmoid(decisionFunction(X, i));
}

vector<double>
LogisticRegression::predictProba(const FeatureMatrix& X) const {
  vector<double> probs(X.numRows());
  for (size_t i=0; i<X.numRows(); ++i)
    probs[i] = predictProba(X, i);
  return probs;
}

vector<double>
LogisticRegression::weights() const {
  vector<double> w(m_vec_v);
  for (double& v : w)
    v *= m_scale;
  return w;
}

double LogisticRegression::bias() const {
  return m_bias;
}

size_t LogisticRegression::numFeatures() const {
  return m_vec_v.size();
}

void
LogisticRegression::rescale() {
  for (double& v : m_vec_v)
    v *= m_scale;
  m_scale = 1.0;
}

} // namespace learn
