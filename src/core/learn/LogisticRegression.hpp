#ifndef LOGISTICREGRESSION_H
#define LOGISTICREGRESSION_H

#include "../features/KmerVectorizer.hpp"
#include "../random.hpp"
#include <vector>

/** Training and application of classifiers. */
namespace learn {

using features::FeatureMatrix;

/** Parameters of stochastic gradient descent. */
struct SgdParams {
  double   lambda;     /** L2 regularization weight */
  unsigned epochs;     /** passes over the training data */
  double   eta0;       /** initial learning rate */
  double   init_scale; /** initial weights are drawn from [-init_scale, init_scale] */

  SgdParams();
};

/** Logistic function 1/(1+exp(-x)), evaluated without overflow. */
double sigmoid(const double x);

/**
 * Check that training data is usable.
 * \throws std::invalid_argument if X and y differ in size or y contains values other than 0/1.
 * \throws error::InsufficientDataError if there are no rows or only one class.
 */
void checkTrainingData(const FeatureMatrix& X, const std::vector<int>& y);

/**
 * L2-regularized logistic regression trained by stochastic gradient descent.
 *
 * Each step on example (x, y) performs
 *   w <- w - eta * ((p - y) * x + lambda * w)
 *   b <- b - eta * (p - y)
 * with p = sigmoid(w.x + b). The learning rate decays as
 *   eta_t = eta0 / (1 + eta0 * lambda * t).
 * Weights are stored as scale * v so the L2 shrinkage costs O(1) per step
 * and the gradient step only touches the non-zero features of x.
 */
class LogisticRegression
{
public:
  LogisticRegression();

  /** Set up n_features weights drawn uniformly from [-init_scale, init_scale], bias 0. */
  void
  initialize (
    const size_t n_features,
    const double init_scale,
    RandomNumberGenerator<>& rng
  );

  /** Learning rate after t updates. */
  static double learningRate(const SgdParams& params, const unsigned long t);

  /** Single SGD step on row i of X with label y. */
  void
  update (
    const FeatureMatrix& X,
    const size_t i,
    const int y,
    const double eta,
    const double lambda
  );

  /**
   * Train on all rows of X, visiting rows in a freshly shuffled order in every epoch.
   * \throws see checkTrainingData()
   */
  void
  fit (
    const FeatureMatrix& X,
    const std::vector<int>& y,
    const SgdParams& params,
    RandomNumberGenerator<>& rng
  );

  /** Linear score w.x + b for row i. */
  double decisionFunction(const FeatureMatrix& X, const size_t i) const;
  /** Probability of class 1 for row i. */
  double predictProba(const FeatureMatrix& X, const size_t i) const;
  /** Probabilities of class 1 for all rows. */
  std::vector<double> predictProba(const FeatureMatrix& X) const;

  /** Effective weight vector. */
  std::vector<double> weights() const;
  double bias() const;
  size_t numFeatures() const;

private:
  std::vector<double> m_vec_v; // weights = m_scale * m_vec_v
  double m_scale;
  double m_bias;

  /** Fold scale factor into weight vector. */
  void rescale();
};

} // namespace learn

#endif // LOGISTICREGRESSION_H
