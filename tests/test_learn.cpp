#include <boost/test/unit_test.hpp>
#include <boost/timer/timer.hpp>

#include "core/errors.hpp"
#include "core/eval/Evaluator.hpp"
#include "core/features/KmerVectorizer.hpp"
#include "core/learn/EnsembleClassifier.hpp"
#include "core/learn/LogisticRegression.hpp"
#include "core/random.hpp"
#include <cmath>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using features::FeatureMatrix;
using learn::EnsembleClassifier;
using learn::LogisticRegression;
using learn::SgdParams;

struct FixtureLearn {
  FixtureLearn() : X(3), rng(1234567) {
    BOOST_TEST_MESSAGE( "set up fixure" );
    // feature 0 marks class 1, feature 1 marks class 0, feature 2 is noise
    function<double()> r_noise = rng.getRandomFunctionDouble(0.0, 1.0);
    for (int i=0; i<40; ++i) {
      map<size_t, double> row;
      int lbl = i % 2;
      row[lbl == 1 ? 0 : 1] = 1.0;
      row[2] = r_noise();
      X.appendRow(row);
      y.push_back(lbl);
    }
    params.eta0 = 0.1;
    params.epochs = 20;
  }
  ~FixtureLearn() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
  }

  FeatureMatrix X;
  vector<int> y;
  SgdParams params;
  RandomNumberGenerator<> rng;
};

BOOST_FIXTURE_TEST_SUITE( learning, FixtureLearn )

BOOST_AUTO_TEST_CASE( sigmoid )
{
  BOOST_CHECK_EQUAL( learn::sigmoid(0.0), 0.5 );
  BOOST_CHECK_CLOSE( learn::sigmoid(2.0), 1.0/(1.0+exp(-2.0)), 1e-9 );
  BOOST_CHECK_CLOSE( learn::sigmoid(-2.0), 1.0 - learn::sigmoid(2.0), 1e-9 );
  BOOST_CHECK( learn::sigmoid(-1000.0) >= 0.0 );
  BOOST_CHECK( learn::sigmoid(-1000.0) < 1e-300 );
  BOOST_CHECK_EQUAL( learn::sigmoid(1000.0), 1.0 );
}

BOOST_AUTO_TEST_CASE( learning_rate )
{
  SgdParams p;
  BOOST_CHECK_EQUAL( p.lambda, 1e-4 );
  BOOST_CHECK_EQUAL( p.epochs, 10 );
  BOOST_CHECK_EQUAL( LogisticRegression::learningRate(p, 0), p.eta0 );
  BOOST_CHECK_CLOSE( LogisticRegression::learningRate(p, 1000000), 0.005, 1e-9 );
}

/* SGD steps on a single example, starting from zero weights */
BOOST_AUTO_TEST_CASE( update_step )
{
  FeatureMatrix x(2);
  map<size_t, double> row;
  row[0] = 1.0;
  row[1] = 2.0;
  x.appendRow(row);

  LogisticRegression lr;
  lr.initialize(2, 0.0, rng);
  BOOST_CHECK_EQUAL( lr.predictProba(x, 0), 0.5 );

  // p = 0.5, g = -0.5: w = -eta*g*x, b = -eta*g
  lr.update(x, 0, 1, 0.1, 0.5);
  vector<double> w = lr.weights();
  BOOST_CHECK_CLOSE( w[0], 0.05, 1e-9 );
  BOOST_CHECK_CLOSE( w[1], 0.10, 1e-9 );
  BOOST_CHECK_CLOSE( lr.bias(), 0.05, 1e-9 );

  // second step shrinks old weights before adding the gradient
  double p = learn::sigmoid(0.05*1.0 + 0.10*2.0 + 0.05);
  lr.update(x, 0, 1, 0.1, 0.5);
  w = lr.weights();
  BOOST_CHECK_CLOSE( w[0], 0.95*0.05 - 0.1*(p-1.0)*1.0, 1e-9 );
  BOOST_CHECK_CLOSE( w[1], 0.95*0.10 - 0.1*(p-1.0)*2.0, 1e-9 );
  BOOST_CHECK_CLOSE( lr.bias(), 0.05 - 0.1*(p-1.0), 1e-9 );
}

/* initial weights stay within the configured range */
BOOST_AUTO_TEST_CASE( initialize )
{
  LogisticRegression lr;
  lr.initialize(100, 0.01, rng);
  BOOST_CHECK_EQUAL( lr.numFeatures(), 100 );
  BOOST_CHECK_EQUAL( lr.bias(), 0.0 );
  bool all_zero = true;
  for (double w : lr.weights()) {
    BOOST_CHECK( w >= -0.01 && w <= 0.01 );
    if (w != 0.0) all_zero = false;
  }
  BOOST_CHECK( !all_zero );
}

/* a linearly separable problem is learned */
BOOST_AUTO_TEST_CASE( separable )
{
  LogisticRegression lr;
  lr.fit(X, y, params, rng);
  vector<double> w = lr.weights();
  BOOST_TEST_MESSAGE( "w = " << w[0] << ", " << w[1] << ", " << w[2] );
  BOOST_CHECK( w[0] > w[1] );
  BOOST_CHECK( eval::rocAuc(y, lr.predictProba(X)) > 0.9 );

  EnsembleClassifier ens(5, params, 2);
  ens.fit(X, y, rng);
  BOOST_CHECK_EQUAL( ens.learners().size(), 5 );
  vector<double> probs = ens.predictProba(X);
  BOOST_CHECK( eval::rocAuc(y, probs) > 0.9 );
  for (double p : probs)
    BOOST_CHECK( p > 0.0 && p < 1.0 );
}

/* training data must hold matching rows, valid labels and both classes */
BOOST_AUTO_TEST_CASE( invalid_training_data )
{
  LogisticRegression lr;
  vector<int> y_short(y.begin(), y.begin()+10);
  BOOST_CHECK_THROW( lr.fit(X, y_short, params, rng), std::invalid_argument );

  vector<int> y_bad(y);
  y_bad[3] = 2;
  BOOST_CHECK_THROW( lr.fit(X, y_bad, params, rng), std::invalid_argument );

  vector<int> y_one(y.size(), 1);
  BOOST_CHECK_THROW( lr.fit(X, y_one, params, rng), error::InsufficientDataError );

  EnsembleClassifier ens(3, params);
  vector<int> y_zero(y.size(), 0);
  BOOST_CHECK_THROW( ens.fit(X, y_zero, rng), error::InsufficientDataError );
  BOOST_CHECK_THROW( ens.fit(FeatureMatrix(3), vector<int>(), rng), error::InsufficientDataError );
  BOOST_CHECK( !ens.isFitted() );
}

/* an ensemble of one behaves like a single learner seeded from the master generator */
BOOST_AUTO_TEST_CASE( single_learner_ensemble )
{
  RandomNumberGenerator<> rng_ens(99);
  EnsembleClassifier ens(1, params);
  ens.fit(X, y, rng_ens);

  RandomNumberGenerator<> rng_master(99);
  RandomNumberGenerator<> rng_lr(rng_master.getRandomSeed());
  LogisticRegression lr;
  lr.fit(X, y, params, rng_lr);

  vector<double> p_ens = ens.predictProba(X);
  vector<double> p_lr = lr.predictProba(X);
  BOOST_REQUIRE_EQUAL( p_ens.size(), p_lr.size() );
  for (size_t i=0; i<p_ens.size(); ++i)
    BOOST_CHECK_EQUAL( p_ens[i], p_lr[i] );
  BOOST_CHECK_EQUAL( ens.predictProba(X, 7), p_lr[7] );
}

/* results depend on the seed only, not on the number of threads */
BOOST_AUTO_TEST_CASE( thread_count_independent )
{
  boost::timer::auto_cpu_timer t;
  RandomNumberGenerator<> rng1(2024);
  RandomNumberGenerator<> rng4(2024);
  EnsembleClassifier ens1(8, params, 1);
  EnsembleClassifier ens4(8, params, 4);
  ens1.fit(X, y, rng1);
  ens4.fit(X, y, rng4);

  vector<double> p1 = ens1.predictProba(X);
  vector<double> p4 = ens4.predictProba(X);
  for (size_t i=0; i<p1.size(); ++i)
    BOOST_CHECK_EQUAL( p1[i], p4[i] );
}

/* learners differ by initialization */
BOOST_AUTO_TEST_CASE( learners_differ )
{
  EnsembleClassifier ens(2, params);
  ens.fit(X, y, rng);
  BOOST_CHECK( ens.learners()[0].weights() != ens.learners()[1].weights() );
}

BOOST_AUTO_TEST_CASE( invalid_ensemble )
{
  BOOST_CHECK_THROW( EnsembleClassifier(0, params), error::ConfigurationError );
  BOOST_CHECK_THROW( EnsembleClassifier(3, params, 0), error::ConfigurationError );
  SgdParams p_neg;
  p_neg.lambda = -1.0;
  BOOST_CHECK_THROW( EnsembleClassifier(3, p_neg), error::ConfigurationError );

  EnsembleClassifier ens(3, params);
  BOOST_CHECK_THROW( ens.predictProba(X), std::logic_error );
  ens.fit(X, y, rng);
  BOOST_CHECK_EQUAL( ens.size(), 3 );
  BOOST_CHECK_THROW( ens.predictProba(FeatureMatrix(5)), std::invalid_argument );
}

BOOST_AUTO_TEST_SUITE_END()
