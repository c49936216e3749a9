/**
 * Classification of target sequences with an ensemble trained on a
 * source experiment.
 *
 * Training data: treatment sequences (label 1) and control sequences
 * (label 0) of the source experiment. Predictions for the target
 * experiment are written in input order (treatment first, then control)
 * and summarized by ROC-AUC.
 */
#include "core/config/ConfigStore.hpp"
#include "core/errors.hpp"
#include "core/eval/Evaluator.hpp"
#include "core/features/KmerVectorizer.hpp"
#include "core/learn/EnsembleClassifier.hpp"
#include "core/random.hpp"
#include "core/seqio.hpp"

#include <boost/timer/timer.hpp>
#include <omp.h>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

using namespace std;
using config::ConfigStore;
using eval::Evaluator;
using features::FeatureMatrix;
using features::KmerVectorizer;
using learn::EnsembleClassifier;
using learn::SgdParams;
using seqio::SeqCollection;

int main (int argc, char* argv[])
{
  // user params (defined in config file or command line)
  ConfigStore config;
  try {
    bool args_ok = config.parseArgsClassify(argc, argv);
    if (!args_ok) { return EXIT_SUCCESS; }
  } catch (const std::exception& e) {
    fprintf(stderr, "\n%s: %s\n", error::errorName(e), e.what());
    return EXIT_FAILURE;
  }

  try {
    string fn_train_treat = config.getValue<string>("train-treatment");
    string fn_train_ctrl = config.getValue<string>("train-control");
    string fn_target_treat = config.getValue<string>("target-treatment");
    string fn_target_ctrl = config.getValue<string>("target-control");
    string fn_out = config.getValue<string>("output");
    int num_threads = config.getValue<int>("threads");
    int num_learners = config.getValue<int>("ensemble-size");
    unsigned k_min = config.getValue<unsigned>("kmin");
    unsigned k_max = config.getValue<unsigned>("kmax");
    int verbosity = config.getValue<int>("verbosity");
    long seed = config.getValue<long>("seed");
    SgdParams params;
    params.lambda = config.getValue<double>("lambda");
    params.epochs = config.getValue<unsigned>("epochs");
    params.eta0 = config.getValue<double>("learning-rate");
    params.init_scale = config.getValue<double>("init-scale");

    // set number of parallel threads
    omp_set_num_threads(num_threads);

    boost::timer::cpu_timer timer;
    RandomNumberGenerator<> rng(seed);
    if (verbosity > 0)
      fprintf(stdout, "[INFO] Random seed: %ld\n", seed);

    // read sequences
    SeqCollection train_treat = seqio::readSeqCollection(fn_train_treat);
    SeqCollection train_ctrl = seqio::readSeqCollection(fn_train_ctrl);
    SeqCollection target_treat = seqio::readSeqCollection(fn_target_treat);
    SeqCollection target_ctrl = seqio::readSeqCollection(fn_target_ctrl);
    if (verbosity > 0) {
      fprintf(stdout, "[INFO] Training sequences: %lu treatment, %lu control.\n", train_treat.size(), train_ctrl.size());
      fprintf(stdout, "[INFO] Target sequences: %lu treatment, %lu control.\n", target_treat.size(), target_ctrl.size());
    }

    // source experiment: treatment first (label 1), then control (label 0)
    vector<string> vec_train_seqs = train_treat.sequences();
    vector<string> vec_train_ctrl = train_ctrl.sequences();
    vec_train_seqs.insert(vec_train_seqs.end(), vec_train_ctrl.begin(), vec_train_ctrl.end());
    vector<int> vec_labels(train_treat.size(), 1);
    vec_labels.resize(vec_train_seqs.size(), 0);

    vector<string> vec_target_seqs = target_treat.sequences();
    vector<string> vec_target_ctrl = target_ctrl.sequences();
    vec_target_seqs.insert(vec_target_seqs.end(), vec_target_ctrl.begin(), vec_target_ctrl.end());

    // features
    KmerVectorizer vectorizer(k_min, k_max);
    FeatureMatrix X_train = vectorizer.fitTransform(vec_train_seqs);
    FeatureMatrix X_target = vectorizer.transform(vec_target_seqs);
    if (verbosity > 0)
      fprintf(stdout, "[INFO] Vocabulary: %lu k-mers (k=%u..%u).\n", vectorizer.vocabulary().size(), k_min, k_max);

    // train ensemble on source experiment
    if (verbosity > 0)
      fprintf(stdout, "[INFO] Training %d classifiers (lambda=%g, epochs=%u) using %d threads.\n",
              num_learners, params.lambda, params.epochs, num_threads);
    boost::timer::cpu_timer timer_fit;
    EnsembleClassifier ensemble(num_learners, params, num_threads);
    ensemble.fit(X_train, vec_labels, rng);
    if (verbosity > 1)
      fprintf(stdout, "[INFO] Training took %s.\n", timer_fit.format(2, "%ws wall, %ts CPU").c_str());

    // predict target experiment
    vector<double> vec_probs = ensemble.predictProba(X_target);
    vector<double> vec_probs_treat(vec_probs.begin(), vec_probs.begin() + target_treat.size());
    vector<double> vec_probs_ctrl(vec_probs.begin() + target_treat.size(), vec_probs.end());
    Evaluator evaluator;
    evaluator.add(target_treat.ids(), 1, vec_probs_treat);
    evaluator.add(target_ctrl.ids(), 0, vec_probs_ctrl);
    evaluator.writePredictions(fn_out);
    if (verbosity > 0)
      fprintf(stdout, "[INFO] Predictions written to '%s'.\n", fn_out.c_str());

    fprintf(stdout, "ROC-AUC: %.2f%%\n", 100.0 * evaluator.auc());
    if (verbosity > 0)
      fprintf(stdout, "[INFO] Done (%s).\n", timer.format(2, "%ws wall, %ts CPU").c_str());
  } catch (const std::exception& e) {
    fprintf(stderr, "\n%s: %s\n", error::errorName(e), e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
