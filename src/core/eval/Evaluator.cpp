#include "Evaluator.hpp"
#include "../errors.hpp"
#include "../seqio/Window.hpp"
#include "../stringio.hpp"
#include <algorithm>
#include <fstream>
#include <numeric> // iota()
#include <stdexcept>

using namespace std;

namespace eval {

PredictionRecord::PredictionRecord(const string& id, const int label, const double prob)
: id(id), label(label), prob(prob) {}

double rocAuc(const vector<int>& labels, const vector<double>& scores) {
  if (labels.size() != scores.size())
    throw invalid_argument(stringio::format(
      "number of labels (%lu) does not match number of scores (%lu)", labels.size(), scores.size()));

  size_t n = scores.size();
  vector<size_t> order(n);
  iota(order.begin(), order.end(), 0);
  sort(order.begin(), order.end(),
       [&scores](size_t a, size_t b) { return scores[a] < scores[b]; });

  // assign 1-based ranks, averaging over runs of tied scores
  vector<double> ranks(n);
  size_t i = 0;
  while (i < n) {
    size_t j = i;
    while (j+1 < n && scores[order[j+1]] == scores[order[i]])
      ++j;
    double avg_rank = (i + j) / 2.0 + 1.0;
    for (size_t k=i; k<=j; ++k)
      ranks[order[k]] = avg_rank;
    i = j+1;
  }

  double n_pos = 0;
  double sum_ranks_pos = 0.0;
  for (size_t k=0; k<n; ++k) {
    if (labels[k] == 1) {
      n_pos += 1;
      sum_ranks_pos += ranks[k];
    }
  }
  double n_neg = n - n_pos;
  if (n_pos == 0 || n_neg == 0)
    throw error::InsufficientDataError("ROC-AUC requires positive and negative samples");

  double u = sum_ranks_pos - n_pos * (n_pos + 1) / 2.0;
  return u / (n_pos * n_neg);
}

Evaluator::Evaluator() {}

void
Evaluator::add (
  const vector<string>& ids,
  const int label,
  const vector<double>& probs
) {
  if (ids.size() != probs.size())
    throw invalid_argument(stringio::format(
      "number of ids (%lu) does not match number of predictions (%lu)", ids.size(), probs.size()));
  for (size_t i=0; i<ids.size(); ++i)
    m_vec_records.push_back(PredictionRecord(ids[i], label, probs[i]));
}

double
Evaluator::auc() const {
  vector<int> labels;
  vector<double> probs;
  for (auto const & rec : m_vec_records) {
    labels.push_back(rec.label);
    probs.push_back(rec.prob);
  }
  return rocAuc(labels, probs);
}

const vector<PredictionRecord>& Evaluator::records() const {
  return m_vec_records;
}

size_t Evaluator::size() const {
  return m_vec_records.size();
}

void
Evaluator::writePredictions(ostream& os) const {
  for (auto const & rec : m_vec_records) {
    seqio::Window win;
    if (!seqio::Window::fromId(rec.id, win))
      throw error::ParseError("sequence id '" + rec.id + "' does not encode window coordinates");
    os << stringio::format("%s\t%ld\t%ld\t%s\t%d\t%.6f\n",
                           win.id_chr.c_str(), win.start, win.end,
                           rec.id.c_str(), rec.label, rec.prob);
  }
}

void
Evaluator::writePredictions(const string& filename) const {
  ofstream ofs;
  ofs.open(filename);
  if (!ofs.good())
    throw error::IOError("could not open file '" + filename + "' for writing");
  writePredictions(ofs);
  ofs.close();
  if (ofs.fail())
    throw error::IOError("error writing file '" + filename + "'");
}

} // namespace eval
