#ifndef EVALUATOR_H
#define EVALUATOR_H

#include <iostream>
#include <string>
#include <vector>

/** Assessment and output of predictions. */
namespace eval {

/** Prediction for a single sequence. */
struct PredictionRecord {
  std::string id;    /** sequence id ("{chrom}:{start}-{end}") */
  int         label; /** true class (1: treatment, 0: control) */
  double      prob;  /** predicted probability of class 1 */

  PredictionRecord(const std::string& id, const int label, const double prob);
};

/**
 * Area under the ROC curve, computed from ranks (Mann-Whitney U).
 * Tied scores receive their average rank.
 * \throws std::invalid_argument if labels and scores differ in size
 * \throws error::InsufficientDataError unless both classes are present
 */
double rocAuc(const std::vector<int>& labels, const std::vector<double>& scores);

/**
 * Collects predictions in presentation order and summarizes them.
 *
 * Records are kept exactly in the order they were added; callers add
 * all treatment sequences first, then all control sequences.
 */
class Evaluator
{
public:
  Evaluator();

  /** Append predictions for a group of sequences sharing one label. */
  void
  add (
    const std::vector<std::string>& ids,
    const int label,
    const std::vector<double>& probs
  );

  /** ROC-AUC over all records added so far. */
  double auc() const;

  const std::vector<PredictionRecord>& records() const;
  size_t size() const;

  /**
   * Write records as tab-separated lines:
   *   chromosome, start, end, id, label, probability
   * \throws error::ParseError if an id does not encode window coordinates
   */
  void writePredictions(std::ostream& os) const;
  /** Write records to file. \throws error::IOError, error::ParseError */
  void writePredictions(const std::string& filename) const;

private:
  std::vector<PredictionRecord> m_vec_records;
};

} // namespace eval

#endif // EVALUATOR_H
