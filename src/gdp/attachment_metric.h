#ifndef _GDP_ATTACHMENT_METRIC_H_
#define _GDP_ATTACHMENT_METRIC_H_

#include <iostream>

#include "corpus/utils.h"

namespace arcdp {

// Running attachment scores over one evaluation pass. Only positions inside
// the mask are scored.
class AttachmentMetric {

public:
  AttachmentMetric();

  void update(const MatrixId& pred_heads, const MatrixId& pred_rels,
              const MatrixId& gold_heads, const MatrixId& gold_rels,
              const Mask& mask);

  void reset();

  AttachmentMetric& operator+=(const AttachmentMetric& other);

  // Ordered by labelled accuracy.
  bool operator<(const AttachmentMetric& other) const {
    return labeled_accuracy() < other.labeled_accuracy();
  }

  void printAccuracy() const;

  Real unlabeled_accuracy() const {
    return (total_ == 0) ? 0.0 : (correct_arcs_ + 0.0)/total_;
  }

  Real labeled_accuracy() const {
    return (total_ == 0) ? 0.0 : (correct_rels_ + 0.0)/total_;
  }

  // Fraction of sentences with every scored head correct.
  Real ucm() const {
    return (num_sentences_ == 0) ? 0.0 : (complete_sentences_ + 0.0)/num_sentences_;
  }

  Real lcm() const {
    return (num_sentences_ == 0) ? 0.0 : (complete_sentences_lab_ + 0.0)/num_sentences_;
  }

  int correct_arcs() const {
    return correct_arcs_;
  }

  int correct_rels() const {
    return correct_rels_;
  }

  int total() const {
    return total_;
  }

  int num_sentences() const {
    return num_sentences_;
  }

private:
  int correct_arcs_;
  int correct_rels_;
  int total_;
  int num_sentences_;
  int complete_sentences_;
  int complete_sentences_lab_;
};

std::ostream& operator<<(std::ostream& out, const AttachmentMetric& metric);

}  // namespace arcdp

#endif
