#include "gdp/attachment_metric.h"

#include <iomanip>

namespace arcdp {

AttachmentMetric::AttachmentMetric()
    : correct_arcs_{0},
      correct_rels_{0},
      total_{0},
      num_sentences_{0},
      complete_sentences_{0},
      complete_sentences_lab_{0} {}

void AttachmentMetric::update(const MatrixId& pred_heads,
                              const MatrixId& pred_rels,
                              const MatrixId& gold_heads,
                              const MatrixId& gold_rels, const Mask& mask) {
  for (int b = 0; b < mask.rows(); ++b) {
    // Sentence level counts.
    ++num_sentences_;
    bool complete = true;
    bool lab_complete = true;

    // Arc level counts.
    for (int i = 0; i < mask.cols(); ++i) {
      if (!mask(b, i))
        continue;
      ++total_;
      if (pred_heads(b, i) == gold_heads(b, i)) {
        ++correct_arcs_;
        if (pred_rels(b, i) == gold_rels(b, i))
          ++correct_rels_;
        else
          lab_complete = false;
      } else {
        complete = false;
        lab_complete = false;
      }
    }

    if (complete)
      ++complete_sentences_;
    if (lab_complete)
      ++complete_sentences_lab_;
  }
}

void AttachmentMetric::reset() {
  correct_arcs_ = 0;
  correct_rels_ = 0;
  total_ = 0;
  num_sentences_ = 0;
  complete_sentences_ = 0;
  complete_sentences_lab_ = 0;
}

AttachmentMetric& AttachmentMetric::operator+=(const AttachmentMetric& other) {
  correct_arcs_ += other.correct_arcs_;
  correct_rels_ += other.correct_rels_;
  total_ += other.total_;
  num_sentences_ += other.num_sentences_;
  complete_sentences_ += other.complete_sentences_;
  complete_sentences_lab_ += other.complete_sentences_lab_;
  return *this;
}

void AttachmentMetric::printAccuracy() const {
  std::cerr << "Labelled Accuracy: " << labeled_accuracy() << std::endl;
  std::cerr << "Unlabelled Accuracy: " << unlabeled_accuracy() << std::endl;
  std::cerr << "Labelled Completely correct: " << lcm() << std::endl;
  std::cerr << "Completely correct: " << ucm() << std::endl;
  std::cerr << "Scored tokens: " << total() << " in " << num_sentences()
            << " sentences" << std::endl;
}

std::ostream& operator<<(std::ostream& out, const AttachmentMetric& metric) {
  std::ios::fmtflags flags = out.flags();
  std::streamsize precision = out.precision();
  out << std::fixed << std::setprecision(2)
      << "UCM: " << 100 * metric.ucm() << "% "
      << "LCM: " << 100 * metric.lcm() << "% "
      << "UAS: " << 100 * metric.unlabeled_accuracy() << "% "
      << "LAS: " << 100 * metric.labeled_accuracy() << "%";
  out.flags(flags);
  out.precision(precision);
  return out;
}

}  // namespace arcdp
