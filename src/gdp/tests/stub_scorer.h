#ifndef _GDP_TESTS_STUB_SCORER_H_
#define _GDP_TESTS_STUB_SCORER_H_

#include "gdp/scorer_interface.h"

namespace arcdp {

// Deterministic scorer for pipeline tests. Favours the gold head and
// relation of each token where the batch carries them; otherwise each token
// attaches to its right neighbour and the last token to the root, with
// relation 0.
class StubScorer : public ScorerInterface {
 public:
  explicit StubScorer(int num_labels) : num_labels_(num_labels) {}

  BatchScores score(const Batch& batch, const Mask& mask) const override {
    BatchScores scores;
    int length = batch.max_length();
    for (size_t b = 0; b < batch.size(); ++b) {
      int n = batch.lens[b];
      MatrixReal arcs = MatrixReal::Zero(length, length);
      std::vector<MatrixReal> rels(length, MatrixReal::Zero(length, num_labels_));
      for (int d = 1; d <= n; ++d) {
        WordIndex h = batch.arcs(b, d);
        if (h < 0 || h > n)
          h = (d < n) ? d + 1 : 0;
        WordId r = batch.rels(b, d);
        if (r < 0 || r >= num_labels_)
          r = 0;
        arcs(d, h) = 1;
        rels[d](h, r) = 1;
      }
      scores.arcs.push_back(arcs);
      scores.rels.push_back(rels);
    }

    return scores;
  }

  Real loss(const BatchScores& scores, const Batch& batch,
            const Mask& mask) const override {
    return 1.0;
  }

  int num_labels() const override {
    return num_labels_;
  }

 private:
  int num_labels_;
};

}  // namespace arcdp

#endif
