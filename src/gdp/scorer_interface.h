#ifndef _GDP_SCORER_I_H_
#define _GDP_SCORER_I_H_

#include <vector>

#include "corpus/batch.h"
#include "corpus/utils.h"

namespace arcdp {

// Score tensors of one batch. arcs[b](d, h) scores token d of row b attaching
// to head h; rels[b][d](h, r) scores relation r for d under head h. Every
// matrix is padded to the batch's max length.
struct BatchScores {
  std::vector<MatrixReal> arcs;
  std::vector<std::vector<MatrixReal>> rels;
};

// Black box producing arc and relation scores for a batch. Implementations
// must be pure functions of their parameters and the batch.
class ScorerInterface {
  public:

  virtual BatchScores score(const Batch& batch, const Mask& mask) const = 0;

  // Average loss over the masked positions with gold annotation.
  virtual Real loss(const BatchScores& scores, const Batch& batch,
                    const Mask& mask) const = 0;

  virtual int num_labels() const = 0;

  virtual ~ScorerInterface() {}
};

}  // namespace arcdp

#endif
