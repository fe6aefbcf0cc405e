#include "gdp/mask.h"

namespace arcdp {

Mask decodeMask(const MatrixId& words, WordId pad) {
  Mask mask = (words.array() != pad);
  if (mask.cols() > 0) {
    mask.col(0).setConstant(false);
  }

  return mask;
}

Mask puncMask(const MatrixId& words, const Mask& mask,
              const std::set<WordId>& punct_ids) {
  Mask narrowed = mask;
  for (int b = 0; b < words.rows(); ++b) {
    for (int i = 0; i < words.cols(); ++i) {
      if (narrowed(b, i) && punct_ids.count(words(b, i)) > 0) {
        narrowed(b, i) = false;
      }
    }
  }

  return narrowed;
}

}  // namespace arcdp
