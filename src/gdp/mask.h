#ifndef _GDP_MASK_H_
#define _GDP_MASK_H_

#include <set>

#include "corpus/utils.h"

namespace arcdp {

// True at positions holding real tokens: not padding and not the root
// placeholder in column 0.
Mask decodeMask(const MatrixId& words, WordId pad);

// Narrows mask to the positions whose word is not punctuation. Used for
// scoring only; punctuation still serves as a head candidate in decoding.
Mask puncMask(const MatrixId& words, const Mask& mask,
              const std::set<WordId>& punct_ids);

}  // namespace arcdp

#endif
