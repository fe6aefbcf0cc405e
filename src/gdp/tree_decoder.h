#ifndef _GDP_TREE_DECODER_H_
#define _GDP_TREE_DECODER_H_

#include "corpus/errors.h"
#include "corpus/utils.h"
#include "gdp/scorer_interface.h"

namespace arcdp {

// Decoded heads and relation ids of one batch, in the shape of its mask.
// Entries outside the mask are 0.
struct DecodedBatch {
  MatrixId heads;
  MatrixId rels;

  // Per-sentence sequences of the masked entries of each row.
  void split(const Mask& mask, IndicesList* sent_heads,
             WordsList* sent_rels) const;
};

// Turns arc and relation scores into heads and relations. Without tree
// enforcement every token takes its best head; with it, each sentence is
// decoded to a single-rooted tree (Chu-Liu/Edmonds), projective if
// requested (Eisner).
class TreeDecoder {
 public:
  static DecodedBatch decode(const BatchScores& scores, const Mask& mask,
                             bool tree, bool proj);

  // Heads of tokens 1..n of one sentence as a 0-based sequence.
  static Indices decodeHeads(const MatrixReal& arcs, int n, bool tree,
                             bool proj);

  static Indices greedyHeads(const MatrixReal& arcs, int n);

 private:
  static void checkShape(const BatchScores& scores, const Mask& mask);
};

}  // namespace arcdp

#endif
