#ifndef _GDP_MST_PARSER_H_
#define _GDP_MST_PARSER_H_

#include <vector>

#include "corpus/utils.h"

namespace arcdp {

// Maximum spanning arborescence decoder (Chu-Liu/Edmonds) over the arc
// scores of one sentence. scores(d, h) is the score of head h for dependent d;
// only positions 0..n are read. Nodes are plain indices, edges are implicit
// in the score matrix.
class MstParser {
 public:
  MstParser(const MatrixReal& scores, int n);

  // Best tree with exactly one token attached to the root. Returns the heads
  // of tokens 1..n as a 0-based sequence.
  Indices parse();

  // Best arborescence without the single-root constraint.
  Indices parseMultiRoot();

  Real weight() const {
    return weight_;
  }

 private:
  Indices chuLiuEdmonds(int root_child, Real* value) const;

  void runIteration(std::vector<bool>* disabled, IndicesList* candidate_heads,
                    std::vector<Reals>* candidate_scores, Indices* heads,
                    Real* value) const;

  const MatrixReal& scores_;
  int n_;
  Real weight_;
};

}  // namespace arcdp

#endif
