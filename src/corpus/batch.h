#ifndef _CORPUS_BATCH_H_
#define _CORPUS_BATCH_H_

#include <vector>

#include "corpus/parsed_corpus.h"
#include "corpus/utils.h"

namespace arcdp {

// Rectangular id grids for a set of sentences padded to the longest one.
// Column 0 of every row is the root placeholder. lens[b] is the number of real
// tokens of row b (root excluded), so row b spans columns 0..lens[b].
struct Batch {
  MatrixId words;
  MatrixId tags;
  // Gold heads and relations; -1 where unknown.
  MatrixId arcs;
  MatrixId rels;
  std::vector<int> lens;
  // Corpus position of each row.
  std::vector<unsigned> indices;

  size_t size() const {
    return lens.size();
  }

  int max_length() const {
    return static_cast<int>(words.cols());
  }

  int num_tokens() const {
    int total = 0;
    for (auto len : lens)
      total += len;
    return total;
  }
};

Batch makeBatch(const ParsedCorpus& corpus, const std::vector<unsigned>& indices,
                WordId pad);

}  // namespace arcdp

#endif
