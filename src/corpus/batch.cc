#include <algorithm>

#include "corpus/batch.h"

namespace arcdp {

Batch makeBatch(const ParsedCorpus& corpus, const std::vector<unsigned>& indices,
                WordId pad) {
  Batch batch;
  int max_length = 0;
  for (auto j : indices) {
    max_length = std::max(max_length, static_cast<int>(corpus.sentence_at(j).size()));
  }

  int rows = static_cast<int>(indices.size());
  batch.words = MatrixId::Constant(rows, max_length, pad);
  batch.tags = MatrixId::Constant(rows, max_length, pad);
  batch.arcs = MatrixId::Constant(rows, max_length, -1);
  batch.rels = MatrixId::Constant(rows, max_length, -1);
  batch.indices = indices;

  for (int b = 0; b < rows; ++b) {
    const ParsedSentence& sent = corpus.sentence_at(indices[b]);
    for (WordIndex i = 0; i < static_cast<WordIndex>(sent.size()); ++i) {
      batch.words(b, i) = sent.word_at(i);
      batch.tags(b, i) = sent.tag_at(i);
      batch.arcs(b, i) = sent.arc_at(i);
      batch.rels(b, i) = sent.label_at(i);
    }
    batch.lens.push_back(static_cast<int>(sent.num_tokens()));
  }

  return batch;
}

}  // namespace arcdp
