#ifndef _GDP_PREDICTION_ASSEMBLER_H_
#define _GDP_PREDICTION_ASSEMBLER_H_

#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "corpus/batch.h"
#include "corpus/dict.h"
#include "corpus/parsed_corpus.h"
#include "gdp/scorer_interface.h"
#include "gdp/tree_decoder.h"

namespace arcdp {

// Predicted heads and relation labels of every input sentence, in input
// order. Heads and labels cover the real tokens only (root excluded);
// probs_at(i) is the n x (n+1) arc probability matrix of sentence i when
// probabilities were requested.
class PredictionResult {
 public:
  PredictionResult(const IndicesList& heads, const StringsList& rels,
                   const std::vector<MatrixReal>& probs,
                   const boost::shared_ptr<ParsedCorpus>& corpus,
                   const boost::shared_ptr<Dict>& dict);

  size_t size() const {
    return heads_.size();
  }

  const Indices& heads_at(unsigned i) const {
    return heads_.at(i);
  }

  const Strings& rels_at(unsigned i) const {
    return rels_.at(i);
  }

  bool has_probs() const {
    return !probs_.empty();
  }

  const MatrixReal& probs_at(unsigned i) const {
    return probs_.at(i);
  }

  // The input sentences carrying the predicted parses.
  const ParsedSentence& sentence_at(unsigned i) const {
    return corpus_->sentence_at(i);
  }

  void write(std::ostream& out) const {
    corpus_->write(out, dict_);
  }

  void writeFile(const std::string& filename) const {
    corpus_->writeFile(filename, dict_);
  }

 private:
  IndicesList heads_;
  StringsList rels_;
  std::vector<MatrixReal> probs_;
  boost::shared_ptr<ParsedCorpus> corpus_;
  boost::shared_ptr<Dict> dict_;
};

// Collects the decoded batches of one prediction pass, keyed by corpus
// position, and reassembles them in input order.
class PredictionAssembler {
 public:
  PredictionAssembler(const boost::shared_ptr<ParsedCorpus>& corpus,
                      const boost::shared_ptr<Dict>& dict, bool prob);

  void add(const Batch& batch, const Mask& mask, const DecodedBatch& decoded,
           const BatchScores& scores);

  // Attaches the parses to the corpus sentences. Throws ParseError if some
  // sentence was never added.
  PredictionResult finish();

  // Row-wise softmax of arcs[1..n, 0..n].
  static MatrixReal arcProbabilities(const MatrixReal& arcs, int n);

 private:
  boost::shared_ptr<ParsedCorpus> corpus_;
  boost::shared_ptr<Dict> dict_;
  bool prob_;
  IndicesList heads_;
  WordsList rels_;
  std::vector<MatrixReal> probs_;
  std::vector<bool> filled_;
};

}  // namespace arcdp

#endif
