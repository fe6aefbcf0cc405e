#include "gdp/prediction_assembler.h"

#include <sstream>

#include "corpus/errors.h"

namespace arcdp {

PredictionResult::PredictionResult(const IndicesList& heads,
                                   const StringsList& rels,
                                   const std::vector<MatrixReal>& probs,
                                   const boost::shared_ptr<ParsedCorpus>& corpus,
                                   const boost::shared_ptr<Dict>& dict)
    : heads_(heads), rels_(rels), probs_(probs), corpus_(corpus), dict_(dict) {}

PredictionAssembler::PredictionAssembler(
    const boost::shared_ptr<ParsedCorpus>& corpus,
    const boost::shared_ptr<Dict>& dict, bool prob)
    : corpus_(corpus),
      dict_(dict),
      prob_(prob),
      heads_(corpus->size()),
      rels_(corpus->size()),
      probs_(prob ? corpus->size() : 0),
      filled_(corpus->size(), false) {}

MatrixReal PredictionAssembler::arcProbabilities(const MatrixReal& arcs, int n) {
  MatrixReal probs(n, n + 1);
  for (int d = 1; d <= n; ++d) {
    VectorReal row = arcs.row(d).head(n + 1).transpose();
    probs.row(d - 1) = softMax(row).transpose();
  }

  return probs;
}

void PredictionAssembler::add(const Batch& batch, const Mask& mask,
                              const DecodedBatch& decoded,
                              const BatchScores& scores) {
  IndicesList sent_heads;
  WordsList sent_rels;
  decoded.split(mask, &sent_heads, &sent_rels);

  for (size_t b = 0; b < batch.size(); ++b) {
    unsigned index = batch.indices[b];
    heads_.at(index) = sent_heads[b];
    rels_.at(index) = sent_rels[b];
    if (prob_)
      probs_.at(index) = arcProbabilities(scores.arcs[b], batch.lens[b]);
    filled_.at(index) = true;
  }
}

PredictionResult PredictionAssembler::finish() {
  StringsList labels;
  for (size_t i = 0; i < corpus_->size(); ++i) {
    if (!filled_[i]) {
      std::ostringstream err;
      err << "no prediction for sentence " << i;
      throw ParseError(err.str());
    }
    corpus_->mutable_sentence_at(i).set_parse(heads_[i], rels_[i]);
    labels.push_back(dict_->lookupLabels(rels_[i]));
  }

  return PredictionResult(heads_, labels, probs_, corpus_, dict_);
}

}  // namespace arcdp
