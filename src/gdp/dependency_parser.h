#ifndef _GDP_DEPENDENCY_PARSER_H_
#define _GDP_DEPENDENCY_PARSER_H_

#include <atomic>
#include <string>
#include <utility>

#include <boost/shared_ptr.hpp>

#include "corpus/dict.h"
#include "corpus/model_config.h"
#include "corpus/parsed_corpus.h"
#include "gdp/attachment_metric.h"
#include "gdp/prediction_assembler.h"
#include "gdp/scorer_interface.h"

namespace arcdp {

// Batched inference and evaluation over a scorer: bucketing, masking,
// decoding, then either assembling predictions or scoring against gold
// annotation. Batches are processed one after the other; a failure in any
// batch aborts the call.
class DependencyParser {
 public:
  DependencyParser(const boost::shared_ptr<ModelConfig>& config,
                   const boost::shared_ptr<Dict>& dict,
                   const boost::shared_ptr<ScorerInterface>& scorer);

  // Builds the vocabularies from config->training_file and a randomly
  // initialised biaffine scorer sized to them.
  static boost::shared_ptr<DependencyParser> create(
      const boost::shared_ptr<ModelConfig>& config);

  // Each sentence is a list of tokens.
  PredictionResult predict(const StringsList& sentences, int buckets,
                           int batch_size, bool prob, bool tree, bool proj,
                           const std::string& pred_path = "");

  // Reads a CoNLL file.
  PredictionResult predict(const std::string& filename, int buckets,
                           int batch_size, bool prob, bool tree, bool proj,
                           const std::string& pred_path = "");

  PredictionResult predict(const boost::shared_ptr<ParsedCorpus>& corpus,
                           int buckets, int batch_size, bool prob, bool tree,
                           bool proj, const std::string& pred_path = "");

  // Uses the batching and decoding settings of the configuration.
  PredictionResult predict(const boost::shared_ptr<ParsedCorpus>& corpus);

  // Returns the average batch loss and the attachment scores.
  std::pair<Real, AttachmentMetric> evaluate(const std::string& filename);

  std::pair<Real, AttachmentMetric> evaluate(
      const boost::shared_ptr<ParsedCorpus>& corpus);

  // Writes config, dict and scorer to one archive. The archive is written
  // next to filename first and moved into place when complete.
  void save(const std::string& filename) const;

  static boost::shared_ptr<DependencyParser> load(const std::string& filename);

  // Checked between batches; raising it aborts the call with CancelledError.
  void set_cancel_flag(std::atomic<bool>* cancel) {
    cancel_ = cancel;
  }

  boost::shared_ptr<ModelConfig> getConfig() const {
    return config;
  }

  boost::shared_ptr<Dict> getDict() const {
    return dict;
  }

  boost::shared_ptr<ScorerInterface> getScorer() const {
    return scorer;
  }

 private:
  void checkCancelled() const;

  boost::shared_ptr<ModelConfig> config;
  boost::shared_ptr<Dict> dict;
  boost::shared_ptr<ScorerInterface> scorer;
  std::atomic<bool>* cancel_;
};

}  // namespace arcdp

#endif
