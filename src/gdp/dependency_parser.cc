#include "gdp/dependency_parser.h"

#include <cstdio>
#include <fstream>

#include <boost/make_shared.hpp>
#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/shared_ptr.hpp>

#include <omp.h>

#include "corpus/bucketed_data_set.h"
#include "corpus/errors.h"
#include "gdp/biaffine_scorer.h"
#include "gdp/mask.h"
#include "gdp/tree_decoder.h"

namespace arcdp {

DependencyParser::DependencyParser(
    const boost::shared_ptr<ModelConfig>& config,
    const boost::shared_ptr<Dict>& dict,
    const boost::shared_ptr<ScorerInterface>& scorer)
    : config(config), dict(dict), scorer(scorer), cancel_(nullptr) {}

boost::shared_ptr<DependencyParser> DependencyParser::create(
    const boost::shared_ptr<ModelConfig>& config) {
  boost::shared_ptr<Dict> dict = boost::make_shared<Dict>();
  boost::shared_ptr<ParsedCorpus> training_corpus =
      boost::make_shared<ParsedCorpus>(config);
  training_corpus->readFile(config->training_file, dict, false);
  std::cerr << "Done reading training corpus..." << std::endl;
  std::cerr << "Corpus size: " << training_corpus->size() << " sentences,\t"
            << training_corpus->numTokens() << " tokens" << std::endl;
  std::cerr << dict->size() << " word types, " << dict->tag_size()
            << " tags, " << dict->label_size() << " labels" << std::endl;

  boost::shared_ptr<ScorerInterface> scorer =
      boost::make_shared<BiaffineScorer>(config, true);
  return boost::make_shared<DependencyParser>(config, dict, scorer);
}

void DependencyParser::checkCancelled() const {
  if (cancel_ != nullptr && cancel_->load())
    throw CancelledError("parsing was cancelled");
}

PredictionResult DependencyParser::predict(const StringsList& sentences,
                                           int buckets, int batch_size,
                                           bool prob, bool tree, bool proj,
                                           const std::string& pred_path) {
  boost::shared_ptr<ParsedCorpus> corpus =
      boost::make_shared<ParsedCorpus>(config);
  for (const auto& tokens : sentences)
    corpus->addTokens(tokens, Strings(), dict, true);

  return predict(corpus, buckets, batch_size, prob, tree, proj, pred_path);
}

PredictionResult DependencyParser::predict(const std::string& filename,
                                           int buckets, int batch_size,
                                           bool prob, bool tree, bool proj,
                                           const std::string& pred_path) {
  boost::shared_ptr<ParsedCorpus> corpus =
      boost::make_shared<ParsedCorpus>(config);
  corpus->readFile(filename, dict, true);
  if (config->verbose)
    std::cerr << "Done reading " << filename << "..." << std::endl;

  return predict(corpus, buckets, batch_size, prob, tree, proj, pred_path);
}

PredictionResult DependencyParser::predict(
    const boost::shared_ptr<ParsedCorpus>& corpus) {
  return predict(corpus, config->buckets, config->batch_size, config->prob,
                 config->tree, config->proj, config->test_output_file);
}

PredictionResult DependencyParser::predict(
    const boost::shared_ptr<ParsedCorpus>& corpus, int buckets, int batch_size,
    bool prob, bool tree, bool proj, const std::string& pred_path) {
  ModelConfig options(*config);
  options.buckets = buckets;
  options.batch_size = batch_size;
  options.tree = tree;
  options.proj = proj;
  options.validate();

  auto start_time = get_time();
  BucketedDataSet data(corpus, dict->pad());
  data.build(batch_size, buckets);
  if (config->verbose)
    std::cerr << data << std::endl;

  omp_set_num_threads(config->threads);
  PredictionAssembler assembler(corpus, dict, prob);
  for (size_t i = 0; i < data.num_batches(); ++i) {
    checkCancelled();
    Batch batch = data.batch_at(i);
    Mask mask = decodeMask(batch.words, dict->pad());
    BatchScores scores = scorer->score(batch, mask);
    DecodedBatch decoded = TreeDecoder::decode(scores, mask, tree, proj);
    assembler.add(batch, mask, decoded, scores);
  }

  PredictionResult result = assembler.finish();
  if (pred_path.size()) {
    if (config->verbose)
      std::cerr << "Saving predicted results to " << pred_path << std::endl;
    result.writeFile(pred_path);
  }

  if (config->verbose) {
    Real elapsed = get_duration(start_time, get_time());
    Real sents_per_sec = (elapsed > 0) ? corpus->size() / elapsed : 0;
    std::cerr << "(" << elapsed << "s, " << static_cast<int>(sents_per_sec)
              << " sentences per second)" << std::endl;
  }

  return result;
}

std::pair<Real, AttachmentMetric> DependencyParser::evaluate(
    const std::string& filename) {
  boost::shared_ptr<ParsedCorpus> corpus =
      boost::make_shared<ParsedCorpus>(config);
  corpus->readFile(filename, dict, true);
  if (config->verbose)
    std::cerr << "Done reading test corpus..." << std::endl;

  return evaluate(corpus);
}

std::pair<Real, AttachmentMetric> DependencyParser::evaluate(
    const boost::shared_ptr<ParsedCorpus>& corpus) {
  config->validate();

  auto start_time = get_time();
  BucketedDataSet data(corpus, dict->pad());
  data.build(config->batch_size, config->buckets);
  if (config->verbose)
    std::cerr << data << std::endl;

  omp_set_num_threads(config->threads);
  AttachmentMetric metric;
  Real total_loss = 0;
  for (size_t i = 0; i < data.num_batches(); ++i) {
    checkCancelled();
    Batch batch = data.batch_at(i);
    Mask mask = decodeMask(batch.words, dict->pad());
    BatchScores scores = scorer->score(batch, mask);
    total_loss += scorer->loss(scores, batch, mask);

    DecodedBatch decoded =
        TreeDecoder::decode(scores, mask, config->tree, config->proj);
    // Punctuation still heads other tokens; only its own attachment is
    // left out of the scores.
    if (!config->punct)
      mask = puncMask(batch.words, mask, dict->punctIds());
    metric.update(decoded.heads, decoded.rels, batch.arcs, batch.rels, mask);
  }

  Real loss = total_loss / data.num_batches();
  if (config->verbose) {
    Real elapsed = get_duration(start_time, get_time());
    Real sents_per_sec = (elapsed > 0) ? corpus->size() / elapsed : 0;
    std::cerr << "(" << elapsed << "s, " << static_cast<int>(sents_per_sec)
              << " sentences per second)" << std::endl;
    std::cerr << "Loss: " << loss << " " << metric << std::endl;
  }

  return std::make_pair(loss, metric);
}

void DependencyParser::save(const std::string& filename) const {
  boost::shared_ptr<BiaffineScorer> weights =
      boost::dynamic_pointer_cast<BiaffineScorer>(scorer);
  if (!weights)
    throw ParseError("only biaffine scorers can be written to a model file");

  std::cerr << "Writing model to " << filename << "..." << std::endl;
  std::string tmp_filename = filename + ".tmp";
  {
    std::ofstream fout(tmp_filename, std::ios::binary);
    if (!fout)
      throw ParseError("cannot write model file " + tmp_filename);
    boost::archive::binary_oarchive oar(fout);
    oar << config;
    oar << dict;
    oar << weights;
  }

  if (std::rename(tmp_filename.c_str(), filename.c_str()) != 0) {
    std::remove(tmp_filename.c_str());
    throw ParseError("cannot move model file into place at " + filename);
  }
  std::cerr << "Done..." << std::endl;
}

boost::shared_ptr<DependencyParser> DependencyParser::load(
    const std::string& filename) {
  auto start_time = get_time();
  std::cerr << "Loading model from " << filename << "..." << std::endl;
  std::ifstream fin(filename, std::ios::binary);
  if (!fin)
    throw ParseError("cannot read model file " + filename);

  boost::shared_ptr<ModelConfig> config;
  boost::shared_ptr<Dict> dict;
  boost::shared_ptr<BiaffineScorer> weights;
  try {
    boost::archive::binary_iarchive iar(fin);
    iar >> config;
    iar >> dict;
    iar >> weights;
  } catch (const boost::archive::archive_exception& e) {
    throw ParseError("corrupt model file " + filename + ": " + e.what());
  }
  std::cerr << "Reading model took " << get_duration(start_time, get_time())
            << " seconds..." << std::endl;

  return boost::make_shared<DependencyParser>(config, dict, weights);
}

}  // namespace arcdp
