#include "gtest/gtest.h"

#include <cstdio>
#include <fstream>

#include <boost/make_shared.hpp>

#include "corpus/errors.h"
#include "gdp/arc_list.h"
#include "gdp/biaffine_scorer.h"
#include "gdp/dependency_parser.h"
#include "gdp/tests/stub_scorer.h"
#include "utils/testing.h"

namespace arcdp {

class TestDependencyParser : public testing::Test {
 protected:
  void SetUp() {
    config = boost::make_shared<ModelConfig>();
    config->verbose = false;
    config->buckets = 2;
    config->batch_size = 20;
    dict = boost::make_shared<Dict>();
    dict->convertLabel("det", false);
    dict->convertLabel("nsubj", false);
    dict->convertLabel("root", false);
    dict->convertLabel("punct", false);
    dict->convert(".", false);
    dict->convert("!", false);

    gold_filename = testing::TempDir() + "dependency_parser_test.conll";
    std::ofstream out(gold_filename);
    out << "1\tThe\t_\tDET\t_\t_\t2\tdet\t_\t_\n"
        << "2\tdog\t_\tNOUN\t_\t_\t3\tnsubj\t_\t_\n"
        << "3\tran\t_\tVERB\t_\t_\t0\troot\t_\t_\n"
        << "4\t.\t_\tPUNCT\t_\t_\t3\tpunct\t_\t_\n"
        << "\n"
        << "1\tStop\t_\tVERB\t_\t_\t0\troot\t_\t_\n"
        << "2\t!\t_\tPUNCT\t_\t_\t1\tpunct\t_\t_\n";
  }

  boost::shared_ptr<DependencyParser> stubParser() {
    boost::shared_ptr<ScorerInterface> scorer =
        boost::make_shared<StubScorer>(dict->label_size());
    return boost::make_shared<DependencyParser>(config, dict, scorer);
  }

  boost::shared_ptr<ModelConfig> config;
  boost::shared_ptr<Dict> dict;
  std::string gold_filename;
};

TEST_F(TestDependencyParser, TestPredictTheDogRan) {
  boost::shared_ptr<DependencyParser> parser = stubParser();
  PredictionResult result =
      parser->predict(StringsList{{"The", "dog", "ran"}}, 1, 100, false, true,
                      false);

  ASSERT_EQ(1, result.size());
  EXPECT_EQ(Indices({2, 3, 0}), result.heads_at(0));
  EXPECT_EQ(3, result.rels_at(0).size());
  EXPECT_FALSE(result.has_probs());
}

TEST_F(TestDependencyParser, TestPredictReservedForms) {
  boost::shared_ptr<DependencyParser> parser = stubParser();
  PredictionResult result =
      parser->predict(StringsList{{"a", "<pad>", "b"}, {"<root>", "c"}}, 1,
                      100, false, true, false);

  ASSERT_EQ(2, result.size());
  EXPECT_EQ(Indices({2, 3, 0}), result.heads_at(0));
  EXPECT_EQ(3, result.rels_at(0).size());
  EXPECT_EQ(Indices({2, 0}), result.heads_at(1));
  EXPECT_EQ("<pad>", result.sentence_at(0).form_at(2));
  EXPECT_EQ(dict->unk(), result.sentence_at(0).word_at(2));
}

TEST_F(TestDependencyParser, TestPredictKeepsInputOrder) {
  boost::shared_ptr<DependencyParser> parser = stubParser();
  StringsList sentences;
  for (int n : {7, 1, 12, 3, 3, 9, 2, 15}) {
    Strings tokens;
    for (int i = 0; i < n; ++i)
      tokens.push_back("t" + std::to_string(n) + "_" + std::to_string(i));
    sentences.push_back(tokens);
  }

  PredictionResult result =
      parser->predict(sentences, 3, 24, true, true, true);
  ASSERT_EQ(sentences.size(), result.size());
  for (size_t j = 0; j < sentences.size(); ++j) {
    int n = sentences[j].size();
    ASSERT_EQ(n, result.heads_at(j).size());
    EXPECT_EQ(sentences[j][0], result.sentence_at(j).form_at(1));
    EXPECT_EQ(n, result.probs_at(j).rows());
    EXPECT_EQ(n + 1, result.probs_at(j).cols());
    EXPECT_EQ(0, result.heads_at(j).back());
  }
}

TEST_F(TestDependencyParser, TestPredictWritesConll) {
  boost::shared_ptr<DependencyParser> parser = stubParser();
  std::string pred_filename = testing::TempDir() + "dependency_parser_pred.conll";
  parser->predict(gold_filename, 2, 100, false, true, false, pred_filename);

  std::ifstream in(pred_filename);
  std::string line;
  ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
  EXPECT_EQ("1\tThe\t_\t<unk>\t_\t_\t2\tdet\t_\t_", line);
}

TEST_F(TestDependencyParser, TestEvaluate) {
  boost::shared_ptr<DependencyParser> parser = stubParser();
  std::pair<Real, AttachmentMetric> result = parser->evaluate(gold_filename);

  EXPECT_DOUBLE_EQ(1.0, result.first);
  EXPECT_DOUBLE_EQ(1.0, result.second.unlabeled_accuracy());
  EXPECT_DOUBLE_EQ(1.0, result.second.labeled_accuracy());
  EXPECT_DOUBLE_EQ(1.0, result.second.lcm());
  // Punctuation is not scored by default.
  EXPECT_EQ(4, result.second.total());

  config->punct = true;
  result = parser->evaluate(gold_filename);
  EXPECT_EQ(6, result.second.total());
}

TEST_F(TestDependencyParser, TestEmptyInput) {
  boost::shared_ptr<DependencyParser> parser = stubParser();
  EXPECT_THROW(parser->predict(StringsList(), 2, 100, false, false, false),
               EmptyInputError);
}

TEST_F(TestDependencyParser, TestConfigConflict) {
  boost::shared_ptr<DependencyParser> parser = stubParser();
  EXPECT_THROW(parser->predict(StringsList{{"a"}}, 2, 100, false, false, true),
               ConfigConflictError);
  EXPECT_THROW(parser->predict(StringsList{{"a"}}, 0, 100, false, false, false),
               ConfigConflictError);
}

TEST_F(TestDependencyParser, TestCancel) {
  boost::shared_ptr<DependencyParser> parser = stubParser();
  std::atomic<bool> cancel(true);
  parser->set_cancel_flag(&cancel);
  EXPECT_THROW(parser->evaluate(gold_filename), CancelledError);

  cancel = false;
  EXPECT_NO_THROW(parser->evaluate(gold_filename));
}

TEST_F(TestDependencyParser, TestCheckpoint) {
  config->tree = true;
  config->proj = true;
  config->punct = true;
  config->word_representation_size = 4;
  config->tag_representation_size = 3;
  config->arc_representation_size = 5;
  config->rel_representation_size = 2;

  ParsedCorpus corpus(config);
  corpus.readFile(gold_filename, dict, false);
  boost::shared_ptr<BiaffineScorer> scorer =
      boost::make_shared<BiaffineScorer>(config, true);
  DependencyParser parser(config, dict, scorer);

  std::string model_filename = testing::TempDir() + "dependency_parser_test.bin";
  parser.save(model_filename);
  std::ifstream tmp(model_filename + ".tmp");
  EXPECT_FALSE(tmp.good());

  boost::shared_ptr<DependencyParser> loaded = DependencyParser::load(model_filename);
  boost::shared_ptr<ModelConfig> loaded_config = loaded->getConfig();
  EXPECT_TRUE(loaded_config->tree);
  EXPECT_TRUE(loaded_config->proj);
  EXPECT_TRUE(loaded_config->punct);
  EXPECT_TRUE(*config == *loaded_config);
  EXPECT_TRUE(*dict == *loaded->getDict());

  boost::shared_ptr<BiaffineScorer> loaded_scorer =
      boost::dynamic_pointer_cast<BiaffineScorer>(loaded->getScorer());
  ASSERT_TRUE(static_cast<bool>(loaded_scorer));
  EXPECT_TRUE(*scorer == *loaded_scorer);

  loaded_config->verbose = false;
  StringsList sentences = {{"The", "dog", "ran", "."}, {"Stop", "!"}};
  PredictionResult expected = parser.predict(sentences, 1, 100, false, true, true);
  PredictionResult actual = loaded->predict(sentences, 1, 100, false, true, true);
  for (size_t j = 0; j < sentences.size(); ++j) {
    EXPECT_EQ(expected.heads_at(j), actual.heads_at(j));
    EXPECT_EQ(expected.rels_at(j), actual.rels_at(j));
  }

  std::remove(model_filename.c_str());
}

TEST_F(TestDependencyParser, TestLoadedDecodingSettings) {
  config->tree = true;
  config->proj = true;
  config->prob = true;
  config->test_output_file = "";
  config->word_representation_size = 4;
  config->tag_representation_size = 3;
  config->arc_representation_size = 5;
  config->rel_representation_size = 2;

  ParsedCorpus training(config);
  training.readFile(gold_filename, dict, false);
  DependencyParser parser(config, dict,
                          boost::make_shared<BiaffineScorer>(config, true));
  std::string model_filename =
      testing::TempDir() + "dependency_parser_settings_test.bin";
  parser.save(model_filename);

  boost::shared_ptr<DependencyParser> loaded =
      DependencyParser::load(model_filename);
  loaded->getConfig()->verbose = false;
  boost::shared_ptr<ParsedCorpus> corpus =
      boost::make_shared<ParsedCorpus>(loaded->getConfig());
  corpus->readFile(gold_filename, loaded->getDict(), true);

  // The stored settings drive decoding when none are passed.
  PredictionResult result = loaded->predict(corpus);
  ASSERT_EQ(2, result.size());
  EXPECT_TRUE(result.has_probs());
  for (size_t j = 0; j < result.size(); ++j) {
    EXPECT_TRUE(ArcList(result.heads_at(j)).is_tree(true));
    EXPECT_EQ(static_cast<int>(result.heads_at(j).size()),
              result.probs_at(j).rows());
  }
  std::remove(model_filename.c_str());
}

TEST_F(TestDependencyParser, TestSaveNeedsBiaffineScorer) {
  boost::shared_ptr<DependencyParser> parser = stubParser();
  EXPECT_THROW(parser->save(testing::TempDir() + "stub.bin"), ParseError);
}

TEST_F(TestDependencyParser, TestLoadMissingFile) {
  EXPECT_THROW(DependencyParser::load(testing::TempDir() + "missing.bin"),
               ParseError);
}

}  // namespace arcdp
