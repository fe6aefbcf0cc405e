#include "gtest/gtest.h"

#include <cmath>
#include <sstream>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/make_shared.hpp>

#include "gdp/biaffine_scorer.h"
#include "gdp/mask.h"
#include "utils/testing.h"

namespace ar = boost::archive;

namespace arcdp {

class TestBiaffineScorer : public testing::Test {
 protected:
  void SetUp() {
    config = boost::make_shared<ModelConfig>();
    config->word_representation_size = 3;
    config->tag_representation_size = 2;
    config->arc_representation_size = 4;
    config->rel_representation_size = 3;

    dict = boost::make_shared<Dict>();
    corpus = boost::make_shared<ParsedCorpus>(config);
    corpus->addTokens({"The", "dog", "ran"}, {"DET", "NOUN", "VERB"}, dict, false);
    corpus->addTokens({"Stop"}, {"VERB"}, dict, false);
    corpus->mutable_sentence_at(0).set_parse({2, 3, 0}, {0, 1, 2});
    corpus->mutable_sentence_at(1).set_parse({0}, {2});
    config->vocab_size = dict->size();
    config->num_tags = dict->tag_size();
    config->num_labels = 3;

    batch = makeBatch(*corpus, {0, 1}, dict->pad());
    mask = decodeMask(batch.words, dict->pad());
  }

  boost::shared_ptr<ModelConfig> config;
  boost::shared_ptr<Dict> dict;
  boost::shared_ptr<ParsedCorpus> corpus;
  Batch batch;
  Mask mask;
};

TEST_F(TestBiaffineScorer, TestScoreShapes) {
  BiaffineScorer scorer(config, true);
  BatchScores scores = scorer.score(batch, mask);

  ASSERT_EQ(2, scores.arcs.size());
  ASSERT_EQ(2, scores.rels.size());
  for (size_t b = 0; b < 2; ++b) {
    EXPECT_EQ(4, scores.arcs[b].rows());
    EXPECT_EQ(4, scores.arcs[b].cols());
    ASSERT_EQ(4, scores.rels[b].size());
    EXPECT_EQ(4, scores.rels[b][1].rows());
    EXPECT_EQ(3, scores.rels[b][1].cols());
  }

  // Padding columns of the short sentence can never be chosen as heads.
  EXPECT_TRUE(std::isinf(scores.arcs[1](1, 2)));
  EXPECT_TRUE(std::isinf(scores.arcs[1](1, 3)));
  EXPECT_TRUE(std::isfinite(scores.arcs[1](1, 0)));
  EXPECT_TRUE(std::isfinite(scores.arcs[0](3, 3)));
}

TEST_F(TestBiaffineScorer, TestLoss) {
  BiaffineScorer scorer(config, true);
  BatchScores scores = scorer.score(batch, mask);
  Real loss = scorer.loss(scores, batch, mask);

  EXPECT_TRUE(std::isfinite(loss));
  EXPECT_GT(loss, 0);

  Mask empty = Mask::Constant(mask.rows(), mask.cols(), false);
  EXPECT_DOUBLE_EQ(0, scorer.loss(scores, batch, empty));
}

TEST_F(TestBiaffineScorer, TestUnknownIds) {
  BiaffineScorer scorer(config, true);
  batch.words(0, 1) = config->vocab_size + 10;
  BatchScores scores = scorer.score(batch, mask);
  EXPECT_TRUE(std::isfinite(scores.arcs[0](1, 0)));
}

TEST_F(TestBiaffineScorer, TestSeeded) {
  BiaffineScorer scorer1(config, true);
  BiaffineScorer scorer2(config, true);
  EXPECT_TRUE(scorer1 == scorer2);

  BatchScores scores1 = scorer1.score(batch, mask);
  BatchScores scores2 = scorer2.score(batch, mask);
  EXPECT_MATRIX_NEAR(scores1.arcs[0], scores2.arcs[0], EPS);
}

TEST_F(TestBiaffineScorer, TestSerialization) {
  BiaffineScorer scorer(config, true);
  BiaffineScorer scorer_copy;

  std::stringstream stream(std::ios_base::binary | std::ios_base::out |
                           std::ios_base::in);
  ar::binary_oarchive oar(stream, ar::no_header);
  oar << scorer;

  ar::binary_iarchive iar(stream, ar::no_header);
  iar >> scorer_copy;

  EXPECT_TRUE(scorer == scorer_copy);
  EXPECT_EQ(scorer.numParameters(), scorer_copy.numParameters());
  BatchScores scores = scorer.score(batch, mask);
  BatchScores scores_copy = scorer_copy.score(batch, mask);
  EXPECT_MATRIX_NEAR(scores.arcs[0], scores_copy.arcs[0], EPS);
  EXPECT_MATRIX_NEAR(scores.rels[0][2], scores_copy.rels[0][2], EPS);
}

}  // namespace arcdp
