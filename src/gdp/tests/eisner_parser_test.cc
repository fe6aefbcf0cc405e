#include "gtest/gtest.h"

#include <cstdlib>
#include <limits>

#include "gdp/arc_list.h"
#include "gdp/eisner_parser.h"
#include "utils/testing.h"

namespace arcdp {

namespace {

Real treeScore(const MatrixReal& scores, const Indices& heads) {
  Real score = 0;
  for (size_t d = 0; d < heads.size(); ++d)
    score += scores(d + 1, heads[d]);
  return score;
}

// Exhaustive search over projective single-rooted trees.
Real bestProjectiveScore(const MatrixReal& scores, int n) {
  Real best = -std::numeric_limits<Real>::infinity();
  Indices heads(n, 0);
  while (true) {
    if (ArcList(heads).is_tree(true))
      best = std::max(best, treeScore(scores, heads));

    int k = 0;
    while (k < n && heads[k] == n) {
      heads[k] = 0;
      ++k;
    }
    if (k == n)
      break;
    ++heads[k];
  }
  return best;
}

}  // namespace

TEST(EisnerParserTest, TestMatchesExhaustiveSearch) {
  std::srand(11);
  for (int n = 1; n <= 5; ++n) {
    for (int trial = 0; trial < 20; ++trial) {
      MatrixReal scores = MatrixReal::Random(n + 1, n + 1);
      EisnerParser parser(scores, n);
      Indices heads = parser.parse();

      ASSERT_EQ(n, heads.size());
      EXPECT_TRUE(ArcList(heads).is_tree(true));
      EXPECT_NEAR(bestProjectiveScore(scores, n), treeScore(scores, heads), EPS);
      EXPECT_NEAR(treeScore(scores, heads), parser.weight(), EPS);
      EXPECT_NEAR(parser.weight(), parser.right_complete_weight(0, n), EPS);
    }
  }
}

TEST(EisnerParserTest, TestAvoidsCrossingArcs) {
  // The best unconstrained tree 0->2, 2->4, 4->1, 2->3 has crossing arcs.
  MatrixReal scores = MatrixReal::Zero(5, 5);
  scores(2, 0) = 10;
  scores(4, 2) = 10;
  scores(1, 4) = 10;
  scores(3, 2) = 10;
  EisnerParser parser(scores, 4);
  Indices heads = parser.parse();

  EXPECT_TRUE(ArcList(heads).is_projective_dependency());
  EXPECT_EQ(1, ArcList(heads).child_count_at(0));
  EXPECT_LT(parser.weight(), 40);
}

TEST(EisnerParserTest, TestSingleRoot) {
  MatrixReal scores = MatrixReal::Zero(4, 4);
  scores.col(0).setConstant(10);
  EisnerParser parser(scores, 3);
  Indices heads = parser.parse();

  EXPECT_EQ(1, ArcList(heads).child_count_at(0));
}

TEST(EisnerParserTest, TestEmptySentence) {
  MatrixReal scores = MatrixReal::Zero(1, 1);
  EisnerParser parser(scores, 0);
  EXPECT_TRUE(parser.parse().empty());
}

}  // namespace arcdp
