#ifndef _GDP_ESNR_PARSER_H_
#define _GDP_ESNR_PARSER_H_

#include <array>
#include <vector>

#include "corpus/utils.h"

namespace arcdp {

typedef std::array<Real, 4> EChartItem;
typedef std::array<WordIndex, 4> ESplitChartItem;
typedef std::vector<std::vector<EChartItem>> EChart;
typedef std::vector<std::vector<ESplitChartItem>> ESplitChart;

// First-order projective decoder. Chart item (s, t) holds the best left
// incomplete, right incomplete, left complete and right complete spans;
// a left span is headed by t, a right span by s.
class EisnerParser {
  public:

  EisnerParser(const MatrixReal& scores, int n);

  // Best projective tree with a single root child. Returns the heads of
  // tokens 1..n as a 0-based sequence.
  Indices parse();

  Real weight() const {
    return weight_;
  }

  int size() const {
    return n_ + 1;
  }

  //get chart item weights

  Real left_incomplete_weight(WordIndex i, WordIndex j) const {
    return chart_[i][j][0];
  }

  Real right_incomplete_weight(WordIndex i, WordIndex j) const {
    return chart_[i][j][1];
  }

  Real left_complete_weight(WordIndex i, WordIndex j) const {
    return chart_[i][j][2];
  }

  Real right_complete_weight(WordIndex i, WordIndex j) const {
    return chart_[i][j][3];
  }

  WordIndex left_incomplete_split(WordIndex i, WordIndex j) const {
    return split_chart_[i][j][0];
  }

  WordIndex right_incomplete_split(WordIndex i, WordIndex j) const {
    return split_chart_[i][j][1];
  }

  WordIndex left_complete_split(WordIndex i, WordIndex j) const {
    return split_chart_[i][j][2];
  }

  WordIndex right_complete_split(WordIndex i, WordIndex j) const {
    return split_chart_[i][j][3];
  }

  private:
  // Score of head j for dependent i.
  Real arc_score(WordIndex i, WordIndex j) const;

  void recoverParseTree(WordIndex s, WordIndex t, bool complete, bool left_arc);

  void set_left_incomplete(WordIndex i, WordIndex j, Real w, WordIndex k) {
    chart_[i][j][0] = w;
    split_chart_[i][j][0] = k;
  }

  void set_right_incomplete(WordIndex i, WordIndex j, Real w, WordIndex k) {
    chart_[i][j][1] = w;
    split_chart_[i][j][1] = k;
  }

  void set_left_complete(WordIndex i, WordIndex j, Real w, WordIndex k) {
    chart_[i][j][2] = w;
    split_chart_[i][j][2] = k;
  }

  void set_right_complete(WordIndex i, WordIndex j, Real w, WordIndex k) {
    chart_[i][j][3] = w;
    split_chart_[i][j][3] = k;
  }

  const MatrixReal& scores_;
  int n_;
  EChart chart_;
  ESplitChart split_chart_;
  Indices arcs_;
  Real weight_;
};

}  // namespace arcdp

#endif
