#include "gdp/eisner_parser.h"

#include <cmath>
#include <limits>

namespace arcdp {

namespace {

const Real kNegInf = -std::numeric_limits<Real>::infinity();

}  // namespace

EisnerParser::EisnerParser(const MatrixReal& scores, int n):
  scores_(scores),
  n_{n},
  chart_(n + 1, std::vector<EChartItem>(n + 1, EChartItem{{0, 0, 0, 0}})),
  split_chart_(n + 1, std::vector<ESplitChartItem>(n + 1,
                         ESplitChartItem{{-1, -1, -1, -1}})),
  arcs_(n + 1, -1),
  weight_{0}
{
}

Real EisnerParser::arc_score(WordIndex i, WordIndex j) const {
  Real score = scores_(i, j);
  // Ruled-out arcs lose to any real arc but still yield a tree.
  return std::isfinite(score) ? score : -1e100;
}

Indices EisnerParser::parse() {
  if (n_ == 0) {
    weight_ = 0;
    return Indices();
  }

  for (WordIndex k = 1; k < size(); ++k) {
    for (WordIndex s = 0; ((s + k) < size()); ++s) {
      WordIndex t = s + k;

      //left incomplete: s attaches to t
      Real best_w = kNegInf;
      WordIndex split = -1;
      for (WordIndex r = s; r < t; ++r) {
        Real w = right_complete_weight(s, r) + left_complete_weight(r+1, t);
        if (split < 0 || w > best_w) {
          best_w = w;
          split = r;
        }
      }
      set_left_incomplete(s, t, best_w + arc_score(s, t), split);

      //right incomplete: t attaches to s
      best_w = kNegInf;
      split = -1;
      for (WordIndex r = s; r < t; ++r) {
        Real w = right_complete_weight(s, r) + left_complete_weight(r+1, t);
        if (split < 0 || w > best_w) {
          best_w = w;
          split = r;
        }
      }
      set_right_incomplete(s, t, best_w + arc_score(t, s), split);

      best_w = kNegInf;
      split = -1;
      for (WordIndex r = s; r < t; ++r) {
        Real w = left_complete_weight(s, r) + left_incomplete_weight(r, t);
        if (split < 0 || w > best_w) {
          best_w = w;
          split = r;
        }
      }
      set_left_complete(s, t, best_w, split);

      best_w = kNegInf;
      split = -1;
      for (WordIndex r = s + 1; r <= t; ++r) {
        Real w = right_incomplete_weight(s, r) + right_complete_weight(r, t);
        if (split < 0 || w > best_w) {
          best_w = w;
          split = r;
        }
      }
      //the root may only close a span covering the whole sentence
      if (s == 0 && t < n_)
        best_w = kNegInf;
      set_right_complete(s, t, best_w, split);
    }
  }

  weight_ = right_complete_weight(0, n_);

  //must have right arc from node 0
  //indexes are inclusive
  recoverParseTree(0, n_, true, false);

  return Indices(arcs_.begin() + 1, arcs_.end());
}

void EisnerParser::recoverParseTree(WordIndex s, WordIndex t, bool complete,
       bool left_arc) {
  if (s >= t)
    return;
  if (!complete) {
    WordIndex r;

    if (left_arc) {
      arcs_[s] = t;
      r = left_incomplete_split(s, t);
    } else {
      //right arc
      arcs_[t] = s;
      r = right_incomplete_split(s, t);
    }

    recoverParseTree(s, r, true, false);
    recoverParseTree(r+1, t, true, true);
  } else {
    if (left_arc) {
      WordIndex r = left_complete_split(s, t);
      recoverParseTree(s, r, true, true);
      recoverParseTree(r, t, false, true);
    } else {
      WordIndex r = right_complete_split(s, t);
      recoverParseTree(s, r, false, false);
      recoverParseTree(r, t, true, false);
    }
  }
}

}  // namespace arcdp
