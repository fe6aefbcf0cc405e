#include "gdp/mst_parser.h"

#include <cmath>
#include <limits>

namespace arcdp {

namespace {

// Arcs the scorer ruled out keep a finite score so that contraction
// arithmetic stays defined.
const Real kImpossible = -1e100;

inline Real finite(Real score) {
  return std::isfinite(score) ? score : kImpossible;
}

}  // namespace

MstParser::MstParser(const MatrixReal& scores, int n):
  scores_(scores),
  n_{n},
  weight_{0}
{
}

Indices MstParser::parse() {
  weight_ = 0;
  if (n_ == 0)
    return Indices();

  Real value = 0;
  Indices heads = chuLiuEdmonds(0, &value);
  int root_children = 0;
  for (auto h : heads)
    if (h == 0) ++root_children;

  if (root_children == 1) {
    weight_ = value;
    return heads;
  }

  // Several tokens attach to the root: fix each token in turn as the only
  // root child and keep the best tree, lowest index first on ties.
  Indices best_heads;
  Real best_value = -std::numeric_limits<Real>::infinity();
  for (WordIndex r = 1; r <= n_; ++r) {
    Indices candidate = chuLiuEdmonds(r, &value);
    if (best_heads.empty() || value > best_value) {
      best_heads = candidate;
      best_value = value;
    }
  }

  weight_ = best_value;
  return best_heads;
}

Indices MstParser::parseMultiRoot() {
  weight_ = 0;
  if (n_ == 0)
    return Indices();

  return chuLiuEdmonds(0, &weight_);
}

Indices MstParser::chuLiuEdmonds(int root_child, Real* value) const {
  int length = n_ + 1;
  std::vector<bool> disabled(length, false);
  IndicesList candidate_heads(length);
  std::vector<Reals> candidate_scores(length);

  for (WordIndex m = 1; m < length; ++m) {
    for (WordIndex h = 0; h < length; ++h) {
      if (h == m) continue;
      if (h == 0 && root_child > 0 && m != root_child) continue;
      candidate_heads[m].push_back(h);
      candidate_scores[m].push_back(finite(scores_(m, h)));
    }
  }

  Indices heads(length, -1);
  runIteration(&disabled, &candidate_heads, &candidate_scores, &heads, value);

  *value = 0;
  for (WordIndex m = 1; m < length; ++m)
    *value += finite(scores_(m, heads[m]));

  return Indices(heads.begin() + 1, heads.end());
}

// Greedily picks the best incoming arc of every node; if that creates a
// cycle, contracts it into a representative node, solves the smaller problem
// recursively and expands the cycle again.
void MstParser::runIteration(std::vector<bool>* disabled,
                             IndicesList* candidate_heads,
                             std::vector<Reals>* candidate_scores,
                             Indices* heads, Real* value) const {
  int length = disabled->size();

  // Pick the best incoming arc for each node, first maximum on ties.
  Reals best_scores(length, 0);
  for (int m = 1; m < length; ++m) {
    if ((*disabled)[m]) continue;
    int best = -1;
    for (unsigned k = 0; k < (*candidate_heads)[m].size(); ++k) {
      if (best < 0 ||
          (*candidate_scores)[m][k] > (*candidate_scores)[m][best]) {
        best = k;
      }
    }
    if (best < 0) {
      (*heads)[m] = 0;
      best_scores[m] = kImpossible;
    } else {
      (*heads)[m] = (*candidate_heads)[m][best];
      best_scores[m] = (*candidate_scores)[m][best];
    }
  }

  // Look for cycles. Stop at the first one found.
  Indices cycle;
  std::vector<int> visited(length, 0);
  for (int m = 1; m < length; ++m) {
    if ((*disabled)[m]) continue;
    int h = m;
    while (h != 0) {
      // visited[h] < m means h was seen earlier and is not on a cycle.
      if (visited[h]) break;
      visited[h] = m;
      h = (*heads)[h];
    }

    if (h != 0 && visited[h] == m) {
      int k = h;
      do {
        cycle.push_back(k);
        k = (*heads)[k];
      } while (k != h);
      break;
    }
  }

  if (cycle.empty()) {
    *value = 0;
    for (int m = 1; m < length; ++m) {
      if (!(*disabled)[m]) *value += best_scores[m];
    }
    return;
  }

  // Nominate a representative node for the cycle and disable the others.
  Real cycle_score = 0;
  std::vector<bool> in_cycle(length, false);
  int representative = cycle[0];
  for (auto m : cycle) {
    in_cycle[m] = true;
    cycle_score += best_scores[m];
    if (m != representative) (*disabled)[m] = true;
  }

  // 1) Arcs leaving the cycle: the best head inside the cycle of each node
  // outside it becomes an arc from the representative.
  Indices best_heads_cycle(length, -1);
  for (int m = 1; m < length; ++m) {
    if ((*disabled)[m] || m == representative) continue;
    Real best_score = 0;
    int best = -1;
    for (unsigned k = 0; k < (*candidate_heads)[m].size(); ++k) {
      if (!in_cycle[(*candidate_heads)[m][k]]) continue;
      if (best < 0 || (*candidate_scores)[m][k] > best_score) {
        best = k;
        best_score = (*candidate_scores)[m][k];
      }
    }
    if (best < 0) continue;
    best_heads_cycle[m] = (*candidate_heads)[m][best];

    unsigned l = 0;
    for (unsigned k = 0; k < (*candidate_heads)[m].size(); ++k) {
      int h = (*candidate_heads)[m][k];
      Real score = (*candidate_scores)[m][k];
      if (!in_cycle[h]) {
        (*candidate_heads)[m][l] = h;
        (*candidate_scores)[m][l] = score;
        ++l;
      }
    }
    (*candidate_heads)[m].resize(l);
    (*candidate_scores)[m].resize(l);
    // Keep candidates in ascending head order for deterministic ties.
    unsigned pos = 0;
    while (pos < l && (*candidate_heads)[m][pos] < representative) ++pos;
    (*candidate_heads)[m].insert((*candidate_heads)[m].begin() + pos, representative);
    (*candidate_scores)[m].insert((*candidate_scores)[m].begin() + pos, best_score);
  }

  // 2) Arcs entering the cycle: each outside head keeps its best entry point,
  // scored relative to the arc it breaks.
  Indices best_modifiers_cycle(length, -1);
  Reals best_scores_cycle(length, 0);
  for (auto m : cycle) {
    for (unsigned l = 0; l < (*candidate_heads)[m].size(); ++l) {
      int h = (*candidate_heads)[m][l];
      if (in_cycle[h]) continue;

      Real score = (*candidate_scores)[m][l] - best_scores[m];
      if (best_modifiers_cycle[h] < 0 || score > best_scores_cycle[h]) {
        best_modifiers_cycle[h] = m;
        best_scores_cycle[h] = score;
      }
    }
  }

  Indices candidate_heads_representative;
  Reals candidate_scores_representative;
  for (int h = 0; h < length; ++h) {
    if (best_modifiers_cycle[h] < 0) continue;
    candidate_heads_representative.push_back(h);
    candidate_scores_representative.push_back(best_scores_cycle[h] + cycle_score);
  }
  (*candidate_heads)[representative] = candidate_heads_representative;
  (*candidate_scores)[representative] = candidate_scores_representative;

  // Save the current head of the representative node (it will be overwritten).
  int head_representative = (*heads)[representative];

  runIteration(disabled, candidate_heads, candidate_scores, heads, value);

  // Expand the cycle.
  int h = (*heads)[representative];
  (*heads)[representative] = head_representative;
  (*heads)[best_modifiers_cycle[h]] = h;

  for (int m = 1; m < length; ++m) {
    if ((*disabled)[m]) continue;
    if ((*heads)[m] == representative && best_heads_cycle[m] >= 0) {
      (*heads)[m] = best_heads_cycle[m];
    }
  }
  for (auto m : cycle) {
    (*disabled)[m] = false;
  }
}

}  // namespace arcdp
