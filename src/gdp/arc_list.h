#ifndef _GDP_AR_LIST_H_
#define _GDP_AR_LIST_H_

#include <vector>

#include "corpus/utils.h"

namespace arcdp {

// Head assignment of one sentence over positions 0..n. Position 0 is the
// root and has no head (-1).
class ArcList {

public:
  ArcList():
    arcs_(1, -1),
    child_count_(1, 0)
  {
  }

  // heads[k] is the head of token k+1.
  explicit ArcList(const Indices& heads):
    arcs_(1, -1),
    child_count_(heads.size() + 1, 0)
  {
    for (auto h : heads) {
      arcs_.push_back(h);
      if ((h >= 0) && (h < size()))
        ++child_count_[h];
    }
  }

  Indices arcs() const {
    return arcs_;
  }

  WordIndex at(WordIndex i) const {
    return arcs_[i];
  }

  int size() const {
    return static_cast<int>(arcs_.size());
  }

  bool has_arc(WordIndex i, WordIndex j) const {
    return (arcs_[i] == j);
  }

  int child_count_at(WordIndex i) const {
    return child_count_[i];
  }

  // Every token has a head in range other than itself.
  bool well_formed() const {
    for (int i = 1; i < size(); ++i)
      if (arcs_[i] < 0 || arcs_[i] >= size() || arcs_[i] == i)
        return false;
    return true;
  }

  bool single_root() const {
    return (size() == 1 || child_count_[0] == 1);
  }

  bool is_acyclic() const {
    // 0 unvisited, 1 on the current path, 2 known to reach the root.
    std::vector<int> state(size(), 0);
    state[0] = 2;
    for (int i = 1; i < size(); ++i) {
      std::vector<int> path;
      int h = i;
      while (h >= 0 && h < size() && state[h] == 0) {
        state[h] = 1;
        path.push_back(h);
        h = arcs_[h];
      }
      if (h < 0 || h >= size() || state[h] == 1)
        return false;
      for (auto k : path)
        state[k] = 2;
    }
    return true;
  }

  bool is_projective_dependency() const {
    for (int i = 1; i < (size() - 1); ++i)
      for (int j = i + 1; (j < size()); ++j)
        if ((arcs_[i]<i &&
              (arcs_[j]<i && arcs_[j]>arcs_[i])) ||
            ((arcs_[i]>i && arcs_[i]>j) &&
              (arcs_[j]<i || arcs_[j]>arcs_[i])) ||
            ((arcs_[i]>i && arcs_[i]<j) &&
              (arcs_[j]>i && arcs_[j]<arcs_[i])))
          return false;
    return true;
  }

  // Exactly one token attaches to the root, and every token reaches it.
  bool is_tree(bool proj) const {
    if (!well_formed() || !single_root() || !is_acyclic())
      return false;
    return (!proj || is_projective_dependency());
  }

  bool operator==(const ArcList& a) const {
    return (arcs_==a.arcs());
  }

private:
  Indices arcs_;
  std::vector<int> child_count_;
};

}  // namespace arcdp

#endif
