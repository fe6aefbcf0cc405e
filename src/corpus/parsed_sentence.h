#ifndef _CORPUS_PARSESENT_H_
#define _CORPUS_PARSESENT_H_

#include "corpus/dict.h"
#include "corpus/tagged_sentence.h"

namespace arcdp {

// Represents a parsed sentence. arc_at(i) is the head of position i (-1 when
// unassigned, and always for the root placeholder), label_at(i) its relation.
class ParsedSentence : public TaggedSentence {
 public:
  ParsedSentence();

  ParsedSentence(Strings forms, Words sent, Words tags, Indices arcs,
                 Words labels, int id);

  std::string arcs_string() const {
    std::string arcs = "";
    for (size_t i = 1; i < arcs_.size(); ++i) {
      if (i > 1) arcs += " ";
      arcs += std::to_string(arcs_[i]);
    }
    return arcs;
  }

  void set_arc(WordIndex i, WordIndex j) {
    if ((j >= 0) && (j < static_cast<WordIndex>(size()))) arcs_[i] = j;
  }

  void set_label(WordIndex i, WordId l) { labels_[i] = l; }

  // Sets heads and labels of the real tokens 1..n from 0-based sequences.
  void set_parse(const Indices& heads, const Words& labels) {
    for (size_t i = 0; i < heads.size(); ++i) {
      set_arc(i + 1, heads[i]);
      set_label(i + 1, labels[i]);
    }
  }

  WordIndex arc_at(WordIndex i) const {
    if (i >= 0) {
      return arcs_.at(i);
    } else {
      return -1;
    }
  }

  WordId label_at(WordIndex i) const {
    if (i >= 0) {
      return labels_.at(i);
    } else {
      return -1;
    }
  }

  bool has_parent_at(WordIndex i) const { return (arc_at(i) >= 0); }

  // Heads of the real tokens, 0-based sequence.
  Indices heads() const {
    return Indices(arcs_.begin() + 1, arcs_.end());
  }

  Words labels() const {
    return Words(labels_.begin() + 1, labels_.end());
  }

 private:
  Indices arcs_;
  Words labels_;
};

}  // namespace arcdp

#endif
