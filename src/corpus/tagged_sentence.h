#ifndef _CORPUS_TAGSENT_H_
#define _CORPUS_TAGSENT_H_

#include "corpus/dict.h"
#include "corpus/sentence.h"

namespace arcdp {

// A sentence with one POS tag per position. The tag is the feature the scorer
// consumes alongside the word.
class TaggedSentence: public Sentence {
 public:
  TaggedSentence();

  TaggedSentence(Strings forms, Words sent, Words tags, int id);

  WordId tag_at(WordIndex i) const {
    return tags_.at(i);
  }

 private:
  Words tags_;
};

}  // namespace arcdp

#endif
