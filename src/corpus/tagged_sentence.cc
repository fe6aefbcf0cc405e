#include "corpus/tagged_sentence.h"

namespace arcdp {

TaggedSentence::TaggedSentence():
  Sentence(),
  tags_()
  {
  }

TaggedSentence::TaggedSentence(Strings forms, Words sent, Words tags, int id):
  Sentence(forms, sent, id),
  tags_(tags)
  {
  }

}  // namespace arcdp
