#include "corpus/parsed_sentence.h"

namespace arcdp {

ParsedSentence::ParsedSentence():
  TaggedSentence(),
  arcs_(),
  labels_()
  {
  }

ParsedSentence::ParsedSentence(Strings forms, Words sent, Words tags, Indices arcs, Words labels, int id):
  TaggedSentence(forms, sent, tags, id),
  arcs_(arcs),
  labels_(labels)
  {
  }

}  // namespace arcdp
