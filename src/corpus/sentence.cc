#include "corpus/sentence.h"

namespace arcdp {

Sentence::Sentence() : forms_(), sentence_(), id_(0) {}

Sentence::Sentence(Strings forms, Words sent, int id)
    : forms_(forms), sentence_(sent), id_(id) {}

}  // namespace arcdp
