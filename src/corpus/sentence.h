#ifndef _CORPUS_SENT_H_
#define _CORPUS_SENT_H_

#include "corpus/dict.h"

namespace arcdp {

// Class that represent a sentence (a sequence of words). Position 0 holds the
// root placeholder, so size() is one more than the number of real tokens.
class Sentence {
 public:
  Sentence();

  Sentence(Strings forms, Words sent, int id);

  int id() const { return id_; }

  virtual size_t size() const { return sentence_.size(); }

  // Number of real tokens, root excluded.
  size_t num_tokens() const { return size() - 1; }

  WordId word_at(WordIndex i) const { return sentence_.at(i); }

  const Word& form_at(WordIndex i) const { return forms_.at(i); }

  virtual ~Sentence() {}

 private:
  Strings forms_;
  Words sentence_;
  int id_;
};

}  // namespace arcdp

#endif
