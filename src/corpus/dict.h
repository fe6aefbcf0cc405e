#ifndef _CORPUS_DICT_H_
#define _CORPUS_DICT_H_

#include <string>
#include <iostream>
#include <fstream>
#include <vector>
#include <set>
#include <map>

#include <boost/serialization/map.hpp>
#include <boost/serialization/set.hpp>
#include <boost/serialization/vector.hpp>
#include <boost/serialization/string.hpp>

#include "corpus/utils.h"

namespace arcdp {

// Word, tag and relation label vocabularies. Words and tags share the
// padding convention: <pad> has index 0, <unk> index 1 and the root
// placeholder <root> index 2. Labels have no special entries.
class Dict {
public:
  Dict();

  WordId convert(const Word& word, bool frozen);

  WordId convertTag(const Word& tag, bool frozen);

  WordId convertLabel(const Word& label, bool frozen);

  Word lookup(WordId id) const;

  Word lookupTag(WordId id) const;

  Word lookupLabel(WordId id) const;

  Strings lookupLabels(const Words& ids) const;

  // Word ids whose surface form consists of punctuation characters only.
  std::set<WordId> punctIds() const {
    return punct_;
  }

  bool punctWord(WordId id) const {
    return (punct_.count(id) > 0);
  }

  static bool isPunct(const Word& word);

  WordId pad() const {
    return 0;
  }

  WordId unk() const {
    return 1;
  }

  WordId root() const {
    return 2;
  }

  size_t size() const {
    return words_.size();
  }

  size_t tag_size() const {
    return tags_.size();
  }

  size_t label_size() const {
    return labels_.size();
  }

  bool valid(const WordId id) const {
    return (id >= 0);
  }

  static bool is_ws(char x) {
    return (x == ' ' || x == '\t');
  }

  bool operator==(const Dict& other) const {
    return (words_ == other.words_ && tags_ == other.tags_ &&
            labels_ == other.labels_ && punct_ == other.punct_);
  }

  friend class boost::serialization::access;

  template<class Archive>
  void serialize(Archive & ar, const unsigned int version) {
    ar & unk_;
    ar & pad_;
    ar & root_;
    ar & words_;
    ar & d_;
    ar & tags_;
    ar & tag_d_;
    ar & labels_;
    ar & label_d_;
    ar & punct_;
  }

private:
  bool reserved(const Word& word) const;

  Word unk_;
  Word pad_;
  Word root_;
  std::vector<Word> words_;
  std::map<std::string, WordId> d_;
  std::vector<Word> tags_;
  std::map<std::string, WordId> tag_d_;
  std::vector<Word> labels_;
  std::map<std::string, WordId> label_d_;
  std::set<WordId> punct_;
};

}  // namespace arcdp

#endif
