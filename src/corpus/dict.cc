#include <cctype>
#include <initializer_list>

#include "corpus/dict.h"

namespace arcdp {

Dict::Dict()
    : unk_("<unk>"),
      pad_("<pad>"),
      root_("<root>") {
  words_.reserve(1000);
  for (const Word& special : {pad_, unk_, root_}) {
    d_[special] = words_.size();
    words_.push_back(special);
    tag_d_[special] = tags_.size();
    tags_.push_back(special);
  }
}

bool Dict::reserved(const Word& word) const {
  return (word == pad_ || word == root_);
}

WordId Dict::convert(const Word& word, bool frozen) {
  // A token spelled like padding or the root placeholder is an ordinary,
  // unknown token; it must never take their ids.
  if (word == "" || reserved(word)) return unk();

  // Words unseen in a frozen vocabulary map to <unk>.
  auto i = d_.find(word);
  if (i == d_.end()) {
    if (frozen) return unk();
    words_.push_back(word);
    WordId id = words_.size() - 1;
    d_[word] = id;
    if (isPunct(word)) punct_.insert(id);
    return id;
  } else {
    return i->second;
  }
}

WordId Dict::convertTag(const Word& tag, bool frozen) {
  if (tag == "" || tag == "_" || reserved(tag)) return unk();

  auto i = tag_d_.find(tag);
  if (i == tag_d_.end()) {
    if (frozen) return unk();
    tags_.push_back(tag);
    tag_d_[tag] = tags_.size() - 1;
    return tags_.size() - 1;
  } else {
    return i->second;
  }
}

WordId Dict::convertLabel(const Word& label, bool frozen) {
  auto i = label_d_.find(label);
  if (i == label_d_.end()) {
    // An unseen gold label can never be predicted.
    if (frozen) return -1;
    labels_.push_back(label);
    label_d_[label] = labels_.size() - 1;
    return labels_.size() - 1;
  } else {
    return i->second;
  }
}

bool Dict::isPunct(const Word& word) {
  if (word.empty()) return false;
  for (char c : word) {
    if (!std::ispunct(static_cast<unsigned char>(c))) return false;
  }

  return true;
}

Word Dict::lookup(WordId id) const {
  if (valid(id) && id < static_cast<WordId>(words_.size())) {
    return words_[id];
  } else {
    return unk_;
  }
}

Word Dict::lookupTag(WordId id) const {
  if (valid(id) && id < static_cast<WordId>(tags_.size())) {
    return tags_[id];
  } else {
    return unk_;
  }
}

Word Dict::lookupLabel(WordId id) const {
  if (valid(id) && id < static_cast<WordId>(labels_.size())) {
    return labels_[id];
  } else {
    return unk_;
  }
}

Strings Dict::lookupLabels(const Words& ids) const {
  Strings labels;
  for (auto id : ids) {
    labels.push_back(lookupLabel(id));
  }

  return labels;
}

}  // namespace arcdp
