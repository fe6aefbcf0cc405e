#ifndef _CORPUS_PARSED_CORPUS_H_
#define _CORPUS_PARSED_CORPUS_H_

#include <string>
#include <iostream>
#include <fstream>

#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>

#include "corpus/dict.h"
#include "corpus/model_config.h"
#include "corpus/parsed_sentence.h"

namespace arcdp {

// A list of (possibly gold-annotated) sentences read from CoNLL files,
// whitespace tokenized text or in-memory token lists.
class ParsedCorpus {
 public:
  ParsedCorpus(const boost::shared_ptr<ModelConfig>& config);

  void convertWhitespaceDelimitedConllLine(const std::string& line,
      const boost::shared_ptr<Dict>& dict, Strings* forms_out, Words* sent_out,
      Words* tags_out, Indices* arcs_out, Words* labels_out, bool frozen);

  void readFile(const std::string& filename, const boost::shared_ptr<Dict>& dict, bool frozen);

  void readTxtFile(const std::string& filename, const boost::shared_ptr<Dict>& dict, bool frozen);

  // Adds an unannotated sentence. tags may be empty.
  void addTokens(const Strings& tokens, const Strings& tags,
                 const boost::shared_ptr<Dict>& dict, bool frozen);

  // Writes the corpus in 10-column CoNLL format.
  void writeFile(const std::string& filename, const boost::shared_ptr<Dict>& dict) const;

  void write(std::ostream& out, const boost::shared_ptr<Dict>& dict) const;

  const ParsedSentence& sentence_at(unsigned i) const {
    return sentences_.at(i);
  }

  ParsedSentence& mutable_sentence_at(unsigned i) {
    return sentences_.at(i);
  }

  size_t size() const;

  size_t numTokens() const;

  // Sentence lengths with the root placeholder included.
  std::vector<int> lengths() const;

 private:
  void addSentence(Strings* forms, Words* sent, Words* tags, Indices* arcs,
                   Words* labels, const boost::shared_ptr<Dict>& dict);

  std::vector<ParsedSentence> sentences_;
  boost::shared_ptr<ModelConfig> config_;
};

}  // namespace arcdp

#endif
