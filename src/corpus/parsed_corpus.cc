#include <sstream>

#include <boost/lexical_cast.hpp>

#include "corpus/errors.h"
#include "corpus/parsed_corpus.h"

namespace arcdp {

ParsedCorpus::ParsedCorpus(const boost::shared_ptr<ModelConfig>& config):
  sentences_(),
  config_(config)
{
}

void ParsedCorpus::convertWhitespaceDelimitedConllLine(const std::string& line,
      const boost::shared_ptr<Dict>& dict, Strings* forms_out, Words* sent_out,
      Words* tags_out, Indices* arcs_out, Words* labels_out, bool frozen) {
  Strings columns;
  size_t cur = 0;
  size_t last = 0;
  int state = 0;

  while (cur < line.size()) {
    if (Dict::is_ws(line[cur++])) {
      if (state == 0)
        continue;
      columns.push_back(line.substr(last, cur - last - 1));
      state = 0;
    } else {
      if (state == 1)
        continue;
      last = cur - 1;
      state = 1;
    }
  }
  if (state == 1)
    columns.push_back(line.substr(last, cur - last));

  if (columns.size() < 2)
    throw CorpusFormatError("malformed CoNLL line: '" + line + "'");

  // Multiword token ranges (1-2) and empty nodes (1.1) are not syntactic words.
  if (columns[0].find_first_of("-.") != std::string::npos)
    return;

  //1 - word form
  forms_out->push_back(columns[1]);
  sent_out->push_back(dict->convert(columns[1], frozen));

  //3 - coarse postag
  if (columns.size() > 3)
    tags_out->push_back(dict->convertTag(columns[3], frozen));
  else
    tags_out->push_back(dict->unk());

  //6 - arc head index
  WordIndex head = -1;
  if (columns.size() > 6 && columns[6] != "_") {
    try {
      head = boost::lexical_cast<WordIndex>(columns[6]);
    } catch (const boost::bad_lexical_cast&) {
      throw CorpusFormatError("bad head index in CoNLL line: '" + line + "'");
    }
  }
  arcs_out->push_back(head);

  //7 - label
  if (columns.size() > 7 && columns[7] != "_")
    labels_out->push_back(dict->convertLabel(columns[7], frozen));
  else
    labels_out->push_back(-1);
}

void ParsedCorpus::addSentence(Strings* forms, Words* sent, Words* tags,
                               Indices* arcs, Words* labels,
                               const boost::shared_ptr<Dict>& dict) {
  forms->insert(forms->begin(), "<root>");
  sent->insert(sent->begin(), dict->root());
  tags->insert(tags->begin(), dict->root());
  arcs->insert(arcs->begin(), -1);
  labels->insert(labels->begin(), -1);

  int index = sentences_.size();
  sentences_.push_back(ParsedSentence(*forms, *sent, *tags, *arcs, *labels, index));

  forms->clear();
  sent->clear();
  tags->clear();
  arcs->clear();
  labels->clear();
}

void ParsedCorpus::readFile(const std::string& filename, const boost::shared_ptr<Dict>& dict,
                                bool frozen) {
  Strings forms;
  Words sent;
  Words tags;
  Indices arcs;
  Words labels;

  std::cerr << "Reading from " << filename << std::endl;
  std::ifstream in(filename);
  if (!in)
    throw CorpusFormatError("cannot open " + filename);
  std::string line;

  while (getline(in, line)) {
    if (!line.empty() && line[line.size() - 1] == '\r')
      line.erase(line.size() - 1);

    if (line.find_first_not_of(" \t") == std::string::npos) {
      //end of sentence
      if (!sent.empty())
        addSentence(&forms, &sent, &tags, &arcs, &labels, dict);
    } else if (line[0] == '#') {
      continue;
    } else {
      convertWhitespaceDelimitedConllLine(line, dict, &forms, &sent, &tags, &arcs, &labels, frozen);
    }
  }
  if (!sent.empty())
    addSentence(&forms, &sent, &tags, &arcs, &labels, dict);

  //update vocab sizes
  if (!frozen) {
    config_->vocab_size = dict->size();
    config_->num_tags = dict->tag_size();
    config_->num_labels = dict->label_size();
  }
}

void ParsedCorpus::readTxtFile(const std::string& filename, const boost::shared_ptr<Dict>& dict, bool frozen) {
  std::cerr << "Reading from " << filename << std::endl;
  std::ifstream in(filename);
  if (!in)
    throw CorpusFormatError("cannot open " + filename);
  std::string line;

  while (getline(in, line)) {
    std::stringstream tokens_stream(line);
    Strings tokens;
    std::string token;
    while (tokens_stream >> token)
      tokens.push_back(token);
    if (!tokens.empty())
      addTokens(tokens, Strings(), dict, frozen);
  }

  if (!frozen)
    config_->vocab_size = dict->size();
}

void ParsedCorpus::addTokens(const Strings& tokens, const Strings& tags,
                             const boost::shared_ptr<Dict>& dict, bool frozen) {
  Strings forms;
  Words sent;
  Words tag_ids;
  Indices arcs;
  Words labels;

  for (unsigned i = 0; i < tokens.size(); ++i) {
    forms.push_back(tokens[i]);
    sent.push_back(dict->convert(tokens[i], frozen));
    if (i < tags.size())
      tag_ids.push_back(dict->convertTag(tags[i], frozen));
    else
      tag_ids.push_back(dict->unk());
    arcs.push_back(-1);
    labels.push_back(-1);
  }

  addSentence(&forms, &sent, &tag_ids, &arcs, &labels, dict);
}

void ParsedCorpus::write(std::ostream& out, const boost::shared_ptr<Dict>& dict) const {
  for (const auto& parse : sentences_) {
    for (WordIndex i = 1; i < static_cast<WordIndex>(parse.size()); ++i) {
      out << i << "\t" << parse.form_at(i) << "\t_\t"
          << dict->lookupTag(parse.tag_at(i)) << "\t_\t_\t";
      if (parse.has_parent_at(i))
        out << parse.arc_at(i);
      else
        out << "_";
      out << "\t";
      if (parse.label_at(i) >= 0)
        out << dict->lookupLabel(parse.label_at(i));
      else
        out << "_";
      out << "\t_\t_\n";
    }
    out << "\n";
  }
}

void ParsedCorpus::writeFile(const std::string& filename, const boost::shared_ptr<Dict>& dict) const {
  std::ofstream outs(filename);
  if (!outs)
    throw CorpusFormatError("cannot write " + filename);
  write(outs, dict);
}

size_t ParsedCorpus::size() const {
  return sentences_.size();
}

size_t ParsedCorpus::numTokens() const {
  size_t total = 0;
  for (const auto& sent: sentences_)
    total += sent.num_tokens();

  return total;
}

std::vector<int> ParsedCorpus::lengths() const {
  std::vector<int> lens;
  for (const auto& sent: sentences_)
    lens.push_back(static_cast<int>(sent.size()));

  return lens;
}

}  // namespace arcdp
