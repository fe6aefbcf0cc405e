#ifndef _CORPUS_MODEL_CONFIG_H_
#define _CORPUS_MODEL_CONFIG_H_

#include <string>
#include <vector>
#include <iostream>

#include <boost/shared_ptr.hpp>
#include <boost/serialization/serialization.hpp>
#include <boost/serialization/string.hpp>

namespace arcdp {

struct ModelConfig {
  ModelConfig();

  std::string training_file;
  std::string test_file;
  std::string test_output_file;
  std::string model_input_file;
  std::string model_output_file;
  int         buckets;
  int         batch_size;
  bool        tree;
  bool        proj;
  bool        punct;
  bool        prob;
  bool        verbose;
  int         threads;
  int         seed;
  int         word_representation_size;
  int         tag_representation_size;
  int         arc_representation_size;
  int         rel_representation_size;
  int         vocab_size;
  int         num_tags;
  int         num_labels;

  bool operator==(const ModelConfig& other) const;

  // Rejects flag combinations that cannot be decoded, e.g. projective
  // decoding without tree decoding.
  void validate() const;

  friend class boost::serialization::access;
  template<class Archive>
  void serialize(Archive & ar, const unsigned int version) {
    ar & training_file;
    ar & test_file;
    ar & test_output_file;
    ar & model_input_file;
    ar & model_output_file;
    ar & buckets;
    ar & batch_size;
    ar & tree;
    ar & proj;
    ar & punct;
    ar & prob;
    ar & threads;
    ar & seed;
    ar & word_representation_size;
    ar & tag_representation_size;
    ar & arc_representation_size;
    ar & rel_representation_size;
    ar & vocab_size;
    ar & num_tags;
    ar & num_labels;
  }
};

}  // namespace arcdp

#endif
