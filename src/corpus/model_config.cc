#include "corpus/model_config.h"

#include "corpus/errors.h"

namespace arcdp {

ModelConfig::ModelConfig()
    : buckets(32), batch_size(5000), tree(false), proj(false), punct(false),
      prob(false), verbose(true), threads(1), seed(1),
      word_representation_size(100), tag_representation_size(100),
      arc_representation_size(500), rel_representation_size(100),
      vocab_size(0), num_tags(0), num_labels(0) {}

void ModelConfig::validate() const {
  if (proj && !tree) {
    throw ConfigConflictError(
        "projective decoding requires tree decoding (set tree as well)");
  }
  if (buckets < 1) {
    throw ConfigConflictError("number of buckets must be positive");
  }
  if (batch_size < 1) {
    throw ConfigConflictError("batch size must be positive");
  }
}

bool ModelConfig::operator==(const ModelConfig& other) const {
  if (batch_size != other.batch_size || buckets != other.buckets) {
    std::cerr << "Warning: Using different batching settings!" << std::endl;
  }

  return (training_file == other.training_file
      && tree == other.tree
      && proj == other.proj
      && punct == other.punct
      && prob == other.prob
      && seed == other.seed
      && word_representation_size == other.word_representation_size
      && tag_representation_size == other.tag_representation_size
      && arc_representation_size == other.arc_representation_size
      && rel_representation_size == other.rel_representation_size
      && vocab_size == other.vocab_size
      && num_tags == other.num_tags
      && num_labels == other.num_labels);
}

}  // namespace arcdp
