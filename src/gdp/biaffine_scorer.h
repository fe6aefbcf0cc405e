#ifndef _GDP_BIAFFINE_SCORER_H_
#define _GDP_BIAFFINE_SCORER_H_

#include <vector>

#include <boost/serialization/serialization.hpp>
#include <boost/serialization/shared_ptr.hpp>
#include <boost/serialization/split_member.hpp>
#include <boost/serialization/array.hpp>

#include "corpus/errors.h"
#include "corpus/model_config.h"
#include "gdp/scorer_interface.h"

namespace arcdp {

typedef Eigen::Map<MatrixReal> MatrixRealMap;
typedef Eigen::Map<VectorReal> VectorRealMap;

// Biaffine arc and relation scorer over concatenated word and tag
// embeddings. All parameters live in one contiguous buffer; the named
// matrices are views into it.
class BiaffineScorer : public ScorerInterface {
 public:
  BiaffineScorer();

  BiaffineScorer(const boost::shared_ptr<ModelConfig>& config, bool init);

  BiaffineScorer(const BiaffineScorer& other);

  BatchScores score(const Batch& batch, const Mask& mask) const override;

  Real loss(const BatchScores& scores, const Batch& batch,
            const Mask& mask) const override;

  int num_labels() const override {
    return config->num_labels;
  }

  size_t numParameters() const {
    return size;
  }

  bool operator==(const BiaffineScorer& other) const;

 private:
  void allocate();

  void setModelParameters();

  // Input representations of row b, one column per position.
  MatrixReal embed(const Batch& batch, int b) const;

  friend class boost::serialization::access;

  template<class Archive>
  void save(Archive& ar, const unsigned int version) const {
    ar << config;
    ar << size;
    ar << boost::serialization::make_array(data.data(), size);
  }

  template<class Archive>
  void load(Archive& ar, const unsigned int version) {
    ar >> config;
    allocate();
    size_t stored_size;
    ar >> stored_size;
    if (stored_size != size)
      throw ParseError("stored scorer parameters do not match its configuration");
    ar >> boost::serialization::make_array(data.data(), size);
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER();

  boost::shared_ptr<ModelConfig> config;

  std::vector<Real> data;
  size_t size;

  MatrixRealMap word_embeddings;
  MatrixRealMap tag_embeddings;
  MatrixRealMap arc_dep;
  MatrixRealMap arc_head;
  MatrixRealMap arc_biaffine;
  VectorRealMap arc_dep_bias;
  VectorRealMap arc_head_bias;
  VectorRealMap arc_head_prior;
  MatrixRealMap rel_dep;
  MatrixRealMap rel_head;
  // num_labels blocks of rel_representation_size columns.
  MatrixRealMap rel_biaffine;
  VectorRealMap rel_dep_bias;
  VectorRealMap rel_head_bias;
  VectorRealMap rel_bias;
};

}  // namespace arcdp

#endif
