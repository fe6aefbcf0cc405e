#include "gdp/biaffine_scorer.h"

#include <limits>
#include <random>

#include "corpus/errors.h"

namespace arcdp {

BiaffineScorer::BiaffineScorer()
    : size(0),
      word_embeddings(0, 0, 0), tag_embeddings(0, 0, 0),
      arc_dep(0, 0, 0), arc_head(0, 0, 0), arc_biaffine(0, 0, 0),
      arc_dep_bias(0, 0), arc_head_bias(0, 0), arc_head_prior(0, 0),
      rel_dep(0, 0, 0), rel_head(0, 0, 0), rel_biaffine(0, 0, 0),
      rel_dep_bias(0, 0), rel_head_bias(0, 0), rel_bias(0, 0) {}

BiaffineScorer::BiaffineScorer(
    const boost::shared_ptr<ModelConfig>& config, bool init)
    : config(config), size(0),
      word_embeddings(0, 0, 0), tag_embeddings(0, 0, 0),
      arc_dep(0, 0, 0), arc_head(0, 0, 0), arc_biaffine(0, 0, 0),
      arc_dep_bias(0, 0), arc_head_bias(0, 0), arc_head_prior(0, 0),
      rel_dep(0, 0, 0), rel_head(0, 0, 0), rel_biaffine(0, 0, 0),
      rel_dep_bias(0, 0), rel_head_bias(0, 0), rel_bias(0, 0) {
  allocate();

  if (init) {
    // Initialize model weights randomly.
    std::mt19937 gen(config->seed);
    std::normal_distribution<Real> gaussian(0, 0.1);
    for (size_t i = 0; i < size; ++i) {
      data[i] = gaussian(gen);
    }

    std::cerr << "===============================" << std::endl;
    std::cerr << " Scorer parameters: " << std::endl;
    std::cerr << "  Word vocab size = " << config->vocab_size << std::endl;
    std::cerr << "  Tag vocab size = " << config->num_tags << std::endl;
    std::cerr << "  Relations = " << config->num_labels << std::endl;
    std::cerr << "  Total parameters = " << numParameters() << std::endl;
    std::cerr << "===============================" << std::endl;
  }
}

BiaffineScorer::BiaffineScorer(const BiaffineScorer& other)
    : config(other.config), data(other.data), size(other.size),
      word_embeddings(0, 0, 0), tag_embeddings(0, 0, 0),
      arc_dep(0, 0, 0), arc_head(0, 0, 0), arc_biaffine(0, 0, 0),
      arc_dep_bias(0, 0), arc_head_bias(0, 0), arc_head_prior(0, 0),
      rel_dep(0, 0, 0), rel_head(0, 0, 0), rel_biaffine(0, 0, 0),
      rel_dep_bias(0, 0), rel_head_bias(0, 0), rel_bias(0, 0) {
  setModelParameters();
}

void BiaffineScorer::allocate() {
  int num_words = config->vocab_size;
  int num_tags = config->num_tags;
  int num_labels = config->num_labels;
  int word_width = config->word_representation_size;
  int tag_width = config->tag_representation_size;
  int arc_width = config->arc_representation_size;
  int rel_width = config->rel_representation_size;
  int input_width = word_width + tag_width;

  size = word_width * num_words + tag_width * num_tags
       + 2 * arc_width * input_width + arc_width * arc_width + 3 * arc_width
       + 2 * rel_width * input_width + rel_width * rel_width * num_labels
       + 2 * rel_width + num_labels;
  data.assign(size, 0);

  setModelParameters();
}

void BiaffineScorer::setModelParameters() {
  int num_words = config->vocab_size;
  int num_tags = config->num_tags;
  int num_labels = config->num_labels;
  int word_width = config->word_representation_size;
  int tag_width = config->tag_representation_size;
  int arc_width = config->arc_representation_size;
  int rel_width = config->rel_representation_size;
  int input_width = word_width + tag_width;

  Real* ptr = data.data();
  new (&word_embeddings) MatrixRealMap(ptr, word_width, num_words);
  ptr += word_width * num_words;
  new (&tag_embeddings) MatrixRealMap(ptr, tag_width, num_tags);
  ptr += tag_width * num_tags;

  new (&arc_dep) MatrixRealMap(ptr, arc_width, input_width);
  ptr += arc_width * input_width;
  new (&arc_head) MatrixRealMap(ptr, arc_width, input_width);
  ptr += arc_width * input_width;
  new (&arc_biaffine) MatrixRealMap(ptr, arc_width, arc_width);
  ptr += arc_width * arc_width;
  new (&arc_dep_bias) VectorRealMap(ptr, arc_width);
  ptr += arc_width;
  new (&arc_head_bias) VectorRealMap(ptr, arc_width);
  ptr += arc_width;
  new (&arc_head_prior) VectorRealMap(ptr, arc_width);
  ptr += arc_width;

  new (&rel_dep) MatrixRealMap(ptr, rel_width, input_width);
  ptr += rel_width * input_width;
  new (&rel_head) MatrixRealMap(ptr, rel_width, input_width);
  ptr += rel_width * input_width;
  new (&rel_biaffine) MatrixRealMap(ptr, rel_width, rel_width * num_labels);
  ptr += rel_width * rel_width * num_labels;
  new (&rel_dep_bias) VectorRealMap(ptr, rel_width);
  ptr += rel_width;
  new (&rel_head_bias) VectorRealMap(ptr, rel_width);
  ptr += rel_width;
  new (&rel_bias) VectorRealMap(ptr, num_labels);
}

MatrixReal BiaffineScorer::embed(const Batch& batch, int b) const {
  int word_width = config->word_representation_size;
  int tag_width = config->tag_representation_size;
  MatrixReal x(word_width + tag_width, batch.max_length());

  for (int i = 0; i < batch.max_length(); ++i) {
    // Ids outside the vocabulary the parameters were sized for read as <unk>.
    WordId w = batch.words(b, i);
    if (w < 0 || w >= config->vocab_size) w = 1;
    WordId t = batch.tags(b, i);
    if (t < 0 || t >= config->num_tags) t = 1;
    x.block(0, i, word_width, 1) = word_embeddings.col(w);
    x.block(word_width, i, tag_width, 1) = tag_embeddings.col(t);
  }

  return x;
}

BatchScores BiaffineScorer::score(const Batch& batch, const Mask& mask) const {
  BatchScores scores;
  int length = batch.max_length();
  int num_labels = config->num_labels;
  int rel_width = config->rel_representation_size;

  for (size_t b = 0; b < batch.size(); ++b) {
    MatrixReal x = embed(batch, b);

    MatrixReal h_dep = arc_dep * x;
    h_dep.colwise() += arc_dep_bias;
    h_dep = h_dep.cwiseMax(static_cast<Real>(0));
    MatrixReal h_head = arc_head * x;
    h_head.colwise() += arc_head_bias;
    h_head = h_head.cwiseMax(static_cast<Real>(0));

    MatrixReal arcs = h_dep.transpose() * arc_biaffine * h_head;
    Eigen::Matrix<Real, 1, Eigen::Dynamic> prior =
        arc_head_prior.transpose() * h_head;
    arcs.rowwise() += prior;
    // Padding is never a head.
    for (int h = batch.lens[b] + 1; h < length; ++h) {
      arcs.col(h).setConstant(-std::numeric_limits<Real>::infinity());
    }
    scores.arcs.push_back(arcs);

    MatrixReal r_dep = rel_dep * x;
    r_dep.colwise() += rel_dep_bias;
    r_dep = r_dep.cwiseMax(static_cast<Real>(0));
    MatrixReal r_head = rel_head * x;
    r_head.colwise() += rel_head_bias;
    r_head = r_head.cwiseMax(static_cast<Real>(0));

    std::vector<MatrixReal> rels(length, MatrixReal(length, num_labels));
    for (int r = 0; r < num_labels; ++r) {
      MatrixReal s = r_dep.transpose()
          * rel_biaffine.block(0, r * rel_width, rel_width, rel_width) * r_head;
      for (int d = 0; d < length; ++d) {
        rels[d].col(r) = s.row(d).transpose().array() + rel_bias(r);
      }
    }
    scores.rels.push_back(rels);
  }

  return scores;
}

Real BiaffineScorer::loss(const BatchScores& scores, const Batch& batch,
                          const Mask& mask) const {
  Real objective = 0;
  int count = 0;

  for (size_t b = 0; b < batch.size(); ++b) {
    int n = batch.lens[b];
    for (int d = 1; d <= n; ++d) {
      WordIndex gold_head = batch.arcs(b, d);
      if (!mask(b, d) || gold_head < 0 || gold_head > n) continue;

      VectorReal arc_row = scores.arcs[b].row(d).head(n + 1).transpose();
      objective -= logSoftMax(arc_row)(gold_head);

      WordId gold_rel = batch.rels(b, d);
      if (gold_rel >= 0 && gold_rel < num_labels()) {
        VectorReal rel_row = scores.rels[b][d].row(gold_head).transpose();
        objective -= logSoftMax(rel_row)(gold_rel);
      }
      ++count;
    }
  }

  if (count == 0) return 0;
  return objective / count;
}

bool BiaffineScorer::operator==(const BiaffineScorer& other) const {
  return (*config == *other.config && size == other.size && data == other.data);
}

}  // namespace arcdp
