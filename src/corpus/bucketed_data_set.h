#ifndef _CORPUS_BUCKETED_DATA_SET_H_
#define _CORPUS_BUCKETED_DATA_SET_H_

#include <iostream>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "corpus/batch.h"
#include "corpus/parsed_corpus.h"

namespace arcdp {

// Groups the sentences of a corpus into buckets of similar length and cuts
// each bucket into batches whose padded size (longest sentence times number
// of sentences) stays within a token budget. Batches remember the corpus
// positions of their sentences.
class BucketedDataSet {
 public:
  BucketedDataSet(const boost::shared_ptr<ParsedCorpus>& corpus, WordId pad);

  // Throws EmptyInputError on an empty corpus.
  void build(int batch_size, int n_buckets, bool shuffle = false, int seed = 1);

  // Clusters lengths into at most k groups with 1-D k-means. Returns the
  // cluster of each length; centroids are returned in ascending order and
  // cluster ids refer to them.
  static std::vector<int> kmeans(const std::vector<int>& lengths, int k,
                                 std::vector<Real>* centroids);

  Batch batch_at(unsigned i) const {
    return makeBatch(*corpus_, batches_.at(i), pad_);
  }

  const std::vector<unsigned>& batch_indices_at(unsigned i) const {
    return batches_.at(i);
  }

  size_t num_batches() const {
    return batches_.size();
  }

  size_t num_buckets() const {
    return centroids_.size();
  }

  const std::vector<Real>& centroids() const {
    return centroids_;
  }

  size_t size() const {
    return corpus_->size();
  }

  boost::shared_ptr<ParsedCorpus> corpus() const {
    return corpus_;
  }

  friend std::ostream& operator<<(std::ostream& out, const BucketedDataSet& data) {
    out << "n_sentences: " << data.size() << ", n_batches: "
        << data.num_batches() << ", n_buckets: " << data.num_buckets();
    return out;
  }

 private:
  boost::shared_ptr<ParsedCorpus> corpus_;
  WordId pad_;
  std::vector<Real> centroids_;
  std::vector<std::vector<unsigned>> batches_;
};

}  // namespace arcdp

#endif
