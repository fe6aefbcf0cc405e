#include <algorithm>
#include <cmath>
#include <random>

#include "corpus/bucketed_data_set.h"
#include "corpus/errors.h"

namespace arcdp {

BucketedDataSet::BucketedDataSet(const boost::shared_ptr<ParsedCorpus>& corpus,
                                 WordId pad)
    : corpus_(corpus), pad_(pad), centroids_(), batches_() {}

std::vector<int> BucketedDataSet::kmeans(const std::vector<int>& lengths, int k,
                                         std::vector<Real>* centroids) {
  std::vector<int> distinct(lengths);
  std::sort(distinct.begin(), distinct.end());
  distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());

  // Initial centroids are spread evenly over the distinct lengths.
  int n_clusters = std::min(k, static_cast<int>(distinct.size()));
  std::vector<Real> c(n_clusters);
  if (n_clusters == 1) {
    c[0] = distinct[distinct.size() / 2];
  } else {
    for (int m = 0; m < n_clusters; ++m) {
      c[m] = distinct[(m * (distinct.size() - 1)) / (n_clusters - 1)];
    }
  }

  std::vector<int> assignment(lengths.size(), -1);
  for (int iter = 0; iter < 100; ++iter) {
    bool changed = false;
    for (size_t j = 0; j < lengths.size(); ++j) {
      int nearest = 0;
      for (size_t m = 1; m < c.size(); ++m) {
        if (std::abs(lengths[j] - c[m]) < std::abs(lengths[j] - c[nearest]))
          nearest = m;
      }
      if (nearest != assignment[j]) {
        assignment[j] = nearest;
        changed = true;
      }
    }

    std::vector<Real> sums(c.size(), 0);
    std::vector<int> counts(c.size(), 0);
    for (size_t j = 0; j < lengths.size(); ++j) {
      sums[assignment[j]] += lengths[j];
      ++counts[assignment[j]];
    }

    // Empty clusters are dropped.
    std::vector<Real> next;
    std::vector<int> remap(c.size(), -1);
    for (size_t m = 0; m < c.size(); ++m) {
      if (counts[m] > 0) {
        remap[m] = next.size();
        next.push_back(sums[m] / counts[m]);
      }
    }
    for (size_t j = 0; j < lengths.size(); ++j) {
      assignment[j] = remap[assignment[j]];
    }
    if (next.size() != c.size())
      changed = true;
    c = next;

    if (!changed)
      break;
  }

  *centroids = c;
  return assignment;
}

void BucketedDataSet::build(int batch_size, int n_buckets, bool shuffle, int seed) {
  if (corpus_->size() == 0)
    throw EmptyInputError("no sentences to batch");
  if (n_buckets < 1 || batch_size < 1)
    throw ConfigConflictError("buckets and batch size must be positive");

  std::vector<int> lengths = corpus_->lengths();
  std::vector<int> clusters = kmeans(lengths, n_buckets, &centroids_);

  std::vector<std::vector<unsigned>> buckets(centroids_.size());
  for (unsigned j = 0; j < lengths.size(); ++j) {
    buckets[clusters[j]].push_back(j);
  }

  batches_.clear();
  for (auto& bucket : buckets) {
    std::stable_sort(bucket.begin(), bucket.end(),
        [&lengths](unsigned a, unsigned b) { return lengths[a] < lengths[b]; });

    std::vector<unsigned> batch;
    int max_length = 0;
    for (auto j : bucket) {
      int length = std::max(max_length, lengths[j]);
      if (!batch.empty() &&
          length * static_cast<int>(batch.size() + 1) > batch_size) {
        batches_.push_back(batch);
        batch.clear();
        length = lengths[j];
      }
      if (batch.empty() && lengths[j] > batch_size) {
        std::cerr << "Warning: sentence " << j << " of length " << lengths[j]
                  << " exceeds the batch size " << batch_size << std::endl;
      }
      batch.push_back(j);
      max_length = length;
    }
    if (!batch.empty())
      batches_.push_back(batch);
  }

  if (shuffle) {
    std::mt19937 eng(seed);
    std::shuffle(batches_.begin(), batches_.end(), eng);
  }
}

}  // namespace arcdp
