#include "gdp/tree_decoder.h"

#include <sstream>

#include "gdp/arc_list.h"
#include "gdp/eisner_parser.h"
#include "gdp/mst_parser.h"

namespace arcdp {

void DecodedBatch::split(const Mask& mask, IndicesList* sent_heads,
                         WordsList* sent_rels) const {
  sent_heads->clear();
  sent_rels->clear();
  for (int b = 0; b < mask.rows(); ++b) {
    Indices row_heads;
    Words row_rels;
    for (int i = 0; i < mask.cols(); ++i) {
      if (mask(b, i)) {
        row_heads.push_back(heads(b, i));
        row_rels.push_back(rels(b, i));
      }
    }
    sent_heads->push_back(row_heads);
    sent_rels->push_back(row_rels);
  }
}

void TreeDecoder::checkShape(const BatchScores& scores, const Mask& mask) {
  int rows = mask.rows();
  int cols = mask.cols();
  if (static_cast<int>(scores.arcs.size()) != rows ||
      static_cast<int>(scores.rels.size()) != rows) {
    std::ostringstream err;
    err << "scores cover " << scores.arcs.size() << " sentences, mask has "
        << rows;
    throw ShapeMismatchError(err.str());
  }

  for (int b = 0; b < rows; ++b) {
    const MatrixReal& arcs = scores.arcs[b];
    if (arcs.rows() != cols || arcs.cols() != cols ||
        static_cast<int>(scores.rels[b].size()) != cols) {
      std::ostringstream err;
      err << "scores of sentence " << b << " are " << arcs.rows() << "x"
          << arcs.cols() << ", mask width is " << cols;
      throw ShapeMismatchError(err.str());
    }
    // Real tokens occupy positions 1..n of the row with no gaps.
    int n = mask.row(b).count();
    if ((cols > 0 && mask(b, 0)) ||
        (n > 0 && !mask.row(b).segment(1, n).all())) {
      std::ostringstream err;
      err << "mask of sentence " << b
          << " does not cover a contiguous run of tokens after the root";
      throw ShapeMismatchError(err.str());
    }
    for (int d = 0; d < cols; ++d) {
      if (!mask(b, d))
        continue;
      const MatrixReal& rels = scores.rels[b][d];
      if (rels.rows() != cols || rels.cols() < 1) {
        std::ostringstream err;
        err << "relation scores of token " << d << " in sentence " << b
            << " are " << rels.rows() << "x" << rels.cols();
        throw ShapeMismatchError(err.str());
      }
    }
  }
}

Indices TreeDecoder::greedyHeads(const MatrixReal& arcs, int n) {
  Indices heads;
  for (WordIndex d = 1; d <= n; ++d)
    heads.push_back(arg_max(arcs, d, 0, n + 1));
  return heads;
}

Indices TreeDecoder::decodeHeads(const MatrixReal& arcs, int n, bool tree,
                                 bool proj) {
  if (proj && !tree)
    throw ConfigConflictError("projective decoding requires tree decoding");

  Indices heads = greedyHeads(arcs, n);
  if (!tree || ArcList(heads).is_tree(proj))
    return heads;

  if (proj) {
    EisnerParser parser(arcs, n);
    return parser.parse();
  }
  MstParser parser(arcs, n);
  return parser.parse();
}

DecodedBatch TreeDecoder::decode(const BatchScores& scores, const Mask& mask,
                                 bool tree, bool proj) {
  if (proj && !tree)
    throw ConfigConflictError("projective decoding requires tree decoding");
  checkShape(scores, mask);

  int rows = mask.rows();
  std::vector<int> lens(rows, 0);
  for (int b = 0; b < rows; ++b)
    lens[b] = mask.row(b).count();

  IndicesList heads(rows);
  for (int b = 0; b < rows; ++b)
    heads[b] = greedyHeads(scores.arcs[b], lens[b]);

  if (tree) {
    // Only sentences whose greedy heads are not already a valid tree.
    std::vector<int> pending;
    for (int b = 0; b < rows; ++b)
      if (!ArcList(heads[b]).is_tree(proj))
        pending.push_back(b);

    #pragma omp parallel for schedule(dynamic)
    for (int k = 0; k < static_cast<int>(pending.size()); ++k) {
      int b = pending[k];
      if (proj) {
        EisnerParser parser(scores.arcs[b], lens[b]);
        heads[b] = parser.parse();
      } else {
        MstParser parser(scores.arcs[b], lens[b]);
        heads[b] = parser.parse();
      }
    }

    for (auto b : pending) {
      if (!ArcList(heads[b]).is_tree(proj)) {
        std::ostringstream err;
        err << "decoded sentence " << b << " is not a "
            << (proj ? "projective " : "") << "tree";
        throw CycleDetectionError(err.str());
      }
    }
  }

  DecodedBatch decoded;
  decoded.heads = MatrixId::Zero(rows, mask.cols());
  decoded.rels = MatrixId::Zero(rows, mask.cols());
  for (int b = 0; b < rows; ++b) {
    // Same walk as split(), so the k-th masked position gets the k-th head.
    size_t k = 0;
    for (int d = 0; d < mask.cols(); ++d) {
      if (!mask(b, d))
        continue;
      WordIndex h = heads[b].at(k++);
      decoded.heads(b, d) = h;
      decoded.rels(b, d) = arg_max(scores.rels[b][d], h);
    }
  }

  return decoded;
}

}  // namespace arcdp
