#ifndef _CORPUS_UTILS_H_
#define _CORPUS_UTILS_H_

#include <string>
#include <vector>
#include <iostream>
#include <chrono>
#include <cmath>

#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>

#include <Eigen/Dense>

namespace arcdp {

typedef std::string Word;
typedef int WordId;
typedef int WordIndex;
typedef std::vector<Word> Strings;
typedef std::vector<WordId> Words;
typedef std::vector<WordIndex> Indices;
typedef std::vector<Words> WordsList;
typedef std::vector<Indices> IndicesList;
typedef std::vector<Strings> StringsList;

typedef double Real;
typedef std::vector<Real> Reals;

typedef Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic> MatrixReal;
typedef Eigen::Matrix<Real, Eigen::Dynamic, 1>              VectorReal;
typedef Eigen::Matrix<WordId, Eigen::Dynamic, Eigen::Dynamic,
                      Eigen::RowMajor>                      MatrixId;
typedef Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic,
                     Eigen::RowMajor>                       Mask;

typedef std::chrono::high_resolution_clock Clock;
typedef Clock::time_point Time;

inline Time get_time() {
  return Clock::now();
}

inline Real get_duration(const Time& start_time, const Time& stop_time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(stop_time - start_time).count() / 1000.0;
}

// Index of the first maximal coefficient of row i in columns [start, end).
inline WordIndex arg_max(const MatrixReal& m, WordIndex i, WordIndex start,
                         WordIndex end) {
  WordIndex max_j = start;
  Real max = m(i, start);
  for (WordIndex j = start + 1; j < end; ++j) {
    if (m(i, j) > max) {
      max_j = j;
      max = m(i, j);
    }
  }

  return max_j;
}

inline WordIndex arg_max(const MatrixReal& m, WordIndex i) {
  return arg_max(m, i, 0, static_cast<WordIndex>(m.cols()));
}

inline VectorReal softMax(const VectorReal& v) {
  Real max = v.maxCoeff();
  return (v.array() - (std::log((v.array() - max).exp().sum()) + max)).exp();
}

inline VectorReal logSoftMax(const VectorReal& v) {
  Real max = v.maxCoeff();
  Real log_z = std::log((v.array() - max).exp().sum()) + max;
  return v.array() - log_z;
}

}  // namespace arcdp

#endif
