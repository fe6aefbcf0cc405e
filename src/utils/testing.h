#ifndef _UTILS_TESTING_H_
#define _UTILS_TESTING_H_

#include "gtest/gtest.h"

#include "corpus/utils.h"

namespace arcdp {

static const Real EPS = 1e-6;

#define EXPECT_MATRIX_NEAR(m1, m2, abs_error) \
  do { \
    ASSERT_EQ((m1).rows(), (m2).rows()); \
    ASSERT_EQ((m1).cols(), (m2).cols()); \
    for (int i = 0; i < (m1).rows(); ++i) { \
      for (int j = 0; j < (m1).cols(); ++j) { \
        EXPECT_NEAR((m1)(i, j), (m2)(i, j), abs_error) << "at (" << i << ", " << j << ")"; \
      } \
    } \
  } while (0)

}  // namespace arcdp

#endif
