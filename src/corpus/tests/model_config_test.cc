#include "gtest/gtest.h"

#include <sstream>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include "corpus/errors.h"
#include "corpus/model_config.h"

namespace ar = boost::archive;

namespace arcdp {

TEST(ModelConfigTest, TestValidate) {
  ModelConfig config;
  EXPECT_NO_THROW(config.validate());

  config.proj = true;
  EXPECT_THROW(config.validate(), ConfigConflictError);
  config.tree = true;
  EXPECT_NO_THROW(config.validate());

  config.buckets = 0;
  EXPECT_THROW(config.validate(), ConfigConflictError);
  config.buckets = 2;
  config.batch_size = -1;
  EXPECT_THROW(config.validate(), ConfigConflictError);
}

TEST(ModelConfigTest, TestSerialization) {
  ModelConfig config;
  config.training_file = "train.conll";
  config.tree = true;
  config.proj = true;
  config.punct = true;
  config.buckets = 8;
  config.vocab_size = 120;
  config.num_labels = 37;

  std::stringstream stream(std::ios_base::binary | std::ios_base::out |
                           std::ios_base::in);
  ar::binary_oarchive oar(stream, ar::no_header);
  oar << config;

  ModelConfig config_copy;
  ar::binary_iarchive iar(stream, ar::no_header);
  iar >> config_copy;

  EXPECT_EQ(config, config_copy);
  EXPECT_TRUE(config_copy.tree);
  EXPECT_TRUE(config_copy.proj);
  EXPECT_TRUE(config_copy.punct);
  EXPECT_EQ(8, config_copy.buckets);
}

}  // namespace arcdp
