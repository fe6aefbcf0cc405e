#include "gtest/gtest.h"

#include <sstream>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include "corpus/dict.h"

namespace ar = boost::archive;

namespace arcdp {

TEST(DictTest, TestSpecialIds) {
  Dict dict;
  EXPECT_EQ(0, dict.pad());
  EXPECT_EQ(1, dict.unk());
  EXPECT_EQ(2, dict.root());
  EXPECT_EQ("<pad>", dict.lookup(dict.pad()));
  EXPECT_EQ("<root>", dict.lookup(dict.root()));
  EXPECT_EQ("<root>", dict.lookupTag(dict.root()));
  EXPECT_EQ(3, dict.size());
  EXPECT_EQ(0, dict.label_size());
}

TEST(DictTest, TestFrozenConversion) {
  Dict dict;
  WordId dog = dict.convert("dog", false);
  EXPECT_EQ(3, dog);
  EXPECT_EQ(dog, dict.convert("dog", true));
  EXPECT_EQ(dict.unk(), dict.convert("cat", true));
  EXPECT_EQ(4, dict.size());

  EXPECT_EQ(dict.unk(), dict.convertTag("_", false));
  WordId noun = dict.convertTag("NOUN", false);
  EXPECT_EQ(dict.unk(), dict.convertTag("VERB", true));
  EXPECT_EQ("NOUN", dict.lookupTag(noun));

  EXPECT_EQ(0, dict.convertLabel("nsubj", false));
  EXPECT_EQ(1, dict.convertLabel("root", false));
  EXPECT_EQ(-1, dict.convertLabel("obj", true));
  EXPECT_EQ("root", dict.lookupLabel(1));
  EXPECT_EQ(Strings({"nsubj", "root"}), dict.lookupLabels({0, 1}));
}

TEST(DictTest, TestReservedForms) {
  Dict dict;
  EXPECT_EQ(dict.unk(), dict.convert("<pad>", false));
  EXPECT_EQ(dict.unk(), dict.convert("<root>", false));
  EXPECT_EQ(dict.unk(), dict.convert("<unk>", false));
  EXPECT_EQ(dict.unk(), dict.convertTag("<pad>", false));
  EXPECT_EQ(3, dict.size());
  EXPECT_EQ(3, dict.tag_size());
}

TEST(DictTest, TestPunctuation) {
  EXPECT_TRUE(Dict::isPunct("."));
  EXPECT_TRUE(Dict::isPunct("--"));
  EXPECT_FALSE(Dict::isPunct("U.S."));
  EXPECT_FALSE(Dict::isPunct(""));

  Dict dict;
  WordId period = dict.convert(".", false);
  WordId word = dict.convert("ran", false);
  EXPECT_TRUE(dict.punctWord(period));
  EXPECT_FALSE(dict.punctWord(word));
  EXPECT_EQ(1, dict.punctIds().size());
}

TEST(DictTest, TestSerialization) {
  Dict dict;
  dict.convert("dog", false);
  dict.convert(",", false);
  dict.convertTag("NOUN", false);
  dict.convertLabel("nsubj", false);

  std::stringstream stream(std::ios_base::binary | std::ios_base::out |
                           std::ios_base::in);
  ar::binary_oarchive oar(stream, ar::no_header);
  oar << dict;

  Dict dict_copy;
  ar::binary_iarchive iar(stream, ar::no_header);
  iar >> dict_copy;

  EXPECT_EQ(dict, dict_copy);
  EXPECT_EQ(3, dict_copy.convert("dog", true));
  EXPECT_TRUE(dict_copy.punctWord(dict_copy.convert(",", true)));
}

}  // namespace arcdp
