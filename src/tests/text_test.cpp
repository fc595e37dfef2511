#include <gtest/gtest.h>
#include "utils/text.hpp"

using vault::utils::sanitize_utf8;

namespace {
const std::string REPLACEMENT = "\xEF\xBF\xBD";
}

TEST(TextTest, ValidUtf8IsUnchanged) {
  const std::string text = "hello w\xC3\xB6rld \xE2\x82\xAC \xF0\x9F\x98\x80";
  EXPECT_EQ(sanitize_utf8(text), text);
  EXPECT_EQ(sanitize_utf8(""), "");
}

TEST(TextTest, InvalidByteIsReplaced) {
  EXPECT_EQ(sanitize_utf8(std::string("a\xFF" "b")), "a" + REPLACEMENT + "b");
}

TEST(TextTest, OverlongAndSurrogateFormsAreReplaced) {
  // Overlong encoding of '/'
  EXPECT_EQ(sanitize_utf8("\xC0\xAF").find('/'), std::string::npos);
  // Encoded UTF-16 surrogate
  EXPECT_NE(sanitize_utf8("\xED\xA0\x80").find(REPLACEMENT), std::string::npos);
}

TEST(TextTest, SequenceCutAtEndIsReplaced) {
  // A preview cut in the middle of a multi-byte character
  std::string text = "price: \xE2\x82";
  std::string cleaned = sanitize_utf8(text);

  EXPECT_EQ(cleaned.substr(0, 7), "price: ");
  EXPECT_NE(cleaned.find(REPLACEMENT), std::string::npos);
  EXPECT_EQ(sanitize_utf8(cleaned), cleaned);
}
