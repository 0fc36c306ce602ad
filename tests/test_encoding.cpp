#include <gtest/gtest.h>

#include "utils/common.hpp"
#include "utils/encoding.hpp"

namespace anabox::utils {
namespace {

TEST(EncodingTest, Base64Standard) {
    EXPECT_EQ(Base64Encode("hello"), "aGVsbG8=");
    EXPECT_EQ(Base64Encode(""), "");
    EXPECT_EQ(Base64Decode("aGVs bG8=\n").value_or("?"), "hello");
    EXPECT_EQ(Base64Decode("aGk=").value_or("?"), "hi");
}

TEST(EncodingTest, Base64RejectsInvalidInput) {
    EXPECT_FALSE(Base64Decode("abc").has_value());
    EXPECT_FALSE(Base64Decode("a=bc").has_value());
    EXPECT_FALSE(Base64Decode("ab$c").has_value());
    EXPECT_FALSE(Base64Decode("").has_value());
}

TEST(EncodingTest, Sha256Hex) {
    EXPECT_EQ(Sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(EncodingTest, EscapeHtml) {
    EXPECT_EQ(EscapeHtml("<a href='x'>&\"</a>"), "&lt;a href=&#39;x&#39;&gt;&amp;&quot;&lt;/a&gt;");
}

TEST(CommonTest, TruncateKeepsTheRequestedEnd) {
    EXPECT_EQ(Truncate("abcdef", 3), "abc\n...(truncated)...");
    EXPECT_EQ(TruncateTail("abcdef", 3), "...(truncated)...\ndef");
    EXPECT_EQ(TruncateTail("ab", 3), "ab");
}

TEST(CommonTest, TruncateStopsAtCharacterBoundaries) {
    const std::string e_acute = "\xC3\xA9";
    EXPECT_EQ(Truncate("a" + e_acute + "b", 2), "a\n...(truncated)...");
    EXPECT_EQ(Truncate(e_acute + e_acute, 3), e_acute + "\n...(truncated)...");
    EXPECT_EQ(TruncateTail("a" + e_acute + "b", 2), "...(truncated)...\nb");
    EXPECT_EQ(TruncateTail("a" + e_acute + "b", 3), "...(truncated)...\n" + e_acute + "b");
}

TEST(CommonTest, Utf8BoundaryHelpers) {
    const std::string euro = "\xE2\x82\xAC";
    EXPECT_EQ(Utf8PrefixLength("x" + euro, 1), 1u);
    EXPECT_EQ(Utf8PrefixLength("x" + euro, 3), 1u);
    EXPECT_EQ(Utf8PrefixLength("x" + euro, 4), 4u);
    EXPECT_EQ(Utf8PrefixLength("abc", 10), 3u);
    EXPECT_EQ(Utf8PrefixLength("", 5), 0u);
    EXPECT_EQ(Utf8SuffixStart(euro + "x", 1), 3u);
    EXPECT_EQ(Utf8SuffixStart(euro + "x", 0), 0u);
    // A stray continuation run is not a character; at most three bytes are skipped.
    EXPECT_EQ(Utf8SuffixStart(std::string(5, '\x80'), 0), 3u);
}

TEST(CommonTest, SplitLinesIgnoresTrailingNewline) {
    EXPECT_EQ(SplitLines("a\nb\n"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(SplitLines("a\n\nb"), (std::vector<std::string>{"a", "", "b"}));
}

}  // namespace
}  // namespace anabox::utils
