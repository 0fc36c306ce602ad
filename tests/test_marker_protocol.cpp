#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "artifacts/marker_protocol.hpp"

namespace anabox::artifacts {
namespace {

ArtifactMarker Inline(int seq, std::string bytes, std::string mime = "image/png") {
    ArtifactMarker marker;
    marker.kind = MarkerKind::kImageInline;
    marker.sequence_no = seq;
    marker.mime = std::move(mime);
    marker.payload = std::move(bytes);
    return marker;
}

TEST(MarkerProtocolTest, RecoversInlinePayloadByteForByte) {
    const std::string bytes("\x89PNG\r\n\x1a\n\0\xff\x01", 11);
    const auto encoded = EncodeMarker(Inline(1, bytes));
    const auto segments = SplitStream(encoded);
    ASSERT_EQ(segments.size(), 1u);
    ASSERT_TRUE(segments[0].IsMarker());
    EXPECT_EQ(segments[0].marker.payload, bytes);
    EXPECT_EQ(segments[0].marker.mime, "image/png");
    EXPECT_EQ(segments[0].marker.sequence_no, 1);
    EXPECT_EQ(segments[0].text, encoded);
}

TEST(MarkerProtocolTest, KeepsStreamOrderAroundMarkers) {
    const auto stream = "before\n" + EncodeMarker(Inline(1, "abc")) + "done\n";
    const auto segments = SplitStream(stream);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_FALSE(segments[0].IsMarker());
    EXPECT_EQ(segments[0].text, "before\n");
    EXPECT_TRUE(segments[1].IsMarker());
    EXPECT_FALSE(segments[2].IsMarker());
    EXPECT_EQ(segments[2].text, "done\n");
}

TEST(MarkerProtocolTest, ParsesReferenceMarkers) {
    const std::string stream =
        "<<anabox-artifact seq=3 kind=image_ref mime=image/JPEG>> plots/a.jpg <</anabox-artifact seq=3>>";
    const auto segments = SplitStream(stream);
    ASSERT_EQ(segments.size(), 1u);
    ASSERT_TRUE(segments[0].IsMarker());
    EXPECT_EQ(segments[0].marker.kind, MarkerKind::kImageRef);
    EXPECT_EQ(segments[0].marker.payload, "plots/a.jpg");
    EXPECT_EQ(segments[0].marker.mime, "image/jpeg");
}

TEST(MarkerProtocolTest, MimeDefaultsToPng) {
    const auto segments = SplitStream("<<anabox-artifact seq=1 kind=image_inline>>QUJD<</anabox-artifact seq=1>>");
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].marker.mime, "image/png");
    EXPECT_EQ(segments[0].marker.payload, "ABC");
}

TEST(MarkerProtocolTest, MissingCloseStaysText) {
    const std::string stream = "x\n<<anabox-artifact seq=1 kind=image_inline>>QUJD\nmore output\n";
    const auto segments = SplitStream(stream);
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_FALSE(segments[0].IsMarker());
    EXPECT_EQ(segments[0].text, stream);
}

TEST(MarkerProtocolTest, MalformedHeadersStayText) {
    const std::string inputs[] = {
        "<<anabox-artifact seq=1 kind=video>>QUJD<</anabox-artifact seq=1>>",
        "<<anabox-artifact seq=0 kind=image_inline>>QUJD<</anabox-artifact seq=0>>",
        "<<anabox-artifact kind=image_inline>>QUJD<</anabox-artifact seq=1>>",
        "<<anabox-artifact seq=1 kind=image_inline color=red>>QUJD<</anabox-artifact seq=1>>",
        "<<anabox-artifact seq=1 kind=image_inline mime=png>>QUJD<</anabox-artifact seq=1>>",
        "<<anabox-artifact seq=1 kind=image_inline>>not base64!<</anabox-artifact seq=1>>",
        "<<anabox-artifact seq=1 kind=image_ref>>  <</anabox-artifact seq=1>>",
    };
    for (const auto& input : inputs) {
        const auto segments = SplitStream(input);
        ASSERT_EQ(segments.size(), 1u) << input;
        EXPECT_FALSE(segments[0].IsMarker()) << input;
        EXPECT_EQ(segments[0].text, input);
    }
}

TEST(MarkerProtocolTest, NonIncreasingSequenceStaysText) {
    const auto second = EncodeMarker(Inline(1, "def"));
    const auto stream = EncodeMarker(Inline(1, "abc")) + second;
    const auto segments = SplitStream(stream);
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_TRUE(segments[0].IsMarker());
    EXPECT_FALSE(segments[1].IsMarker());
    EXPECT_EQ(segments[1].text, second);
}

TEST(MarkerProtocolTest, NestedOpenInvalidatesOuterMarker) {
    const std::string outer_open = "<<anabox-artifact seq=1 kind=image_inline>>QUJD";
    const auto inner = EncodeMarker(Inline(2, "xyz"));
    const std::string outer_close = "<</anabox-artifact seq=1>>";
    const auto segments = SplitStream(outer_open + inner + outer_close);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0].text, outer_open);
    ASSERT_TRUE(segments[1].IsMarker());
    EXPECT_EQ(segments[1].marker.payload, "xyz");
    EXPECT_EQ(segments[2].text, outer_close);
}

TEST(MarkerProtocolTest, ManyUnclosedMarkersSplitInLinearTime) {
    const std::string line = "<<anabox-artifact seq=1 kind=image_inline>>QUFB\n";
    std::string stream;
    while (stream.size() < 1024 * 1024) {
        stream += line;
    }
    const auto started = std::chrono::steady_clock::now();
    const auto segments = SplitStream(stream);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].text, stream);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(MarkerProtocolTest, HeaderWithoutCloseIsBoundedAndKeptAsText) {
    std::string stream;
    while (stream.size() < 1024 * 1024) {
        stream += "<<anabox-artifact ";
    }
    const auto started = std::chrono::steady_clock::now();
    const auto segments = SplitStream(stream);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].text, stream);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(MarkerProtocolTest, EmptyStreamHasNoSegments) {
    EXPECT_TRUE(SplitStream("").empty());
}

}  // namespace
}  // namespace anabox::artifacts
