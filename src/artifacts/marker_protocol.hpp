#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace anabox::artifacts {

// <<anabox-artifact seq=N kind=K mime=T>>PAYLOAD<</anabox-artifact seq=N>>
inline constexpr std::string_view kMarkerTag = "anabox-artifact";
inline constexpr std::string_view kDefaultMime = "image/png";
// Longest header accepted between the tag and its closing ">>".
inline constexpr std::size_t kMaxHeaderBytes = 256;

enum class MarkerKind {
    kImageInline,
    kImageRef
};

const char* ToString(MarkerKind kind);
std::optional<MarkerKind> ParseMarkerKind(std::string_view value);

struct ArtifactMarker {
    MarkerKind kind = MarkerKind::kImageInline;
    int sequence_no = 0;
    std::string mime = std::string(kDefaultMime);
    // Decoded bytes for inline markers, the referenced path for references.
    std::string payload;
};

struct StreamSegment {
    enum class Type {
        kText,
        kMarker
    };

    Type type = Type::kText;
    // Text runs: the text. Markers: the exact span as it appeared.
    std::string text;
    ArtifactMarker marker;

    bool IsMarker() const { return type == Type::kMarker; }
};

// Splits captured stdout into text runs and well-formed markers, in stream
// order. Malformed spans stay in the surrounding text; never throws on input.
std::vector<StreamSegment> SplitStream(std::string_view stream);

// Wire form of a marker; inline payloads are base64-encoded.
std::string EncodeMarker(const ArtifactMarker& marker);

}  // namespace anabox::artifacts
