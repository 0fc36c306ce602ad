#include "artifacts/marker_protocol.hpp"

#include <cctype>
#include <sstream>

#include "utils/common.hpp"
#include "utils/encoding.hpp"

namespace anabox::artifacts {
namespace {

struct MarkerHeader {
    int sequence_no = 0;
    MarkerKind kind = MarkerKind::kImageInline;
    std::string mime = std::string(kDefaultMime);
};

std::string OpenPrefix() {
    return "<<" + std::string(kMarkerTag);
}

std::string CloseDelimiter(int sequence_no) {
    return "<</" + std::string(kMarkerTag) + " seq=" + std::to_string(sequence_no) + ">>";
}

std::optional<int> ParseSequence(const std::string& value) {
    if (value.empty() || value.size() > 9) {
        return std::nullopt;
    }
    int result = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        result = result * 10 + (c - '0');
    }
    if (result <= 0) {
        return std::nullopt;
    }
    return result;
}

bool IsValidMime(const std::string& value) {
    const auto slash = value.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == value.size() ||
        value.find('/', slash + 1) != std::string::npos) {
        return false;
    }
    for (char c : value) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '/' && c != '.' && c != '+' && c != '-') {
            return false;
        }
    }
    return true;
}

std::optional<MarkerHeader> ParseHeader(const std::string& header) {
    if (header.empty() || header.front() != ' ') {
        return std::nullopt;
    }
    MarkerHeader parsed;
    bool have_seq = false;
    bool have_kind = false;
    std::istringstream stream(header);
    std::string field;
    while (stream >> field) {
        const auto eq = field.find('=');
        if (eq == std::string::npos) {
            return std::nullopt;
        }
        const auto key = field.substr(0, eq);
        const auto value = field.substr(eq + 1);
        if (key == "seq" && !have_seq) {
            const auto seq = ParseSequence(value);
            if (!seq) {
                return std::nullopt;
            }
            parsed.sequence_no = *seq;
            have_seq = true;
        } else if (key == "kind" && !have_kind) {
            const auto kind = ParseMarkerKind(value);
            if (!kind) {
                return std::nullopt;
            }
            parsed.kind = *kind;
            have_kind = true;
        } else if (key == "mime") {
            if (!IsValidMime(value)) {
                return std::nullopt;
            }
            parsed.mime = utils::ToLower(value);
        } else {
            return std::nullopt;
        }
    }
    if (!have_seq || !have_kind) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

const char* ToString(MarkerKind kind) {
    switch (kind) {
        case MarkerKind::kImageInline: return "image_inline";
        case MarkerKind::kImageRef: return "image_ref";
    }
    return "unknown";
}

std::optional<MarkerKind> ParseMarkerKind(std::string_view value) {
    if (value == "image_inline") {
        return MarkerKind::kImageInline;
    }
    if (value == "image_ref") {
        return MarkerKind::kImageRef;
    }
    return std::nullopt;
}

std::vector<StreamSegment> SplitStream(std::string_view stream) {
    const auto open_prefix = OpenPrefix();
    std::vector<StreamSegment> segments;
    std::string text;
    int last_sequence = 0;
    std::size_t pos = 0;

    auto flush_text = [&segments, &text]() {
        if (text.empty()) {
            return;
        }
        StreamSegment segment;
        segment.text = std::move(text);
        segments.push_back(std::move(segment));
        text.clear();
    };

    while (pos < stream.size()) {
        const auto open = stream.find(open_prefix, pos);
        if (open == std::string_view::npos) {
            text.append(stream.substr(pos));
            break;
        }
        text.append(stream.substr(pos, open - pos));

        // Anything that fails below leaves the opening prefix as literal text
        // and resumes scanning right after it.
        const auto literal_end = open + open_prefix.size();
        auto keep_literal = [&]() {
            text.append(stream.substr(open, open_prefix.size()));
            pos = literal_end;
        };

        // Headers are short; bounding the search keeps hostile output linear.
        const auto header_window = stream.substr(literal_end, kMaxHeaderBytes);
        const auto header_length = header_window.find(">>");
        if (header_length == std::string_view::npos ||
            header_window.substr(0, header_length).find('\n') != std::string_view::npos) {
            keep_literal();
            continue;
        }
        const auto header_end = literal_end + header_length;
        const auto header = ParseHeader(std::string(stream.substr(literal_end, header_length)));
        if (!header || header->sequence_no <= last_sequence) {
            keep_literal();
            continue;
        }

        const auto payload_start = header_end + 2;
        const auto close = CloseDelimiter(header->sequence_no);
        // The close must come before the next opening prefix.
        const auto next_open = stream.find(open_prefix, payload_start);
        const auto payload_window = stream.substr(
            payload_start, next_open == std::string_view::npos ? std::string_view::npos : next_open - payload_start);
        const auto close_offset = payload_window.find(close);
        if (close_offset == std::string_view::npos) {
            keep_literal();
            continue;
        }
        const auto close_pos = payload_start + close_offset;

        ArtifactMarker marker;
        marker.kind = header->kind;
        marker.sequence_no = header->sequence_no;
        marker.mime = header->mime;
        const auto raw_payload = stream.substr(payload_start, close_pos - payload_start);
        if (marker.kind == MarkerKind::kImageInline) {
            auto decoded = utils::Base64Decode(raw_payload);
            if (!decoded || decoded->empty()) {
                keep_literal();
                continue;
            }
            marker.payload = std::move(*decoded);
        } else {
            marker.payload = utils::Trim(raw_payload);
            if (marker.payload.empty() || marker.payload.find('\n') != std::string::npos ||
                marker.payload.find('\0') != std::string::npos) {
                keep_literal();
                continue;
            }
        }

        flush_text();
        StreamSegment segment;
        segment.type = StreamSegment::Type::kMarker;
        segment.marker = std::move(marker);
        last_sequence = header->sequence_no;

        pos = close_pos + close.size();
        if (pos < stream.size() && stream[pos] == '\n') {
            ++pos;
        }
        segment.text = std::string(stream.substr(open, pos - open));
        segments.push_back(std::move(segment));
    }

    flush_text();
    return segments;
}

std::string EncodeMarker(const ArtifactMarker& marker) {
    std::ostringstream oss;
    oss << "<<" << kMarkerTag << " seq=" << marker.sequence_no
        << " kind=" << ToString(marker.kind)
        << " mime=" << marker.mime << ">>";
    if (marker.kind == MarkerKind::kImageInline) {
        oss << utils::Base64Encode(marker.payload);
    } else {
        oss << marker.payload;
    }
    oss << CloseDelimiter(marker.sequence_no) << "\n";
    return oss.str();
}

}  // namespace anabox::artifacts
