#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace anabox::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline long long NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        Now().time_since_epoch()).count();
}

inline bool IsBlank(std::string_view value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

inline std::string Trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n\f\v");
    return std::string(value.substr(first, last - first + 1));
}

inline std::string TrimRight(std::string_view value) {
    const auto last = value.find_last_not_of(" \t\r\n\f\v");
    if (last == std::string_view::npos) {
        return {};
    }
    return std::string(value.substr(0, last + 1));
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline bool StartsWith(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

inline bool EndsWith(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Splits on '\n'. A trailing newline does not produce an empty last line.
inline std::vector<std::string> SplitLines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

inline bool IsUtf8Continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Largest length <= max_len that does not end inside a multi-byte UTF-8
// sequence. Only the first max_len bytes of `value` are inspected.
inline std::size_t Utf8PrefixLength(std::string_view value, std::size_t max_len) {
    std::size_t end = std::min(max_len, value.size());
    if (end == 0) {
        return 0;
    }
    std::size_t lead = end - 1;
    while (lead > 0 && end - lead < 4 && IsUtf8Continuation(value[lead])) {
        --lead;
    }
    const auto byte = static_cast<unsigned char>(value[lead]);
    std::size_t width = 1;
    if ((byte & 0xE0) == 0xC0) {
        width = 2;
    } else if ((byte & 0xF0) == 0xE0) {
        width = 3;
    } else if ((byte & 0xF8) == 0xF0) {
        width = 4;
    }
    return lead + width > end ? lead : end;
}

// First offset >= start that does not fall inside a multi-byte UTF-8 sequence.
inline std::size_t Utf8SuffixStart(std::string_view value, std::size_t start) {
    std::size_t skipped = 0;
    while (start < value.size() && skipped < 3 && IsUtf8Continuation(value[start])) {
        ++start;
        ++skipped;
    }
    return start;
}

inline std::string Truncate(const std::string& value, std::size_t max_len) {
    if (value.size() <= max_len) {
        return value;
    }
    return value.substr(0, Utf8PrefixLength(value, max_len)) + "\n...(truncated)...";
}

// Keeps the end of the text, where tracebacks put the actual error.
inline std::string TruncateTail(const std::string& value, std::size_t max_len) {
    if (value.size() <= max_len) {
        return value;
    }
    return "...(truncated)...\n" + value.substr(Utf8SuffixStart(value, value.size() - max_len));
}

}  // namespace anabox::utils
