#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace anabox::normalizer {

struct SourceLine {
    std::string text;
    // Comments removed, string bodies blanked; quotes and brackets kept.
    std::string code;
    // Starts inside brackets, a backslash continuation or a multi-line string.
    bool continuation = false;
    // Starts inside a triple-quoted string; its text must never be touched.
    bool in_string = false;
};

struct LogicalLine {
    std::size_t first = 0;
    std::size_t last = 0;
    std::string code;
    std::string first_token;
    int indent = 0;
    bool opens_block = false;
};

struct ScanResult {
    std::vector<SourceLine> lines;
    std::vector<LogicalLine> logical;
    std::string error;
    std::size_t error_line = 0;

    bool ok() const { return error.empty(); }
};

// Tokenizes just enough Python to find logical lines, strings and brackets.
ScanResult ScanPythonSource(const std::vector<std::string>& lines);

int IndentWidth(const std::string& text);
std::string StripIndent(const std::string& text);

}  // namespace anabox::normalizer
