#include "normalizer/python_source.hpp"

#include <cctype>

#include "utils/common.hpp"

namespace anabox::normalizer {
namespace {

char ClosingFor(char open) {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default: return '}';
    }
}

std::string LeadingToken(const std::string& code) {
    const auto trimmed = utils::Trim(code);
    std::string token;
    for (char c : trimmed) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            token.push_back(c);
        } else {
            break;
        }
    }
    if (!token.empty() && std::isdigit(static_cast<unsigned char>(token.front()))) {
        return {};
    }
    return token;
}

}  // namespace

int IndentWidth(const std::string& text) {
    int width = 0;
    for (char c : text) {
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (c == '\f') {
            width = 0;
        } else {
            break;
        }
    }
    return width;
}

std::string StripIndent(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\f");
    return first == std::string::npos ? std::string() : text.substr(first);
}

ScanResult ScanPythonSource(const std::vector<std::string>& lines) {
    ScanResult result;
    std::vector<char> brackets;
    char quote = 0;
    bool triple = false;
    bool backslash_pending = false;
    bool have_current = false;
    LogicalLine current;

    auto fail = [&result](std::size_t line, const std::string& message) {
        if (result.error.empty()) {
            result.error = message;
            result.error_line = line + 1;
        }
    };

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& text = lines[i];
        SourceLine line;
        line.text = text;
        line.in_string = quote != 0;
        line.continuation = have_current && (quote != 0 || !brackets.empty() || backslash_pending);
        backslash_pending = false;

        std::string code;
        code.reserve(text.size());
        bool string_continued = false;
        for (std::size_t p = 0; p < text.size(); ++p) {
            const char c = text[p];
            if (quote != 0) {
                if (c == '\\') {
                    if (p + 1 < text.size()) {
                        code += "  ";
                        ++p;
                    } else {
                        code += ' ';
                        string_continued = true;
                    }
                    continue;
                }
                if (c == quote) {
                    if (!triple) {
                        code += c;
                        quote = 0;
                        continue;
                    }
                    if (text.compare(p, 3, std::string(3, quote)) == 0) {
                        code += std::string(3, quote);
                        p += 2;
                        quote = 0;
                        triple = false;
                        continue;
                    }
                }
                code += ' ';
                continue;
            }
            if (c == '#') {
                break;
            }
            if (c == '"' || c == '\'') {
                quote = c;
                if (text.compare(p, 3, std::string(3, c)) == 0) {
                    triple = true;
                    code += std::string(3, c);
                    p += 2;
                } else {
                    triple = false;
                    code += c;
                }
                continue;
            }
            if (c == '(' || c == '[' || c == '{') {
                brackets.push_back(c);
            } else if (c == ')' || c == ']' || c == '}') {
                if (brackets.empty() || ClosingFor(brackets.back()) != c) {
                    fail(i, std::string("unmatched '") + c + "'");
                } else {
                    brackets.pop_back();
                }
            } else if (c == '\\' && p + 1 == text.size()) {
                backslash_pending = true;
                code += ' ';
                continue;
            }
            code += c;
        }

        if (quote != 0 && !triple) {
            if (string_continued) {
                backslash_pending = true;
            } else {
                fail(i, "unterminated string literal");
                quote = 0;
            }
        }

        line.code = code;
        if (line.continuation) {
            current.last = i;
            current.code += ' ';
            current.code += code;
        } else if (!utils::IsBlank(code)) {
            if (have_current) {
                result.logical.push_back(current);
            }
            current = LogicalLine{};
            current.first = i;
            current.last = i;
            current.code = code;
            current.indent = IndentWidth(text);
            current.first_token = LeadingToken(code);
            have_current = true;
        }
        result.lines.push_back(std::move(line));
    }

    if (have_current) {
        result.logical.push_back(current);
    }
    if (quote != 0) {
        fail(lines.empty() ? 0 : lines.size() - 1, "unterminated triple-quoted string");
    }
    if (!brackets.empty()) {
        fail(lines.empty() ? 0 : lines.size() - 1, std::string("'") + brackets.back() + "' was never closed");
    }
    if (backslash_pending && result.error.empty()) {
        fail(lines.empty() ? 0 : lines.size() - 1, "unexpected end of input after line continuation");
    }

    for (auto& logical : result.logical) {
        const auto trimmed = utils::TrimRight(logical.code);
        logical.opens_block = !trimmed.empty() && trimmed.back() == ':';
    }
    return result;
}

}  // namespace anabox::normalizer
