#include "normalizer/indentation.hpp"

#include <algorithm>
#include <set>

namespace anabox::normalizer {
namespace {

const std::set<std::string>& BlockTerminators() {
    static const std::set<std::string> tokens = {"return", "pass", "break", "continue", "raise"};
    return tokens;
}

bool IsCompatibleOpener(const std::string& keyword, const std::string& opener) {
    if (keyword == "elif") {
        return opener == "if" || opener == "elif";
    }
    if (keyword == "else") {
        return opener == "if" || opener == "elif" || opener == "for" || opener == "while" ||
               opener == "try" || opener == "except";
    }
    if (keyword == "except") {
        return opener == "try" || opener == "except";
    }
    if (keyword == "finally") {
        return opener == "try" || opener == "except" || opener == "else";
    }
    return false;
}

bool IsClauseKeyword(const std::string& token) {
    return token == "else" || token == "elif" || token == "except" || token == "finally";
}

std::string ExpandLeadingTabs(const std::string& text) {
    const auto body_start = text.find_first_not_of(" \t\f");
    if (body_start == std::string::npos) {
        return {};
    }
    return std::string(static_cast<std::size_t>(IndentWidth(text)), ' ') + text.substr(body_start);
}

std::string Indented(int width, const std::string& text) {
    return std::string(static_cast<std::size_t>(std::max(width, 0)), ' ') + StripIndent(text);
}

}  // namespace

IndentationReport CheckIndentation(const ScanResult& scan) {
    IndentationReport report;
    std::vector<int> stack = {0};
    bool expect_block = false;

    for (const auto& logical : scan.logical) {
        const int width = logical.indent;
        if (expect_block) {
            if (width <= stack.back()) {
                report.valid = false;
                report.message = "expected an indented block";
                report.line = logical.first + 1;
                return report;
            }
            stack.push_back(width);
        } else if (width > stack.back()) {
            report.valid = false;
            report.message = "unexpected indent";
            report.line = logical.first + 1;
            return report;
        } else {
            while (width < stack.back()) {
                stack.pop_back();
            }
            if (width != stack.back()) {
                report.valid = false;
                report.message = "unindent does not match any outer indentation level";
                report.line = logical.first + 1;
                return report;
            }
        }
        expect_block = logical.opens_block;
    }

    if (expect_block && !scan.logical.empty()) {
        report.valid = false;
        report.message = "expected an indented block at end of input";
        report.line = scan.logical.back().last + 1;
    }
    return report;
}

std::vector<std::string> RepairIndentation(const ScanResult& scan) {
    struct Placed {
        int level = 0;
        int original = 0;
    };
    std::vector<Placed> placed;
    placed.reserve(scan.logical.size());

    for (std::size_t i = 0; i < scan.logical.size(); ++i) {
        const auto& logical = scan.logical[i];
        Placed current;
        current.original = logical.indent;
        if (i > 0) {
            const auto& prev_line = scan.logical[i - 1];
            const auto& prev = placed[i - 1];
            if (prev_line.opens_block) {
                current.level = prev.level + 1;
            } else {
                current.level = prev.level;
                if (BlockTerminators().count(prev_line.first_token) > 0) {
                    current.level = std::max(prev.level - 1, 0);
                }
                if (current.original < prev.original) {
                    for (std::size_t j = i; j-- > 0;) {
                        if (placed[j].original <= current.original) {
                            current.level = std::min(current.level, placed[j].level);
                            break;
                        }
                    }
                }
                if (IsClauseKeyword(logical.first_token)) {
                    for (std::size_t j = i; j-- > 0;) {
                        if (scan.logical[j].opens_block && placed[j].level <= current.level &&
                            IsCompatibleOpener(logical.first_token, scan.logical[j].first_token)) {
                            current.level = placed[j].level;
                            break;
                        }
                    }
                }
            }
        }
        placed.push_back(current);
    }

    std::vector<std::string> out;
    out.reserve(scan.lines.size());
    std::size_t next_logical = 0;
    int delta = 0;
    for (std::size_t i = 0; i < scan.lines.size(); ++i) {
        const auto& line = scan.lines[i];
        if (line.in_string) {
            out.push_back(line.text);
            continue;
        }
        if (next_logical < scan.logical.size() && scan.logical[next_logical].first == i) {
            const int width = placed[next_logical].level * 4;
            delta = width - scan.logical[next_logical].indent;
            out.push_back(Indented(width, line.text));
            ++next_logical;
            continue;
        }
        if (line.continuation) {
            const auto expanded = ExpandLeadingTabs(line.text);
            out.push_back(Indented(IndentWidth(expanded) + delta, expanded));
            continue;
        }
        if (StripIndent(line.text).empty()) {
            out.emplace_back();
            continue;
        }
        // Comment-only line: follows the statement that comes after it.
        const int level = next_logical < placed.size() ? placed[next_logical].level : 0;
        out.push_back(Indented(level * 4, line.text));
    }
    return out;
}

}  // namespace anabox::normalizer
