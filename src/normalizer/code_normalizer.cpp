#include "normalizer/code_normalizer.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

#include "normalizer/indentation.hpp"
#include "normalizer/python_source.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace anabox::normalizer {
namespace {

struct FencedBlock {
    std::string language;
    std::vector<std::string> lines;
};

bool IsFenceLine(const std::string& line) {
    return utils::StartsWith(utils::Trim(line), "```");
}

bool IsPythonTag(const std::string& tag) {
    return tag.empty() || tag == "python" || tag == "py" || tag == "python3";
}

std::string FenceLanguage(const std::string& line) {
    auto tag = utils::Trim(utils::Trim(line).substr(3));
    const auto space = tag.find_first_of(" \t{");
    if (space != std::string::npos) {
        tag = tag.substr(0, space);
    }
    return utils::ToLower(tag);
}

std::string NormalizeNewlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

// "python", "py", "Python Code:" alone on the first line, or "python import x".
void StripLeadingLanguageTag(std::vector<std::string>& lines) {
    auto first = std::find_if(lines.begin(), lines.end(), [](const std::string& line) {
        return !utils::IsBlank(line);
    });
    if (first == lines.end()) {
        return;
    }
    const auto trimmed = utils::Trim(*first);
    auto lowered = utils::ToLower(trimmed);
    if (!lowered.empty() && lowered.back() == ':') {
        lowered.pop_back();
    }
    if (lowered == "python" || lowered == "py" || lowered == "python3" || lowered == "python code") {
        lines.erase(first);
        return;
    }
    static const std::regex tagged_import(R"(^(?:python3?|py)\s+((?:import|from)\s.*)$)",
                                          std::regex::icase);
    std::smatch match;
    if (std::regex_match(trimmed, match, tagged_import)) {
        *first = match[1].str();
    }
}

// A statement the model wrapped in single backticks, e.g. `df.head()`.
std::string UnwrapBacktickStatement(const std::string& line) {
    const auto trimmed = utils::Trim(line);
    if (trimmed.size() < 3 || trimmed.front() != '`' || trimmed.back() != '`') {
        return line;
    }
    const auto inner = trimmed.substr(1, trimmed.size() - 2);
    if (inner.find('`') != std::string::npos || utils::IsBlank(inner)) {
        return line;
    }
    const auto indent_end = line.find_first_not_of(" \t");
    return line.substr(0, indent_end) + inner;
}

std::string CommonIndentPrefix(const std::vector<std::string>& lines, const std::vector<bool>& in_string) {
    bool first = true;
    std::string prefix;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (in_string[i] || utils::IsBlank(line)) {
            continue;
        }
        const auto indent = line.substr(0, line.find_first_not_of(" \t"));
        if (first) {
            prefix = indent;
            first = false;
            continue;
        }
        std::size_t common = 0;
        while (common < prefix.size() && common < indent.size() && prefix[common] == indent[common]) {
            ++common;
        }
        prefix.resize(common);
        if (prefix.empty()) {
            break;
        }
    }
    return prefix;
}

// Flags the lines that begin inside a string literal.
std::vector<bool> StringLines(const std::vector<std::string>& lines) {
    const auto scan = ScanPythonSource(lines);
    std::vector<bool> flags(lines.size(), false);
    for (std::size_t i = 0; i < scan.lines.size() && i < flags.size(); ++i) {
        flags[i] = scan.lines[i].in_string;
    }
    return flags;
}

std::vector<std::string> CleanLines(const std::string& body) {
    const auto raw = utils::SplitLines(body);
    const auto raw_in_string = StringLines(raw);
    std::vector<std::string> lines;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw_in_string[i]) {
            lines.push_back(raw[i]);
            continue;
        }
        if (IsFenceLine(raw[i])) {
            continue;
        }
        lines.push_back(UnwrapBacktickStatement(raw[i]));
    }
    StripLeadingLanguageTag(lines);

    while (!lines.empty() && utils::IsBlank(lines.front())) {
        lines.erase(lines.begin());
    }
    auto in_string = StringLines(lines);
    while (!lines.empty() && !in_string[lines.size() - 1] && utils::IsBlank(lines.back())) {
        lines.pop_back();
        in_string.pop_back();
    }

    const auto prefix = CommonIndentPrefix(lines, in_string);
    if (!prefix.empty()) {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (in_string[i]) {
                continue;
            }
            if (utils::StartsWith(lines[i], prefix)) {
                lines[i].erase(0, prefix.size());
            } else {
                lines[i] = utils::TrimRight(lines[i]);
            }
        }
    }
    return lines;
}

std::string DescribeMarkdown(const SourceLine& line) {
    static const std::regex heading(R"(^\s*(#{3,6}\s+\S|#{1,2}\s+\*\*))");
    static const std::regex table_row(R"(^\s*\|.*\|\s*$)");
    static const std::regex blockquote(R"(^\s*>(\s|$))");
    static const std::regex bold_line(R"(^\s*\*\*[^*].*\*\*:?\s*$)");

    if (line.in_string) {
        return {};
    }
    if (std::regex_search(line.text, table_row)) {
        return "table";
    }
    if (line.continuation) {
        return {};
    }
    if (std::regex_search(line.text, heading)) {
        return "heading";
    }
    if (std::regex_search(line.text, blockquote)) {
        return "blockquote";
    }
    if (std::regex_search(line.text, bold_line)) {
        return "bold text";
    }
    return {};
}

std::string JoinSource(const std::vector<std::string>& lines) {
    return utils::Join(lines, "\n") + "\n";
}

}  // namespace

std::string ExtractCodeBody(const std::string& raw_text) {
    const auto text = NormalizeNewlines(raw_text);
    const auto trimmed = utils::Trim(text);

    // Single-line fence: ```print(1)```
    if (trimmed.find('\n') == std::string::npos && trimmed.size() > 6 &&
        utils::StartsWith(trimmed, "```") && utils::EndsWith(trimmed, "```")) {
        auto inner = utils::Trim(trimmed.substr(3, trimmed.size() - 6));
        static const std::regex tag(R"(^(?:python3?|py)\s+)", std::regex::icase);
        return std::regex_replace(inner, tag, "", std::regex_constants::format_first_only);
    }

    const auto lines = utils::SplitLines(text);
    const auto in_string = StringLines(lines);
    std::vector<FencedBlock> blocks;
    bool inside = false;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (!in_string[i] && IsFenceLine(line)) {
            if (inside) {
                inside = false;
            } else {
                blocks.push_back(FencedBlock{FenceLanguage(line), {}});
                inside = true;
            }
            continue;
        }
        if (inside) {
            blocks.back().lines.push_back(line);
        }
    }
    if (blocks.empty()) {
        return text;
    }

    std::vector<std::string> body;
    for (const auto& block : blocks) {
        if (!IsPythonTag(block.language)) {
            continue;
        }
        if (!body.empty()) {
            body.emplace_back();
        }
        body.insert(body.end(), block.lines.begin(), block.lines.end());
    }
    if (body.empty()) {
        body = blocks.front().lines;
    }
    return utils::Join(body, "\n");
}

std::vector<std::string> ImportedModules(const std::string& statement) {
    static const std::regex plain_import(R"((?:^|[;:])\s*import\s+([^;]+))");
    static const std::regex from_import(R"((?:^|[;:])\s*from\s+([.\w]+)\s+import\b)");

    std::vector<std::string> modules;
    for (std::sregex_iterator it(statement.begin(), statement.end(), plain_import), end; it != end; ++it) {
        std::stringstream items((*it)[1].str());
        std::string item;
        while (std::getline(items, item, ',')) {
            auto name = utils::Trim(item);
            const auto space = name.find_first_of(" \t");
            if (space != std::string::npos) {
                name = name.substr(0, space);
            }
            name = name.substr(0, name.find('.'));
            if (!name.empty()) {
                modules.push_back(name);
            }
        }
    }
    for (std::sregex_iterator it(statement.begin(), statement.end(), from_import), end; it != end; ++it) {
        const auto name = (*it)[1].str();
        if (utils::StartsWith(name, ".")) {
            modules.push_back(name);
        } else {
            modules.push_back(name.substr(0, name.find('.')));
        }
    }
    return modules;
}

CodeNormalizer::CodeNormalizer(std::set<std::string> allowed_imports)
    : allowed_imports_(std::move(allowed_imports)) {}

CodeNormalizer::CodeNormalizer(const std::vector<std::string>& allowed_imports)
    : allowed_imports_(allowed_imports.begin(), allowed_imports.end()) {}

CodeCandidate CodeNormalizer::Normalize(const std::string& raw_text) const {
    const auto lines = CleanLines(ExtractCodeBody(raw_text));
    if (lines.empty()) {
        return CodeCandidate::Reject("empty code after stripping conversational wrapping");
    }

    const auto scan = ScanPythonSource(lines);
    for (std::size_t i = 0; i < scan.lines.size(); ++i) {
        const auto kind = DescribeMarkdown(scan.lines[i]);
        if (!kind.empty()) {
            utils::LogDebug("normalizer", "markdown " + kind + " on line " + std::to_string(i + 1));
            return CodeCandidate::Reject("mixed markdown and code (markdown " + kind + " on line " +
                                         std::to_string(i + 1) + ")");
        }
    }

    std::vector<std::string> disallowed;
    for (const auto& logical : scan.logical) {
        if (logical.code.find("__import__") != std::string::npos) {
            return CodeCandidate::Reject("dynamic import via __import__ is not allowed");
        }
        for (const auto& module : ImportedModules(logical.code)) {
            if (utils::StartsWith(module, ".")) {
                return CodeCandidate::Reject("relative import is not allowed: " + module);
            }
            if (module == "__future__" || allowed_imports_.count(module) > 0) {
                continue;
            }
            if (std::find(disallowed.begin(), disallowed.end(), module) == disallowed.end()) {
                disallowed.push_back(module);
            }
        }
    }
    if (!disallowed.empty()) {
        return CodeCandidate::Reject("disallowed import: " + utils::Join(disallowed, ", "));
    }

    if (!scan.ok()) {
        return CodeCandidate::Reject("code cannot be parsed: " + scan.error + " (line " +
                                     std::to_string(scan.error_line) + ")");
    }

    const auto report = CheckIndentation(scan);
    if (report.valid) {
        return CodeCandidate::Accept(JoinSource(lines));
    }

    utils::LogDebug("normalizer", "repairing indentation: " + report.message + " (line " +
                                      std::to_string(report.line) + ")");
    const auto repaired = RepairIndentation(scan);
    const auto rescan = ScanPythonSource(repaired);
    const auto recheck = CheckIndentation(rescan);
    if (!rescan.ok() || !recheck.valid) {
        const auto& message = rescan.ok() ? recheck.message : rescan.error;
        const auto line = rescan.ok() ? recheck.line : rescan.error_line;
        return CodeCandidate::Reject("indentation could not be repaired: " + message + " (line " +
                                     std::to_string(line) + ")");
    }
    return CodeCandidate::Accept(JoinSource(repaired), true);
}

}  // namespace anabox::normalizer
