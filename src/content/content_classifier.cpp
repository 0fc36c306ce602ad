#include "content/content_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace anabox::content {
namespace {

// std::regex recurses per character; keep pathological lines away from it.
constexpr std::size_t kMaxRegexLine = 4096;

enum class Separator {
    kPipe,
    kTab,
    kSpaces
};

std::vector<std::string> NonEmptyLines(const std::string& text) {
    std::vector<std::string> lines;
    for (auto& line : utils::SplitLines(text)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!utils::IsBlank(line)) {
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

std::vector<std::string> SplitPipeRow(const std::string& line) {
    const auto trimmed = utils::Trim(line);
    std::vector<std::string> cells;
    std::string cell;
    bool trailing_border = false;
    for (std::size_t i = 0; i < trimmed.size(); ++i) {
        const char c = trimmed[i];
        if (c == '\\' && i + 1 < trimmed.size() && trimmed[i + 1] == '|') {
            cell.push_back('|');
            ++i;
            continue;
        }
        if (c == '|') {
            cells.push_back(utils::Trim(cell));
            cell.clear();
            trailing_border = i + 1 == trimmed.size();
            continue;
        }
        cell.push_back(c);
    }
    if (!trailing_border) {
        cells.push_back(utils::Trim(cell));
    }
    if (!trimmed.empty() && trimmed.front() == '|' && !cells.empty()) {
        cells.erase(cells.begin());
    }
    return cells;
}

std::vector<std::string> SplitTabRow(const std::string& line) {
    std::vector<std::string> cells;
    std::size_t start = 0;
    const auto trimmed = utils::Trim(line);
    while (true) {
        const auto tab = trimmed.find('\t', start);
        cells.push_back(utils::Trim(trimmed.substr(start, tab == std::string::npos ? std::string::npos : tab - start)));
        if (tab == std::string::npos) {
            break;
        }
        start = tab + 1;
    }
    return cells;
}

// Cells separated by runs of two or more spaces, the way pandas prints.
std::vector<std::string> SplitSpaceRow(const std::string& line) {
    const auto trimmed = utils::Trim(line);
    std::vector<std::string> cells;
    std::string cell;
    std::size_t spaces = 0;
    for (char c : trimmed) {
        if (c == ' ') {
            ++spaces;
            continue;
        }
        if (spaces >= 2) {
            cells.push_back(cell);
            cell.clear();
        } else if (spaces == 1) {
            cell.push_back(' ');
        }
        spaces = 0;
        cell.push_back(c);
    }
    if (!cell.empty()) {
        cells.push_back(cell);
    }
    return cells;
}

bool IsSeparatorRow(const std::vector<std::string>& cells) {
    if (cells.empty()) {
        return false;
    }
    for (const auto& cell : cells) {
        auto body = cell;
        if (!body.empty() && body.front() == ':') {
            body.erase(0, 1);
        }
        if (!body.empty() && body.back() == ':') {
            body.pop_back();
        }
        if (body.empty() || body.find_first_not_of('-') != std::string::npos) {
            return false;
        }
    }
    return true;
}

std::optional<TableData> ParseTable(const std::vector<std::string>& lines, Separator separator) {
    std::vector<std::vector<std::string>> parsed;
    for (const auto& line : lines) {
        std::vector<std::string> cells;
        switch (separator) {
            case Separator::kPipe: cells = SplitPipeRow(line); break;
            case Separator::kTab: cells = SplitTabRow(line); break;
            case Separator::kSpaces: cells = SplitSpaceRow(line); break;
        }
        if (separator == Separator::kPipe && IsSeparatorRow(cells)) {
            continue;
        }
        parsed.push_back(std::move(cells));
    }
    if (parsed.size() < 2) {
        return std::nullopt;
    }

    TableData table;
    table.headers = parsed.front();
    const std::size_t data_rows = parsed.size() - 1;

    if (separator == Separator::kSpaces) {
        // pandas leaves the index column without a header.
        const auto widened = std::count_if(parsed.begin() + 1, parsed.end(), [&table](const auto& row) {
            return row.size() == table.headers.size() + 1;
        });
        if (static_cast<std::size_t>(widened) * 2 > data_rows) {
            table.headers.insert(table.headers.begin(), "");
        }
    }
    if (table.headers.size() < 2) {
        return std::nullopt;
    }

    for (std::size_t i = 1; i < parsed.size(); ++i) {
        if (parsed[i].size() == table.headers.size()) {
            table.rows.push_back(std::move(parsed[i]));
        }
    }
    if (table.rows.empty() || table.rows.size() * 2 < data_rows) {
        return std::nullopt;
    }
    return table;
}

bool AllContain(const std::vector<std::string>& lines, char c) {
    return std::all_of(lines.begin(), lines.end(), [c](const std::string& line) {
        return line.find(c) != std::string::npos;
    });
}

bool IsFence(const std::string& line) {
    return utils::StartsWith(utils::Trim(line), "```");
}

}  // namespace

std::optional<ContentBlock> ClassifyTable(const std::string& text) {
    const auto lines = NonEmptyLines(text);
    if (lines.size() < 2) {
        return std::nullopt;
    }
    if (std::any_of(lines.begin(), lines.end(), IsFence)) {
        return std::nullopt;
    }

    std::optional<TableData> table;
    if (AllContain(lines, '|')) {
        table = ParseTable(lines, Separator::kPipe);
    } else if (AllContain(lines, '\t')) {
        table = ParseTable(lines, Separator::kTab);
    } else {
        table = ParseTable(lines, Separator::kSpaces);
    }
    if (!table) {
        return std::nullopt;
    }
    ContentBlock block;
    block.kind = BlockKind::kTable;
    block.raw = text;
    block.structured.emplace<TableData>(std::move(*table));
    return block;
}

std::optional<ContentBlock> ClassifyCode(const std::string& text) {
    const auto lines = utils::SplitLines(text);
    for (std::size_t open = 0; open < lines.size(); ++open) {
        if (!IsFence(lines[open])) {
            continue;
        }
        for (std::size_t close = open + 1; close < lines.size(); ++close) {
            if (!IsFence(lines[close])) {
                continue;
            }
            CodeData code;
            auto tag = utils::Trim(utils::Trim(lines[open]).substr(3));
            code.language = tag.substr(0, tag.find_first_of(" \t"));
            std::vector<std::string> body(lines.begin() + static_cast<std::ptrdiff_t>(open) + 1,
                                          lines.begin() + static_cast<std::ptrdiff_t>(close));
            code.code = utils::Join(body, "\n");

            ContentBlock block;
            block.kind = BlockKind::kCode;
            block.raw = text;
            block.structured.emplace<CodeData>(std::move(code));
            return block;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<ContentBlock> ClassifyJson(const std::string& text) {
    const auto trimmed = utils::Trim(text);
    if (trimmed.empty() || (trimmed.front() != '{' && trimmed.front() != '[')) {
        return std::nullopt;
    }
    auto parsed = nlohmann::json::parse(trimmed, nullptr, false);
    if (parsed.is_discarded() || !(parsed.is_object() || parsed.is_array())) {
        return std::nullopt;
    }
    ContentBlock block;
    block.kind = BlockKind::kJson;
    block.raw = text;
    block.structured.emplace<nlohmann::json>(std::move(parsed));
    return block;
}

std::optional<ContentBlock> ClassifyList(const std::string& text) {
    static const std::regex item(R"(^\s*(\d+[.)]|[-*]|\xE2\x80\xA2)\s+(.*\S)\s*$)");
    const auto lines = NonEmptyLines(text);
    if (lines.empty()) {
        return std::nullopt;
    }

    ListData list;
    for (const auto& line : lines) {
        if (line.size() > kMaxRegexLine) {
            return std::nullopt;
        }
        std::smatch match;
        if (std::regex_match(line, match, item)) {
            if (list.items.empty()) {
                list.ordered = std::isdigit(static_cast<unsigned char>(match[1].str().front())) != 0;
            }
            list.items.push_back(match[2].str());
            continue;
        }
        const bool indented = line.front() == ' ' || line.front() == '\t';
        if (!indented || list.items.empty()) {
            return std::nullopt;
        }
        list.items.back() += " " + utils::Trim(line);
    }

    ContentBlock block;
    block.kind = BlockKind::kList;
    block.raw = text;
    block.structured.emplace<ListData>(std::move(list));
    return block;
}

std::optional<ContentBlock> ClassifyQuote(const std::string& text) {
    const auto lines = NonEmptyLines(text);
    if (lines.empty()) {
        return std::nullopt;
    }

    QuoteData quote;
    const bool prefixed = std::all_of(lines.begin(), lines.end(), [](const std::string& line) {
        return utils::StartsWith(utils::Trim(line), ">");
    });
    if (prefixed) {
        std::vector<std::string> body;
        for (const auto& line : lines) {
            auto stripped = utils::Trim(line).substr(1);
            if (!stripped.empty() && stripped.front() == ' ') {
                stripped.erase(0, 1);
            }
            body.push_back(stripped);
        }
        quote.text = utils::Join(body, "\n");
    } else {
        const auto trimmed = utils::Trim(text);
        static const std::vector<std::pair<std::string, std::string>> kPairs = {
            {"\"", "\""}, {"'", "'"}, {"\xE2\x80\x9C", "\xE2\x80\x9D"}
        };
        bool wrapped = false;
        for (const auto& [open, close] : kPairs) {
            if (trimmed.size() >= open.size() + close.size() + 1 &&
                utils::StartsWith(trimmed, open) && utils::EndsWith(trimmed, close)) {
                quote.text = trimmed.substr(open.size(), trimmed.size() - open.size() - close.size());
                wrapped = true;
                break;
            }
        }
        if (!wrapped) {
            return std::nullopt;
        }
    }

    ContentBlock block;
    block.kind = BlockKind::kQuote;
    block.raw = text;
    block.structured.emplace<QuoteData>(std::move(quote));
    return block;
}

ContentClassifier::ContentClassifier() {
    rules_.push_back({"table", ClassifyTable});
    rules_.push_back({"code", ClassifyCode});
    rules_.push_back({"json", ClassifyJson});
    rules_.push_back({"list", ClassifyList});
    rules_.push_back({"quote", ClassifyQuote});
}

ContentBlock ContentClassifier::Classify(const std::string& text) const {
    for (const auto& named : rules_) {
        try {
            if (auto block = named.rule(text)) {
                block->raw = text;
                return std::move(*block);
            }
        } catch (const std::exception& ex) {
            utils::LogWarn("result", "classifier rule '" + named.name + "' failed: " + ex.what());
        }
    }
    return ContentBlock::Text(text);
}

void ContentClassifier::InsertRule(std::size_t position, std::string name, Rule rule) {
    position = std::min(position, rules_.size());
    rules_.insert(rules_.begin() + static_cast<std::ptrdiff_t>(position),
                  NamedRule{std::move(name), std::move(rule)});
}

bool ContentClassifier::InsertRuleBefore(const std::string& before, std::string name, Rule rule) {
    auto it = std::find_if(rules_.begin(), rules_.end(), [&before](const NamedRule& named) {
        return named.name == before;
    });
    const bool found = it != rules_.end();
    rules_.insert(it, NamedRule{std::move(name), std::move(rule)});
    return found;
}

std::vector<std::string> ContentClassifier::RuleNames() const {
    std::vector<std::string> names;
    for (const auto& named : rules_) {
        names.push_back(named.name);
    }
    return names;
}

}  // namespace anabox::content
