#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "content/content_block.hpp"

namespace anabox::content {

// First-match classification of one plain-text run. Rules are tried in
// order; text that no rule claims becomes a kText block. Rules never throw
// on malformed input, they decline with nullopt.
class ContentClassifier {
public:
    using Rule = std::function<std::optional<ContentBlock>(const std::string& text)>;

    struct NamedRule {
        std::string name;
        Rule rule;
    };

    // table, code, json, list, quote
    ContentClassifier();

    ContentBlock Classify(const std::string& text) const;

    void InsertRule(std::size_t position, std::string name, Rule rule);
    // Returns false (and appends) when `before` is not a known rule.
    bool InsertRuleBefore(const std::string& before, std::string name, Rule rule);
    std::vector<std::string> RuleNames() const;

private:
    std::vector<NamedRule> rules_;
};

std::optional<ContentBlock> ClassifyTable(const std::string& text);
std::optional<ContentBlock> ClassifyCode(const std::string& text);
std::optional<ContentBlock> ClassifyJson(const std::string& text);
std::optional<ContentBlock> ClassifyList(const std::string& text);
std::optional<ContentBlock> ClassifyQuote(const std::string& text);

}  // namespace anabox::content
