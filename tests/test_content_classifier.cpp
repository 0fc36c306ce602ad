#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "content/content_classifier.hpp"

namespace anabox::content {
namespace {

TEST(ContentClassifierTest, MarkdownPipeTable) {
    ContentClassifier classifier;
    const std::string text = "| a | b |\n| 1 | 2 |\n| 3 | 4 |";
    const auto block = classifier.Classify(text);
    ASSERT_EQ(block.kind, BlockKind::kTable);
    EXPECT_EQ(block.raw, text);
    const auto* table = block.Table();
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->headers, (std::vector<std::string>{"a", "b"}));
    ASSERT_EQ(table->rows.size(), 2u);
    EXPECT_EQ(table->rows[1], (std::vector<std::string>{"3", "4"}));
}

TEST(ContentClassifierTest, SkipsMarkdownSeparatorRow) {
    const auto block = ClassifyTable("| name | score |\n|:-----|------:|\n| ann | 3 |\n");
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block->Table()->rows.size(), 1u);
}

TEST(ContentClassifierTest, PandasFrameGetsIndexHeader) {
    const auto block = ClassifyTable("   city  total\n0  Oslo     12\n1  Rome      7\n");
    ASSERT_TRUE(block.has_value());
    const auto* table = block->Table();
    EXPECT_EQ(table->headers, (std::vector<std::string>{"", "city", "total"}));
    EXPECT_EQ(table->rows[0], (std::vector<std::string>{"0", "Oslo", "12"}));
}

TEST(ContentClassifierTest, TabSeparatedTable) {
    const auto block = ClassifyTable("x\ty\n1\t2\n");
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block->Table()->headers, (std::vector<std::string>{"x", "y"}));
}

TEST(ContentClassifierTest, ProseIsNotATable) {
    EXPECT_FALSE(ClassifyTable("The mean is 4.2\nThe median is 3").has_value());
    EXPECT_FALSE(ClassifyTable("| only one line |").has_value());
}

TEST(ContentClassifierTest, TableSurvivesCanonicalReserialization) {
    TableData original;
    original.headers = {"metric", "value"};
    original.rows = {{"a|b", "1"}, {"mean", "2.5"}};
    const auto block = ClassifyTable(SerializeTable(original));
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block->Table()->headers, original.headers);
    EXPECT_EQ(block->Table()->rows, original.rows);
}

TEST(ContentClassifierTest, FencedCode) {
    ContentClassifier classifier;
    const auto block = classifier.Classify("Result:\n```sql\nSELECT 1;\n```\n");
    ASSERT_EQ(block.kind, BlockKind::kCode);
    EXPECT_EQ(block.Code()->language, "sql");
    EXPECT_EQ(block.Code()->code, "SELECT 1;");
}

TEST(ContentClassifierTest, JsonObjectsAndArraysOnly) {
    ContentClassifier classifier;
    const auto object = classifier.Classify("{\"mean\": 2.5, \"n\": 4}\n");
    ASSERT_EQ(object.kind, BlockKind::kJson);
    EXPECT_EQ((*object.Json())["n"], 4);

    EXPECT_EQ(classifier.Classify("2\n").kind, BlockKind::kText);
    EXPECT_EQ(classifier.Classify("\"hello\"").kind, BlockKind::kQuote);
    EXPECT_EQ(classifier.Classify("{broken").kind, BlockKind::kText);
}

TEST(ContentClassifierTest, OrderedAndBulletLists) {
    ContentClassifier classifier;
    const auto ordered = classifier.Classify("1. load data\n2) clean it\n   and dedupe\n");
    ASSERT_EQ(ordered.kind, BlockKind::kList);
    EXPECT_TRUE(ordered.List()->ordered);
    EXPECT_EQ(ordered.List()->items, (std::vector<std::string>{"load data", "clean it and dedupe"}));

    const auto bullets = classifier.Classify("- a\n* b\n");
    ASSERT_EQ(bullets.kind, BlockKind::kList);
    EXPECT_FALSE(bullets.List()->ordered);
}

TEST(ContentClassifierTest, Quotes) {
    ContentClassifier classifier;
    const auto prefixed = classifier.Classify("> first\n> second\n");
    ASSERT_EQ(prefixed.kind, BlockKind::kQuote);
    EXPECT_EQ(prefixed.Quote()->text, "first\nsecond");

    const auto curly = classifier.Classify("\xE2\x80\x9C" "Data is king" "\xE2\x80\x9D");
    ASSERT_EQ(curly.kind, BlockKind::kQuote);
    EXPECT_EQ(curly.Quote()->text, "Data is king");
}

TEST(ContentClassifierTest, PlainTextKeepsRawExactly) {
    ContentClassifier classifier;
    const auto block = classifier.Classify("2\n");
    EXPECT_EQ(block.kind, BlockKind::kText);
    EXPECT_EQ(block.raw, "2\n");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(block.structured));
}

TEST(ContentClassifierTest, InsertedRuleRunsBeforeDefaults) {
    ContentClassifier classifier;
    const bool found = classifier.InsertRuleBefore("json", "metric", [](const std::string& text) {
        std::optional<ContentBlock> block;
        if (text.rfind("METRIC ", 0) == 0) {
            block = ContentBlock::Text(text);
            block->kind = BlockKind::kQuote;
            block->structured.emplace<QuoteData>(QuoteData{text.substr(7)});
        }
        return block;
    });
    EXPECT_TRUE(found);
    EXPECT_EQ(classifier.RuleNames(), (std::vector<std::string>{"table", "code", "metric", "json", "list", "quote"}));
    const auto block = classifier.Classify("METRIC accuracy");
    ASSERT_EQ(block.kind, BlockKind::kQuote);
    EXPECT_EQ(block.Quote()->text, "accuracy");
}

TEST(ContentClassifierTest, ThrowingRuleIsSkipped) {
    ContentClassifier classifier;
    classifier.InsertRule(0, "broken", [](const std::string&) -> std::optional<ContentBlock> {
        throw std::runtime_error("boom");
    });
    const auto block = classifier.Classify("| a | b |\n| 1 | 2 |");
    EXPECT_EQ(block.kind, BlockKind::kTable);
}

}  // namespace
}  // namespace anabox::content
