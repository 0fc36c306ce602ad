#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "normalizer/indentation.hpp"
#include "normalizer/python_source.hpp"

namespace anabox::normalizer {
namespace {

IndentationReport Check(const std::vector<std::string>& lines) {
    return CheckIndentation(ScanPythonSource(lines));
}

std::vector<std::string> Repair(const std::vector<std::string>& lines) {
    return RepairIndentation(ScanPythonSource(lines));
}

TEST(PythonSourceTest, GroupsBracketContinuationsIntoOneLogicalLine) {
    const auto scan = ScanPythonSource({"total = sum([1,", "    2,", "    3])", "print(total)"});
    ASSERT_TRUE(scan.ok());
    ASSERT_EQ(scan.logical.size(), 2u);
    EXPECT_EQ(scan.logical[0].first, 0u);
    EXPECT_EQ(scan.logical[0].last, 2u);
    EXPECT_TRUE(scan.lines[1].continuation);
    EXPECT_EQ(scan.logical[1].first_token, "print");
}

TEST(PythonSourceTest, ReportsScanErrors) {
    EXPECT_EQ(ScanPythonSource({"x = 'abc"}).error, "unterminated string literal");
    EXPECT_EQ(ScanPythonSource({"s = \"\"\"abc"}).error, "unterminated triple-quoted string");
    const auto unmatched = ScanPythonSource({"x = 1", "y = 2)"});
    EXPECT_EQ(unmatched.error, "unmatched ')'");
    EXPECT_EQ(unmatched.error_line, 2u);
    EXPECT_EQ(ScanPythonSource({"x = 1 + \\"}).error, "unexpected end of input after line continuation");
}

TEST(PythonSourceTest, TabsAdvanceToNextMultipleOfEight) {
    EXPECT_EQ(IndentWidth("\tx"), 8);
    EXPECT_EQ(IndentWidth("  \tx"), 8);
    EXPECT_EQ(IndentWidth("    x"), 4);
}

TEST(IndentationCheckTest, AcceptsValidBlocks) {
    EXPECT_TRUE(Check({"def f(x):", "    if x:", "        return 1", "    return 2", "print(f(0))"}).valid);
}

TEST(IndentationCheckTest, ReportsPythonStyleErrors) {
    const auto missing = Check({"if x:", "y = 1"});
    EXPECT_FALSE(missing.valid);
    EXPECT_EQ(missing.message, "expected an indented block");
    EXPECT_EQ(missing.line, 2u);

    const auto unexpected = Check({"x = 1", "    y = 2"});
    EXPECT_EQ(unexpected.message, "unexpected indent");

    const auto unindent = Check({"if x:", "        a = 1", "    b = 2"});
    EXPECT_EQ(unindent.message, "unindent does not match any outer indentation level");
    EXPECT_EQ(unindent.line, 3u);

    const auto at_end = Check({"for i in range(3):"});
    EXPECT_EQ(at_end.message, "expected an indented block at end of input");
}

TEST(IndentationRepairTest, IndentsAfterColonAndDedentsAfterReturn) {
    const auto repaired = Repair({"def f(x):", "return x * 2", "print(f(3))"});
    EXPECT_EQ(repaired, (std::vector<std::string>{"def f(x):", "    return x * 2", "print(f(3))"}));
}

TEST(IndentationRepairTest, AlignsElseWithItsIf) {
    const auto repaired = Repair({"if ok:", "    a = 1", "    else:", "    a = 2"});
    EXPECT_EQ(repaired, (std::vector<std::string>{"if ok:", "    a = 1", "else:", "    a = 2"}));
}

TEST(IndentationRepairTest, KeepsTripleQuotedTextUntouched) {
    const auto repaired = Repair({"if True:", "text = \"\"\"", "  keep   this", "\"\"\""});
    ASSERT_EQ(repaired.size(), 4u);
    EXPECT_EQ(repaired[1], "    text = \"\"\"");
    EXPECT_EQ(repaired[2], "  keep   this");
    EXPECT_EQ(repaired[3], "\"\"\"");
}

TEST(IndentationRepairTest, ShiftsContinuationLinesWithTheirStatement) {
    const auto repaired = Repair({"for v in values:", "result = compute(v,", "                 v * 2)"});
    EXPECT_EQ(repaired[1], "    result = compute(v,");
    EXPECT_EQ(repaired[2], "                     v * 2)");
    EXPECT_TRUE(Check(repaired).valid);
}

TEST(IndentationRepairTest, CommentFollowsNextStatement) {
    const auto repaired = Repair({"while x:", "# decrement", "x -= 1"});
    EXPECT_EQ(repaired, (std::vector<std::string>{"while x:", "    # decrement", "    x -= 1"}));
}

}  // namespace
}  // namespace anabox::normalizer
