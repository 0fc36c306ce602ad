#include <gtest/gtest.h>

#include <string>

#include "content/content_classifier.hpp"
#include "content/html_renderer.hpp"

namespace anabox::content {
namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST(HtmlRendererTest, EscapesPlainText) {
    const auto html = RenderHtml(ContentBlock::Text("<script>alert('x')</script> & more"));
    EXPECT_EQ(html,
              "<div class=\"anabox-block anabox-text\"><pre>&lt;script&gt;alert(&#39;x&#39;)&lt;/script&gt;"
              " &amp; more</pre></div>");
}

TEST(HtmlRendererTest, RendersTableCellsEscaped) {
    const auto block = ClassifyTable("| name | note |\n| <b> | a&b |");
    ASSERT_TRUE(block.has_value());
    const auto html = RenderHtml(*block);
    EXPECT_TRUE(Contains(html, "<thead><tr><th>name</th><th>note</th></tr></thead>"));
    EXPECT_TRUE(Contains(html, "<td>&lt;b&gt;</td><td>a&amp;b</td>"));
}

TEST(HtmlRendererTest, RendersCodeWithLanguageClass) {
    const auto block = ClassifyCode("```python\nif a < b:\n    pass\n```");
    ASSERT_TRUE(block.has_value());
    EXPECT_TRUE(Contains(RenderHtml(*block),
                         "<pre><code class=\"language-python\">if a &lt; b:\n    pass</code></pre>"));
}

TEST(HtmlRendererTest, RendersListsAndQuotes) {
    EXPECT_TRUE(Contains(RenderHtml(*ClassifyList("1. one\n2. two")), "<ol><li>one</li><li>two</li></ol>"));
    EXPECT_TRUE(Contains(RenderHtml(*ClassifyList("- x")), "<ul><li>x</li></ul>"));
    EXPECT_TRUE(Contains(RenderHtml(*ClassifyQuote("> said \"hi\"")),
                         "<blockquote>said &quot;hi&quot;</blockquote>"));
}

TEST(HtmlRendererTest, ImageWithSafeUrl) {
    ImageData image;
    image.mime = "image/png";
    image.url = "https://cdn.example.com/a.png?x=1&y=2";
    const auto html = RenderHtml(ContentBlock::Image(image));
    EXPECT_TRUE(Contains(html, "<img src=\"https://cdn.example.com/a.png?x=1&amp;y=2\""));
}

TEST(HtmlRendererTest, ImageWithUnsafeUrlIsNotEmbedded) {
    ImageData image;
    image.mime = "image/png";
    image.url = "javascript:alert(1)";
    const auto html = RenderHtml(ContentBlock::Image(image));
    EXPECT_FALSE(Contains(html, "<img"));
    EXPECT_TRUE(Contains(html, "anabox-image-unavailable"));
}

TEST(HtmlRendererTest, InlineRasterBytesBecomeDataUri) {
    ImageData image;
    image.mime = "image/png";
    image.bytes = "abc";
    image.size = 3;
    EXPECT_TRUE(Contains(RenderHtml(ContentBlock::Image(image)), "src=\"data:image/png;base64,YWJj\""));

    image.mime = "image/svg+xml";
    EXPECT_FALSE(Contains(RenderHtml(ContentBlock::Image(image)), "<img"));
}

TEST(HtmlRendererTest, SafeUrlRules) {
    EXPECT_TRUE(IsSafeImageUrl("http://x/y.png"));
    EXPECT_TRUE(IsSafeImageUrl("file:///tmp/a.png"));
    EXPECT_TRUE(IsSafeImageUrl("artifacts/s1/a.png"));
    EXPECT_FALSE(IsSafeImageUrl("data:image/png;base64,AAAA"));
    EXPECT_FALSE(IsSafeImageUrl("//evil.example.com/a.png"));
    EXPECT_FALSE(IsSafeImageUrl(""));
}

TEST(HtmlRendererTest, RendersSequenceInOrder) {
    const std::vector<ContentBlock> blocks = {ContentBlock::Text("one"), ContentBlock::Text("two")};
    const auto html = RenderHtml(blocks);
    EXPECT_LT(html.find("one"), html.find("two"));
}

}  // namespace
}  // namespace anabox::content
