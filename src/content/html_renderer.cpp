#include "content/html_renderer.hpp"

#include <cctype>
#include <sstream>

#include "utils/common.hpp"
#include "utils/encoding.hpp"

namespace anabox::content {
namespace {

using utils::EscapeHtml;

void RenderTable(std::ostringstream& oss, const TableData& table) {
    oss << "<table class=\"anabox-table\"><thead><tr>";
    for (const auto& header : table.headers) {
        oss << "<th>" << EscapeHtml(header) << "</th>";
    }
    oss << "</tr></thead><tbody>";
    for (const auto& row : table.rows) {
        oss << "<tr>";
        for (const auto& cell : row) {
            oss << "<td>" << EscapeHtml(cell) << "</td>";
        }
        oss << "</tr>";
    }
    oss << "</tbody></table>";
}

void RenderImage(std::ostringstream& oss, const ImageData& image) {
    const auto alt = EscapeHtml(image.mime + " image");
    if (!image.url.empty()) {
        if (IsSafeImageUrl(image.url)) {
            oss << "<img src=\"" << EscapeHtml(image.url) << "\" alt=\"" << alt << "\">";
        } else {
            oss << "<span class=\"anabox-image-unavailable\">image not shown: unsupported URL "
                << EscapeHtml(image.url) << "</span>";
        }
        return;
    }
    if (!image.bytes.empty() && IsRasterMime(image.mime)) {
        oss << "<img src=\"data:" << EscapeHtml(image.mime) << ";base64,"
            << utils::Base64Encode(image.bytes) << "\" alt=\"" << alt << "\">";
        return;
    }
    oss << "<span class=\"anabox-image-unavailable\">image not shown: "
        << EscapeHtml(image.mime) << "</span>";
}

}  // namespace

bool IsSafeImageUrl(const std::string& url) {
    const auto lowered = utils::ToLower(utils::Trim(url));
    if (lowered.empty()) {
        return false;
    }
    if (utils::StartsWith(lowered, "http://") || utils::StartsWith(lowered, "https://") ||
        utils::StartsWith(lowered, "file://")) {
        return true;
    }
    if (utils::StartsWith(lowered, "//")) {
        return false;
    }
    // Relative: no scheme before the first path, query or fragment delimiter.
    const auto colon = lowered.find(':');
    const auto delimiter = lowered.find_first_of("/?#");
    return colon == std::string::npos || (delimiter != std::string::npos && delimiter < colon);
}

bool IsRasterMime(const std::string& mime) {
    const auto lowered = utils::ToLower(mime);
    return lowered == "image/png" || lowered == "image/jpeg" || lowered == "image/gif" ||
           lowered == "image/webp";
}

std::string RenderHtml(const ContentBlock& block) {
    std::ostringstream oss;
    oss << "<div class=\"anabox-block anabox-" << ToString(block.kind) << "\">";
    if (std::holds_alternative<std::monostate>(block.structured)) {
        oss << "<pre>" << EscapeHtml(block.raw) << "</pre></div>";
        return oss.str();
    }
    switch (block.kind) {
        case BlockKind::kTable:
            if (const auto* table = block.Table()) {
                RenderTable(oss, *table);
            }
            break;
        case BlockKind::kCode:
            if (const auto* code = block.Code()) {
                oss << "<pre><code";
                if (!code->language.empty()) {
                    oss << " class=\"language-" << EscapeHtml(code->language) << "\"";
                }
                oss << ">" << EscapeHtml(code->code) << "</code></pre>";
            }
            break;
        case BlockKind::kJson:
            if (const auto* json = block.Json()) {
                oss << "<pre>" << EscapeHtml(json->dump(2, ' ', false, nlohmann::json::error_handler_t::replace)) << "</pre>";
            }
            break;
        case BlockKind::kList:
            if (const auto* list = block.List()) {
                const char* tag = list->ordered ? "ol" : "ul";
                oss << "<" << tag << ">";
                for (const auto& item : list->items) {
                    oss << "<li>" << EscapeHtml(item) << "</li>";
                }
                oss << "</" << tag << ">";
            }
            break;
        case BlockKind::kQuote:
            if (const auto* quote = block.Quote()) {
                oss << "<blockquote>" << EscapeHtml(quote->text) << "</blockquote>";
            }
            break;
        case BlockKind::kImage:
            if (const auto* image = block.ImageInfo()) {
                RenderImage(oss, *image);
            }
            break;
        case BlockKind::kText:
            oss << "<pre>" << EscapeHtml(block.raw) << "</pre>";
            break;
    }
    oss << "</div>";
    return oss.str();
}

std::string RenderHtml(const std::vector<ContentBlock>& blocks) {
    std::string out;
    for (const auto& block : blocks) {
        out += RenderHtml(block);
        out += "\n";
    }
    return out;
}

}  // namespace anabox::content
