#include "content/content_block.hpp"

#include <sstream>

#include "utils/encoding.hpp"

namespace anabox::content {
namespace {

std::string EscapeCell(const std::string& cell) {
    std::string out;
    for (char c : cell) {
        if (c == '|') {
            out += "\\|";
        } else if (c == '\n') {
            out += ' ';
        } else {
            out.push_back(c);
        }
    }
    return out;
}

void WriteRow(std::ostringstream& oss, const std::vector<std::string>& cells) {
    oss << "|";
    for (const auto& cell : cells) {
        oss << " " << EscapeCell(cell) << " |";
    }
    oss << "\n";
}

}  // namespace

const char* ToString(BlockKind kind) {
    switch (kind) {
        case BlockKind::kTable: return "table";
        case BlockKind::kCode: return "code";
        case BlockKind::kJson: return "json";
        case BlockKind::kList: return "list";
        case BlockKind::kQuote: return "quote";
        case BlockKind::kImage: return "image";
        case BlockKind::kText: return "text";
    }
    return "text";
}

ContentBlock ContentBlock::Text(std::string raw) {
    ContentBlock block;
    block.kind = BlockKind::kText;
    block.raw = std::move(raw);
    return block;
}

ContentBlock ContentBlock::Image(ImageData image) {
    ContentBlock block;
    block.kind = BlockKind::kImage;
    block.raw = image.mime + " image (" + std::to_string(image.size) + " bytes)";
    block.structured.emplace<ImageData>(std::move(image));
    return block;
}

nlohmann::json ToJson(const ContentBlock& block) {
    nlohmann::json out;
    out["kind"] = ToString(block.kind);
    out["raw"] = block.raw;

    if (const auto* table = block.Table()) {
        out["structured"] = {{"headers", table->headers}, {"rows", table->rows}};
    } else if (const auto* code = block.Code()) {
        out["structured"] = {{"language", code->language}, {"code", code->code}};
    } else if (const auto* json = block.Json()) {
        out["structured"] = *json;
    } else if (const auto* list = block.List()) {
        out["structured"] = {{"ordered", list->ordered}, {"items", list->items}};
    } else if (const auto* quote = block.Quote()) {
        out["structured"] = {{"text", quote->text}};
    } else if (const auto* image = block.ImageInfo()) {
        nlohmann::json structured = {
            {"mime", image->mime},
            {"size", image->size},
            {"sha256", image->sha256},
            {"sequence", image->sequence_no}
        };
        if (!image->url.empty()) {
            structured["url"] = image->url;
        } else {
            structured["data"] = utils::Base64Encode(image->bytes);
        }
        out["structured"] = std::move(structured);
    } else {
        out["structured"] = nullptr;
    }
    return out;
}

nlohmann::json ToJson(const std::vector<ContentBlock>& blocks) {
    auto out = nlohmann::json::array();
    for (const auto& block : blocks) {
        out.push_back(ToJson(block));
    }
    return out;
}

std::string SerializeTable(const TableData& table) {
    std::ostringstream oss;
    WriteRow(oss, table.headers);
    oss << "|";
    for (std::size_t i = 0; i < table.headers.size(); ++i) {
        oss << " --- |";
    }
    oss << "\n";
    for (const auto& row : table.rows) {
        WriteRow(oss, row);
    }
    return oss.str();
}

}  // namespace anabox::content
