#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace anabox::content {

enum class BlockKind {
    kTable,
    kCode,
    kJson,
    kList,
    kQuote,
    kImage,
    kText
};

const char* ToString(BlockKind kind);

struct TableData {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
};

struct CodeData {
    std::string language;
    std::string code;
};

struct ListData {
    bool ordered = false;
    std::vector<std::string> items;
};

struct QuoteData {
    std::string text;
};

struct ImageData {
    std::string mime;
    // Decoded bytes until the artifact store replaces them with a URL.
    std::string bytes;
    std::string url;
    std::string sha256;
    std::size_t size = 0;
    int sequence_no = 0;
};

using StructuredContent =
    std::variant<std::monostate, TableData, CodeData, nlohmann::json, ListData, QuoteData, ImageData>;

struct ContentBlock {
    BlockKind kind = BlockKind::kText;
    std::string raw;
    StructuredContent structured;

    static ContentBlock Text(std::string raw);
    static ContentBlock Image(ImageData image);

    const TableData* Table() const { return std::get_if<TableData>(&structured); }
    const CodeData* Code() const { return std::get_if<CodeData>(&structured); }
    const nlohmann::json* Json() const { return std::get_if<nlohmann::json>(&structured); }
    const ListData* List() const { return std::get_if<ListData>(&structured); }
    const QuoteData* Quote() const { return std::get_if<QuoteData>(&structured); }
    const ImageData* ImageInfo() const { return std::get_if<ImageData>(&structured); }
    ImageData* MutableImage() { return std::get_if<ImageData>(&structured); }
};

// UI-facing form. Image bytes are only included (as base64) while no URL is set.
nlohmann::json ToJson(const ContentBlock& block);
nlohmann::json ToJson(const std::vector<ContentBlock>& blocks);

// Canonical markdown pipe table.
std::string SerializeTable(const TableData& table);

}  // namespace anabox::content
