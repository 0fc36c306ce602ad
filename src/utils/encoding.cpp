#include "utils/encoding.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

#include <openssl/evp.h>
#include <openssl/sha.h>

namespace anabox::utils {
namespace {

bool IsBase64Char(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

}  // namespace

std::string Base64Encode(std::string_view bytes) {
    if (bytes.empty()) {
        return {};
    }
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() / 4 * 3 - 3)) {
        return {};
    }
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(bytes.data()),
        static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
}

std::optional<std::string> Base64Decode(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());
    for (unsigned char c : text) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            continue;
        }
        compact.push_back(static_cast<char>(c));
    }
    if (compact.empty() || compact.size() % 4 != 0) {
        return std::nullopt;
    }
    if (compact.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    std::size_t padding = 0;
    for (std::size_t i = 0; i < compact.size(); ++i) {
        const auto c = static_cast<unsigned char>(compact[i]);
        if (c == '=') {
            // Padding is only valid in the last two positions.
            if (i + 2 < compact.size()) {
                return std::nullopt;
            }
            ++padding;
            continue;
        }
        if (padding > 0 || !IsBase64Char(c)) {
            return std::nullopt;
        }
    }

    std::vector<unsigned char> out(compact.size() / 4 * 3 + 1);
    const int decoded = EVP_DecodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(compact.data()),
        static_cast<int>(compact.size()));
    if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<std::size_t>(decoded) - padding);
}

std::string Sha256Hex(std::string_view bytes) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), hash);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::string EscapeHtml(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(ch); break;
        }
    }
    return out;
}

}  // namespace anabox::utils
