#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace anabox::utils {

std::string Base64Encode(std::string_view bytes);

// Standard alphabet with padding. Whitespace is ignored; anything else that is
// not part of the alphabet makes the input invalid.
std::optional<std::string> Base64Decode(std::string_view text);

std::string Sha256Hex(std::string_view bytes);

std::string EscapeHtml(std::string_view text);

}  // namespace anabox::utils
