#pragma once

#include <string>
#include <vector>

#include "content/content_block.hpp"

namespace anabox::content {

// Every literal fragment is HTML-escaped; raw text is never emitted as markup.
std::string RenderHtml(const ContentBlock& block);
std::string RenderHtml(const std::vector<ContentBlock>& blocks);

// http(s)://, file:// and relative URLs. Anything with another scheme
// (javascript:, data:, ...) is refused.
bool IsSafeImageUrl(const std::string& url);
bool IsRasterMime(const std::string& mime);

}  // namespace anabox::content
