#pragma once

#include <set>
#include <string>
#include <vector>

#include "normalizer/code_candidate.hpp"

namespace anabox::normalizer {

// Turns a raw LLM completion into executable Python or a rejection.
// Pure: the result depends only on the input and the allow-list.
class CodeNormalizer {
public:
    explicit CodeNormalizer(std::set<std::string> allowed_imports);
    explicit CodeNormalizer(const std::vector<std::string>& allowed_imports);

    CodeCandidate Normalize(const std::string& raw_text) const;

    const std::set<std::string>& AllowedImports() const { return allowed_imports_; }

private:
    std::set<std::string> allowed_imports_;
};

// Exposed for tests.
std::string ExtractCodeBody(const std::string& raw_text);
std::vector<std::string> ImportedModules(const std::string& statement);

}  // namespace anabox::normalizer
