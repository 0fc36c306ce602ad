#pragma once

#include <optional>
#include <string>

namespace anabox::normalizer {

enum class CodeLanguage {
    kPython
};

inline const char* ToString(CodeLanguage language) {
    switch (language) {
        case CodeLanguage::kPython: return "python";
    }
    return "unknown";
}

struct CodeCandidate {
    std::string source;
    CodeLanguage language = CodeLanguage::kPython;
    bool rejected = false;
    std::optional<std::string> rejection_reason;
    // Set when the indentation repair pass changed the code.
    bool repaired = false;

    static CodeCandidate Accept(std::string source, bool repaired = false) {
        CodeCandidate candidate;
        candidate.source = std::move(source);
        candidate.repaired = repaired;
        return candidate;
    }

    static CodeCandidate Reject(std::string reason) {
        CodeCandidate candidate;
        candidate.rejected = true;
        candidate.rejection_reason = std::move(reason);
        return candidate;
    }
};

}  // namespace anabox::normalizer
