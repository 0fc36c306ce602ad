#pragma once

#include <string>

namespace anabox::sandbox {

inline constexpr const char* kRunnerFileName = "runner.py";
inline constexpr const char* kCandidateFileName = "candidate.py";

// Python bootstrap that runs candidate.py with the import guard, the
// emit_image helpers and the matplotlib show hook installed. Limits are read
// from ANABOX_ALLOWED_IMPORTS and ANABOX_INLINE_MAX at startup.
const std::string& RunnerScript();

}  // namespace anabox::sandbox
