#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "normalizer/python_source.hpp"

namespace anabox::normalizer {

struct IndentationReport {
    bool valid = true;
    std::string message;
    std::size_t line = 0;
};

// Applies Python's block rules to the logical lines of a clean scan.
IndentationReport CheckIndentation(const ScanResult& scan);

// Best-effort re-indentation driven by statement starts:
//  - a line ending in ':' opens a block for the next line;
//  - return/pass/break/continue/raise close the current block;
//  - else/elif/except/finally align with their nearest compatible opener;
//  - a shallower original indent dedents to the matching earlier line.
// Lines inside multi-line strings are never touched. Uses 4 spaces per level.
std::vector<std::string> RepairIndentation(const ScanResult& scan);

}  // namespace anabox::normalizer
