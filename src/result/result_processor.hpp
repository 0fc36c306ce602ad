#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "content/content_block.hpp"
#include "content/content_classifier.hpp"
#include "sandbox/sandbox_types.hpp"

namespace anabox::result {

struct ProcessorOptions {
    std::size_t max_artifact_bytes = 16 * 1024 * 1024;
    std::size_t stderr_tail_bytes = 2000;
};

// Turns an outcome's captured stdout into ordered content blocks. Process()
// does not modify the outcome, so running it twice yields the same blocks.
class ResultProcessor {
public:
    explicit ResultProcessor(ProcessorOptions options = {},
                             content::ContentClassifier classifier = content::ContentClassifier());

    std::vector<content::ContentBlock> Process(const sandbox::ExecutionOutcome& outcome) const;

    content::ContentClassifier& Classifier() { return classifier_; }
    const ProcessorOptions& Options() const { return options_; }

private:
    ProcessorOptions options_;
    content::ContentClassifier classifier_;
};

// Plain-language summary of a non-successful outcome, ending with the tail of
// stderr when there is one.
std::string DescribeFailure(const sandbox::ExecutionOutcome& outcome, std::size_t stderr_tail_bytes);

}  // namespace anabox::result
