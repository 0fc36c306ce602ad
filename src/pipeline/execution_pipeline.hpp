#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "content/content_block.hpp"
#include "history/execution_journal.hpp"
#include "normalizer/code_normalizer.hpp"
#include "result/result_processor.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "sandbox/sandbox_types.hpp"
#include "storage/artifact_store.hpp"

namespace anabox::pipeline {

struct SubmissionResult {
    std::string correlation_id;
    bool rejected = false;
    std::optional<std::string> rejection_reason;
    sandbox::ExecutionStatus status = sandbox::ExecutionStatus::kRuntimeError;
    std::vector<content::ContentBlock> blocks;
};

// Called for every submission that did not succeed, rejections included.
using FailureReporter = std::function<void(const std::string& correlation_id,
                                           sandbox::ExecutionStatus status,
                                           const std::string& truncated_stderr)>;

// Normalizer -> Supervisor -> Result Processor -> Classifier, then artifact
// upload. The only entry point for callers outside the core.
class ExecutionPipeline {
public:
    ExecutionPipeline(sandbox::ResourceLimits limits,
                      sandbox::SandboxExecutor& executor,
                      storage::ArtifactStore& store,
                      result::ProcessorOptions options = {});

    // Never throws. Image blocks come back with a URL instead of bytes.
    SubmissionResult SubmitCodeForExecution(const std::string& raw_llm_text,
                                            const std::string& working_context,
                                            const std::string& correlation_id,
                                            const std::string& session_id = "");

    bool Cancel(const std::string& correlation_id);

    void SetFailureReporter(FailureReporter reporter) { failure_reporter_ = std::move(reporter); }
    // Not owned; nullptr disables recording.
    void SetJournal(history::ExecutionJournal* journal) { journal_ = journal; }

    const normalizer::CodeNormalizer& Normalizer() const { return normalizer_; }
    result::ResultProcessor& Processor() { return processor_; }
    sandbox::SandboxExecutor& Executor() { return executor_; }
    const sandbox::ResourceLimits& Limits() const { return limits_; }

private:
    void StoreArtifacts(std::vector<content::ContentBlock>& blocks,
                        const std::string& session_id,
                        const std::string& correlation_id);
    void ReportFailure(const std::string& correlation_id,
                       sandbox::ExecutionStatus status,
                       const std::string& truncated_stderr);
    void Journal(const history::ExecutionRecord& record);

    sandbox::ResourceLimits limits_;
    normalizer::CodeNormalizer normalizer_;
    sandbox::SandboxExecutor& executor_;
    storage::ArtifactStore& store_;
    result::ResultProcessor processor_;
    FailureReporter failure_reporter_;
    history::ExecutionJournal* journal_ = nullptr;
};

}  // namespace anabox::pipeline
