#include "pipeline/execution_pipeline.hpp"

#include <exception>

#include "artifacts/marker_protocol.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace anabox::pipeline {
namespace {

constexpr std::size_t kPreviewBytes = 2000;

// Marker payloads are base64 images; previews keep only the text around them.
std::string TextPreview(const std::string& raw_stdout) {
    std::string text;
    for (const auto& segment : artifacts::SplitStream(raw_stdout)) {
        if (segment.IsMarker()) {
            text += "[artifact " + std::to_string(segment.marker.sequence_no) + "]\n";
        } else {
            text += segment.text;
        }
    }
    return utils::Truncate(text, kPreviewBytes);
}

}  // namespace

ExecutionPipeline::ExecutionPipeline(sandbox::ResourceLimits limits,
                                     sandbox::SandboxExecutor& executor,
                                     storage::ArtifactStore& store,
                                     result::ProcessorOptions options)
    : limits_(std::move(limits)),
      normalizer_(limits_.allowed_imports),
      executor_(executor),
      store_(store),
      processor_(options) {}

SubmissionResult ExecutionPipeline::SubmitCodeForExecution(const std::string& raw_llm_text,
                                                           const std::string& working_context,
                                                           const std::string& correlation_id,
                                                           const std::string& session_id) {
    SubmissionResult result;
    result.correlation_id = correlation_id;
    history::ExecutionRecord record;
    record.correlation_id = correlation_id;
    record.session_id = session_id;

    try {
        auto candidate = normalizer_.Normalize(raw_llm_text);
        if (candidate.rejected) {
            const auto reason = candidate.rejection_reason.value_or("unknown reason");
            utils::LogInfo("pipeline", correlation_id + ": code rejected: " + reason);
            result.rejected = true;
            result.rejection_reason = reason;
            result.status = sandbox::ExecutionStatus::kRejected;
            result.blocks.push_back(content::ContentBlock::Text("Code was rejected: " + reason));

            record.status = sandbox::ToString(result.status);
            record.detail = reason;
            record.code = utils::Truncate(raw_llm_text, kPreviewBytes);
            record.block_count = 1;
            Journal(record);
            ReportFailure(correlation_id, result.status, reason);
            return result;
        }
        if (candidate.repaired) {
            utils::LogInfo("pipeline", correlation_id + ": indentation was repaired before execution");
        }
        record.code = candidate.source;

        sandbox::ExecutionRequest request;
        request.candidate = std::move(candidate);
        request.limits = limits_;
        request.correlation_id = correlation_id;
        request.working_context = working_context;

        // The outcome owns the scratch directory; it must outlive Process().
        const auto outcome = executor_.Execute(request);
        result.status = outcome.status;
        result.blocks = processor_.Process(outcome);
        StoreArtifacts(result.blocks, session_id, correlation_id);

        record.status = sandbox::ToString(outcome.status);
        record.detail = outcome.detail;
        record.exit_code = outcome.exit_code;
        record.duration_ms = outcome.duration.count();
        record.stdout_preview = TextPreview(outcome.raw_stdout);
        record.stderr_preview = utils::TruncateTail(outcome.raw_stderr, kPreviewBytes);
        record.block_count = static_cast<int>(result.blocks.size());
        Journal(record);

        if (outcome.status != sandbox::ExecutionStatus::kSuccess) {
            auto stderr_tail = utils::TruncateTail(utils::TrimRight(outcome.raw_stderr),
                                                   processor_.Options().stderr_tail_bytes);
            if (stderr_tail.empty()) {
                stderr_tail = outcome.detail;
            }
            ReportFailure(correlation_id, outcome.status, stderr_tail);
        }
    } catch (const std::exception& e) {
        utils::LogError("pipeline", correlation_id + ": execution failed: " + e.what());
        result.status = sandbox::ExecutionStatus::kRuntimeError;
        result.blocks.clear();
        result.blocks.push_back(content::ContentBlock::Text(
            std::string("Execution runtime_error: internal failure: ") + e.what()));
        ReportFailure(correlation_id, result.status, e.what());
    }
    return result;
}

bool ExecutionPipeline::Cancel(const std::string& correlation_id) {
    const bool cancelled = executor_.Cancel(correlation_id);
    utils::LogInfo("pipeline", correlation_id + (cancelled ? ": cancel requested" : ": nothing to cancel"));
    return cancelled;
}

void ExecutionPipeline::StoreArtifacts(std::vector<content::ContentBlock>& blocks,
                                       const std::string& session_id,
                                       const std::string& correlation_id) {
    for (auto& block : blocks) {
        auto* image = block.MutableImage();
        if (!image || image->bytes.empty()) {
            continue;
        }
        try {
            image->url = store_.Store(image->bytes, image->mime, session_id, correlation_id);
            image->bytes.clear();
            image->bytes.shrink_to_fit();
        } catch (const std::exception& e) {
            utils::LogWarn("pipeline", correlation_id + ": artifact " + std::to_string(image->sequence_no) +
                                           " could not be stored: " + e.what());
            block = content::ContentBlock::Text(
                "Artifact " + std::to_string(image->sequence_no) + " (" + image->mime +
                ", " + std::to_string(image->size) + " bytes) could not be stored: " + e.what());
        }
    }
}

void ExecutionPipeline::ReportFailure(const std::string& correlation_id,
                                      sandbox::ExecutionStatus status,
                                      const std::string& truncated_stderr) {
    if (!failure_reporter_) {
        return;
    }
    try {
        failure_reporter_(correlation_id, status, truncated_stderr);
    } catch (const std::exception& e) {
        utils::LogWarn("pipeline", correlation_id + ": failure reporter threw: " + e.what());
    }
}

void ExecutionPipeline::Journal(const history::ExecutionRecord& record) {
    if (!journal_) {
        return;
    }
    try {
        journal_->Record(record);
    } catch (const history::JournalError& e) {
        utils::LogWarn("pipeline", record.correlation_id + ": " + e.what());
    }
}

}  // namespace anabox::pipeline
