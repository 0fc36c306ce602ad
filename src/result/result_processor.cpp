#include "result/result_processor.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "artifacts/marker_protocol.hpp"
#include "utils/common.hpp"
#include "utils/encoding.hpp"
#include "utils/logging.hpp"

namespace anabox::result {
namespace {

namespace fs = std::filesystem;

struct Resolution {
    enum class Kind {
        kLoaded,
        kOutsideScratch,
        kFailed
    };

    Kind kind = Kind::kFailed;
    std::string bytes;
    std::string error;
};

bool IsInside(const fs::path& path, const fs::path& root) {
    const auto relative = path.lexically_relative(root);
    if (relative.empty() || relative == ".") {
        return false;
    }
    return *relative.begin() != "..";
}

Resolution ResolveReference(const std::string& reference,
                            const sandbox::ScratchDirectory& scratch,
                            std::size_t max_bytes) {
    Resolution resolution;
    if (scratch.Empty()) {
        resolution.kind = Resolution::Kind::kOutsideScratch;
        return resolution;
    }

    std::error_code ec;
    const auto work = fs::weakly_canonical(scratch.WorkDir(), ec);
    if (ec) {
        resolution.error = "scratch directory is unavailable";
        return resolution;
    }
    fs::path path(reference);
    if (path.is_relative()) {
        path = scratch.WorkDir() / path;
    }
    const auto resolved = fs::weakly_canonical(path, ec);
    if (ec || !IsInside(resolved, work)) {
        resolution.kind = Resolution::Kind::kOutsideScratch;
        return resolution;
    }

    if (!fs::is_regular_file(resolved, ec)) {
        resolution.error = "file not found";
        return resolution;
    }
    const auto size = fs::file_size(resolved, ec);
    if (ec) {
        resolution.error = "file is unreadable";
        return resolution;
    }
    if (size > max_bytes) {
        resolution.error = "file is too large (" + std::to_string(size) + " bytes, limit " +
                           std::to_string(max_bytes) + ")";
        return resolution;
    }

    std::ifstream input(resolved, std::ios::binary);
    if (!input.is_open()) {
        resolution.error = "file is unreadable";
        return resolution;
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    if (input.bad()) {
        resolution.error = "file is unreadable";
        return resolution;
    }
    resolution.kind = Resolution::Kind::kLoaded;
    resolution.bytes = oss.str();
    return resolution;
}

content::ContentBlock MakeImage(const artifacts::ArtifactMarker& marker, std::string bytes) {
    content::ImageData image;
    image.mime = marker.mime;
    image.size = bytes.size();
    image.sha256 = utils::Sha256Hex(bytes);
    image.sequence_no = marker.sequence_no;
    image.bytes = std::move(bytes);
    return content::ContentBlock::Image(std::move(image));
}

}  // namespace

ResultProcessor::ResultProcessor(ProcessorOptions options, content::ContentClassifier classifier)
    : options_(options), classifier_(std::move(classifier)) {}

std::vector<content::ContentBlock> ResultProcessor::Process(const sandbox::ExecutionOutcome& outcome) const {
    std::vector<content::ContentBlock> blocks;
    std::string pending;

    auto flush_text = [this, &blocks, &pending]() {
        if (!utils::IsBlank(pending)) {
            blocks.push_back(classifier_.Classify(pending));
        }
        pending.clear();
    };

    for (const auto& segment : artifacts::SplitStream(outcome.raw_stdout)) {
        if (!segment.IsMarker()) {
            pending += segment.text;
            continue;
        }
        const auto& marker = segment.marker;
        if (marker.kind == artifacts::MarkerKind::kImageInline) {
            flush_text();
            blocks.push_back(MakeImage(marker, marker.payload));
            continue;
        }

        auto resolution = ResolveReference(marker.payload, outcome.scratch, options_.max_artifact_bytes);
        switch (resolution.kind) {
            case Resolution::Kind::kOutsideScratch:
                utils::LogWarn("result", outcome.correlation_id + ": artifact reference outside the scratch directory");
                pending += segment.text;
                break;
            case Resolution::Kind::kFailed:
                flush_text();
                blocks.push_back(content::ContentBlock::Text(
                    "Artifact " + std::to_string(marker.sequence_no) + " (" + marker.payload +
                    ") could not be loaded: " + resolution.error));
                break;
            case Resolution::Kind::kLoaded:
                flush_text();
                blocks.push_back(MakeImage(marker, std::move(resolution.bytes)));
                break;
        }
    }
    flush_text();

    if (outcome.status == sandbox::ExecutionStatus::kSuccess) {
        if (blocks.empty()) {
            blocks.push_back(content::ContentBlock::Text("Execution completed with no output."));
        }
    } else {
        blocks.push_back(content::ContentBlock::Text(DescribeFailure(outcome, options_.stderr_tail_bytes)));
    }
    return blocks;
}

std::string DescribeFailure(const sandbox::ExecutionOutcome& outcome, std::size_t stderr_tail_bytes) {
    std::string message = "Execution " + std::string(sandbox::ToString(outcome.status));
    if (!outcome.detail.empty()) {
        message += ": " + outcome.detail;
    }
    if (outcome.output_truncated) {
        message += " (output was truncated)";
    }
    const auto stderr_text = utils::TrimRight(outcome.raw_stderr);
    if (!stderr_text.empty()) {
        message += "\n\n" + utils::TruncateTail(stderr_text, stderr_tail_bytes);
    }
    return message;
}

}  // namespace anabox::result
