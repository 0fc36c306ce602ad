#pragma once

#include <atomic>
#include <string>

#include "history/execution_journal.hpp"
#include "nlohmann/json.hpp"
#include "pipeline/execution_pipeline.hpp"

namespace anabox::gateway {

struct ApiResponse {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
};

// Request handling behind the HTTP routes, independent of the HTTP library.
class GatewayApi {
public:
    // journal may be nullptr; /history then answers 404.
    GatewayApi(pipeline::ExecutionPipeline& pipeline, history::ExecutionJournal* journal);

    // {"code": "...", "correlation_id"?, "session_id"?, "context"?, "html"?}
    ApiResponse Execute(const std::string& body);
    // {"correlation_id": "..."}
    ApiResponse Cancel(const std::string& body);
    ApiResponse History(const std::string& limit, const std::string& session_id) const;
    ApiResponse Health() const;

private:
    std::string NextCorrelationId();

    pipeline::ExecutionPipeline& pipeline_;
    history::ExecutionJournal* journal_;
    std::atomic<unsigned long long> counter_{0};
};

nlohmann::json ToJson(const pipeline::SubmissionResult& result, bool include_html);
// Captured output may hold invalid UTF-8; it is replaced with U+FFFD instead of throwing.
std::string Serialize(const nlohmann::json& body);
nlohmann::json ToJson(const history::ExecutionRecord& record);

}  // namespace anabox::gateway
