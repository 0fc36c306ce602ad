#include "gateway/gateway_api.hpp"

#include <algorithm>
#include <cctype>

#include "content/html_renderer.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace anabox::gateway {
namespace {

constexpr std::size_t kDefaultHistoryLimit = 20;
constexpr std::size_t kMaxHistoryLimit = 500;

ApiResponse Error(int status, const std::string& message) {
    ApiResponse response;
    response.status = status;
    response.body = {{"error", message}};
    return response;
}

std::string StringField(const nlohmann::json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

}  // namespace

GatewayApi::GatewayApi(pipeline::ExecutionPipeline& pipeline, history::ExecutionJournal* journal)
    : pipeline_(pipeline), journal_(journal) {}

ApiResponse GatewayApi::Execute(const std::string& body) {
    const auto request = nlohmann::json::parse(body, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        return Error(400, "request body must be a JSON object");
    }
    const auto code = StringField(request, "code");
    if (utils::IsBlank(code)) {
        return Error(400, "missing 'code'");
    }
    auto correlation_id = StringField(request, "correlation_id");
    if (correlation_id.empty()) {
        correlation_id = NextCorrelationId();
    }
    const bool include_html = request.contains("html") && request["html"].is_boolean() && request["html"].get<bool>();

    utils::LogInfo("gateway", "execute " + correlation_id);
    const auto result = pipeline_.SubmitCodeForExecution(
        code, StringField(request, "context"), correlation_id, StringField(request, "session_id"));

    ApiResponse response;
    response.body = ToJson(result, include_html);
    return response;
}

ApiResponse GatewayApi::Cancel(const std::string& body) {
    const auto request = nlohmann::json::parse(body, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        return Error(400, "request body must be a JSON object");
    }
    const auto correlation_id = StringField(request, "correlation_id");
    if (correlation_id.empty()) {
        return Error(400, "missing 'correlation_id'");
    }
    if (!pipeline_.Cancel(correlation_id)) {
        return Error(404, "no live execution for '" + correlation_id + "'");
    }
    ApiResponse response;
    response.body = {{"correlation_id", correlation_id}, {"cancelled", true}};
    return response;
}

ApiResponse GatewayApi::History(const std::string& limit, const std::string& session_id) const {
    if (!journal_) {
        return Error(404, "execution history is disabled");
    }
    std::size_t count = kDefaultHistoryLimit;
    if (!limit.empty()) {
        const bool numeric = std::all_of(limit.begin(), limit.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
        if (!numeric || limit.size() > 6) {
            return Error(400, "'limit' must be a positive integer");
        }
        count = std::min<std::size_t>(std::stoul(limit), kMaxHistoryLimit);
    }

    ApiResponse response;
    response.body = nlohmann::json::array();
    try {
        for (const auto& record : journal_->ListRecent(count, session_id)) {
            response.body.push_back(ToJson(record));
        }
    } catch (const history::JournalError& e) {
        utils::LogError("gateway", std::string("history query failed: ") + e.what());
        return Error(500, e.what());
    }
    return response;
}

ApiResponse GatewayApi::Health() const {
    const auto& pool = pipeline_.Executor().Pool();
    ApiResponse response;
    response.body = {
        {"status", "ok"},
        {"active_workers", pool.ActiveCount()},
        {"capacity", pool.Capacity()},
        {"history", journal_ != nullptr}
    };
    return response;
}

std::string GatewayApi::NextCorrelationId() {
    return "exec-" + std::to_string(utils::NowMs()) + "-" + std::to_string(++counter_);
}

nlohmann::json ToJson(const pipeline::SubmissionResult& result, bool include_html) {
    nlohmann::json json = {
        {"correlation_id", result.correlation_id},
        {"status", sandbox::ToString(result.status)},
        {"rejected", result.rejected},
        {"rejection_reason", result.rejection_reason ? nlohmann::json(*result.rejection_reason)
                                                     : nlohmann::json(nullptr)},
        {"blocks", content::ToJson(result.blocks)}
    };
    if (include_html) {
        json["html"] = content::RenderHtml(result.blocks);
    }
    return json;
}

std::string Serialize(const nlohmann::json& body) {
    return body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json ToJson(const history::ExecutionRecord& record) {
    return {
        {"correlation_id", record.correlation_id},
        {"session_id", record.session_id},
        {"status", record.status},
        {"detail", record.detail},
        {"code", record.code},
        {"exit_code", record.exit_code ? nlohmann::json(*record.exit_code) : nlohmann::json(nullptr)},
        {"duration_ms", record.duration_ms},
        {"stdout_preview", record.stdout_preview},
        {"stderr_preview", record.stderr_preview},
        {"block_count", record.block_count},
        {"created_at_ms", record.created_at_ms}
    };
}

}  // namespace anabox::gateway
