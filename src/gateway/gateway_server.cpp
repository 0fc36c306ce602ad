#include "gateway/gateway_server.hpp"

#include "utils/logging.hpp"

namespace anabox::gateway {
namespace {

void Reply(httplib::Response& res, const ApiResponse& response) {
    res.status = response.status;
    res.set_content(Serialize(response.body), "application/json");
}

}  // namespace

GatewayServer::GatewayServer(GatewayApi& api, config::GatewayConfig config)
    : api_(api), config_(std::move(config)) {
    RegisterRoutes();
}

bool GatewayServer::Listen() {
    utils::LogInfo("gateway", "listening on " + config_.host + ":" + std::to_string(config_.port));
    const bool ok = server_.listen(config_.host, config_.port);
    if (!ok) {
        utils::LogError("gateway", "failed to listen on " + config_.host + ":" + std::to_string(config_.port));
    }
    return ok;
}

void GatewayServer::Stop() {
    server_.stop();
}

void GatewayServer::RegisterRoutes() {
    server_.Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
        Reply(res, api_.Execute(req.body));
    });
    server_.Post("/cancel", [this](const httplib::Request& req, httplib::Response& res) {
        Reply(res, api_.Cancel(req.body));
    });
    server_.Get("/history", [this](const httplib::Request& req, httplib::Response& res) {
        const auto limit = req.has_param("limit") ? req.get_param_value("limit") : std::string();
        const auto session = req.has_param("session_id") ? req.get_param_value("session_id") : std::string();
        Reply(res, api_.History(limit, session));
    });
    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        Reply(res, api_.Health());
    });
    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "internal error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "unknown exception";
        }
        utils::LogError("gateway", req.path + ": " + message);
        res.status = 500;
        res.set_content(Serialize(nlohmann::json({{"error", message}})), "application/json");
    });
}

}  // namespace anabox::gateway
