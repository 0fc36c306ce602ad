#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "gateway/gateway_api.hpp"
#include "httplib.h"

namespace anabox::gateway {

// POST /execute, POST /cancel, GET /history, GET /health.
class GatewayServer {
public:
    GatewayServer(GatewayApi& api, config::GatewayConfig config);

    // Blocks until Stop() is called. False when the socket cannot be bound.
    bool Listen();
    void Stop();

private:
    void RegisterRoutes();

    GatewayApi& api_;
    config::GatewayConfig config_;
    httplib::Server server_;
};

}  // namespace anabox::gateway
