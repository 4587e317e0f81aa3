#ifndef TYPHON_SERVER_MIDDLEWARE_REQUEST_LOGGER_HPP
#define TYPHON_SERVER_MIDDLEWARE_REQUEST_LOGGER_HPP

#include <crow.h>
#include <chrono>
#include <string>

#include "../models/api.hpp"
#include "atom/log/spdlog_logger.hpp"

namespace typhon::server::middleware {

/**
 * @brief Request logging middleware
 *
 * Tags every request with an X-Request-ID and logs its status and duration.
 */
struct RequestLogger {
    struct context {
        std::chrono::steady_clock::time_point start_time;
        std::string request_id;
    };

    void before_handle(crow::request& req, crow::response& /*res*/,
                       context& ctx) {
        ctx.start_time = std::chrono::steady_clock::now();
        ctx.request_id = models::api::generateRequestId();
        LOG_INFO("Incoming request: {} {} (request_id: {})",
                 crow::method_name(req.method), req.url, ctx.request_id);
    }

    void after_handle(crow::request& req, crow::response& res, context& ctx) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.start_time);
        res.set_header("X-Request-ID", ctx.request_id);
        LOG_INFO("Request completed: {} {} - Status: {} - Duration: {}ms",
                 crow::method_name(req.method), req.url, res.code, duration.count());
    }
};

}  // namespace typhon::server::middleware

#endif  // TYPHON_SERVER_MIDDLEWARE_REQUEST_LOGGER_HPP
