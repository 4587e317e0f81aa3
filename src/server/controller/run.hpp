/*
 * RunController.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef TYPHON_SERVER_CONTROLLER_RUN_HPP
#define TYPHON_SERVER_CONTROLLER_RUN_HPP

#include "../models/api.hpp"
#include "../utils/response.hpp"
#include "controller.hpp"

#include <memory>
#include <string>
#include <utility>

#include "atom/log/spdlog_logger.hpp"
#include "evaluator/assembler.hpp"
#include "evaluator/client.hpp"
#include "gateway/exception.hpp"
#include "gateway/normalizer.hpp"

namespace typhon::server::controller {

using ResponseBuilder = utils::ResponseBuilder;

inline constexpr const char* SERVICE_NAME = "typhon-webui";

/**
 * @brief Controller for the code-evaluation API
 *
 * Provides REST endpoints for:
 * - Running one normalized request through the evaluator
 * - Liveness probing
 */
class RunController : public Controller {
private:
    std::shared_ptr<const evaluator::EvaluatorClient> mClient;

    /**
     * @brief Request body as a JSON object
     *
     * Missing, unparsable or non-object bodies are treated as an empty
     * object so that field validation produces the client-facing error.
     */
    static auto parseBody(const crow::request& req) -> nlohmann::json {
        auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            return nlohmann::json::object();
        }
        return body;
    }

public:
    explicit RunController(
        std::shared_ptr<const evaluator::EvaluatorClient> client)
        : mClient(std::move(client)) {}

    void registerRoutes(ServerApp& app) override {
        CROW_ROUTE(app, "/").methods("GET"_method)(
            [this](const crow::request& req, crow::response& res) {
                index(req, res);
            });
        CROW_ROUTE(app, "/api/health")
            .methods("GET"_method)(
                [this](const crow::request& req, crow::response& res) {
                    health(req, res);
                });
        CROW_ROUTE(app, "/api/run")
            .methods("POST"_method)(
                [this](const crow::request& req, crow::response& res) {
                    run(req, res);
                });
    }

    [[nodiscard]] auto name() const -> std::string_view override {
        return "run";
    }

    // Service description
    void index(const crow::request& /*req*/, crow::response& res) {
        res = ResponseBuilder::json(
            {{"service", SERVICE_NAME},
             {"endpoints", {"GET /api/health", "POST /api/run"}}});
        res.end();
    }

    // Liveness check
    void health(const crow::request& /*req*/, crow::response& res) {
        res = ResponseBuilder::json(models::api::makeHealth(SERVICE_NAME));
        res.end();
    }

    // Normalize, evaluate and assemble one request
    void run(const crow::request& req, crow::response& res) {
        nlohmann::json body = parseBody(req);
        try {
            auto request = gateway::RequestNormalizer::normalize(body);
            LOG_INFO("Running {} request (timeout {}s)",
                     gateway::modeToString(request.mode), request.timeoutSec);

            auto outcome = mClient->execute(request);
            res = ResponseBuilder::fromAssembled(
                evaluator::ResultAssembler::assemble(outcome));
        } catch (const gateway::ValidationError& e) {
            LOG_WARN("Rejected request on field '{}': {}", e.field(),
                     e.message());
            res = ResponseBuilder::validationError(e.message());
        } catch (const std::exception& e) {
            LOG_ERROR("Unhandled error while running request: {}", e.what());
            res = ResponseBuilder::internalError(e.what());
        }
        res.end();
    }
};

}  // namespace typhon::server::controller

#endif  // TYPHON_SERVER_CONTROLLER_RUN_HPP
