#ifndef TYPHON_SERVER_UTILS_RESPONSE_HPP
#define TYPHON_SERVER_UTILS_RESPONSE_HPP

#include <crow.h>
#include <string>
#include "atom/type/json.hpp"

#include "../models/api.hpp"
#include "evaluator/assembler.hpp"

namespace typhon::server::utils {

/**
 * @brief Utility class for creating gateway API responses
 *
 * Bodies are always JSON. Evaluator output is embedded verbatim, so invalid
 * UTF-8 is replaced during serialization instead of failing the response.
 */
class ResponseBuilder {
public:
    /**
     * @brief Create a JSON response with an explicit status
     */
    static crow::response json(const nlohmann::json& body, int code = 200) {
        return makeJsonResponse(body, code);
    }

    /**
     * @brief Response for an assembled evaluator run
     */
    static crow::response fromAssembled(
        const evaluator::AssembledResponse& assembled) {
        return makeJsonResponse(assembled.body, assembled.status);
    }

    /**
     * @brief Request rejected by validation (400)
     */
    static crow::response validationError(const std::string& message) {
        return makeJsonResponse(models::api::makeError(message), 400);
    }

    /**
     * @brief Internal server error (500)
     */
    static crow::response internalError(
        const std::string& message = "An unexpected error occurred") {
        return makeJsonResponse(models::api::makeError(message), 500);
    }

private:
    static crow::response makeJsonResponse(const nlohmann::json& body, int code) {
        crow::response res(code);
        res.set_header("Content-Type", "application/json");
        res.write(body.dump(-1, ' ', false,
                            nlohmann::json::error_handler_t::replace));
        return res;
    }
};

}  // namespace typhon::server::utils

#endif  // TYPHON_SERVER_UTILS_RESPONSE_HPP
