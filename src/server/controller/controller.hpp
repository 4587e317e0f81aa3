#ifndef TYPHON_SERVER_CONTROLLER_CONTROLLER_HPP
#define TYPHON_SERVER_CONTROLLER_CONTROLLER_HPP

#include <string_view>

#include "../app.hpp"

namespace typhon::server::controller {

/**
 * @brief Base class for the gateway's HTTP controllers
 *
 * A controller owns a group of endpoints and the collaborators they need.
 * MainServer registers every controller once, before the app starts.
 */
class Controller {
public:
    virtual ~Controller() = default;

    /**
     * @brief Register HTTP routes with the Crow application
     * @param app The Crow application instance
     */
    virtual void registerRoutes(ServerApp& app) = 0;

    /**
     * @brief Short name used in startup logs
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

}  // namespace typhon::server::controller

#endif  // TYPHON_SERVER_CONTROLLER_CONTROLLER_HPP
