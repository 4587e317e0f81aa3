#ifndef TYPHON_SERVER_APP_HPP
#define TYPHON_SERVER_APP_HPP

#include <crow.h>

#include "middleware/request_logger.hpp"

namespace typhon::server {

/**
 * @brief Central HTTP application type with middleware stack
 */
using ServerApp = crow::App<middleware::RequestLogger>;

}  // namespace typhon::server

#endif  // TYPHON_SERVER_APP_HPP
