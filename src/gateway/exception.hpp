/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-2

Description: Request validation exceptions

**************************************************/

#ifndef TYPHON_GATEWAY_EXCEPTION_HPP
#define TYPHON_GATEWAY_EXCEPTION_HPP

#include <string>
#include <utility>

#include "atom/error/exception.hpp"

namespace typhon::gateway {

/**
 * @brief Exception thrown when client input violates a required field rule.
 *
 * Carries the offending field name and the bare client-facing message in
 * addition to the source location recorded by atom::error::Exception.
 */
class ValidationError : public atom::error::Exception {
public:
    ValidationError(const char* file, int line, const char* func,
                    std::string field, std::string message)
        : Exception(file, line, func, message),
          field_(std::move(field)),
          message_(std::move(message)) {}

    [[nodiscard]] auto field() const noexcept -> const std::string& {
        return field_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return message_;
    }

private:
    std::string field_;
    std::string message_;
};

#define THROW_REQUEST_VALIDATION_ERROR(field, message)                    \
    throw typhon::gateway::ValidationError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                           ATOM_FUNC_NAME, field, message)

}  // namespace typhon::gateway

#endif  // TYPHON_GATEWAY_EXCEPTION_HPP
