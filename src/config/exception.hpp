/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Configuration Exception Types

**************************************************/

#ifndef TYPHON_CONFIG_EXCEPTION_HPP
#define TYPHON_CONFIG_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace typhon::config {

/**
 * @brief Base exception for configuration errors
 *
 * main() catches this type and exits with status 1.
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

/**
 * @brief Exception for invalid configuration values
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...)       \
    throw typhon::config::InvalidConfigException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                      \
    throw typhon::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                            ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace typhon::config

#endif  // TYPHON_CONFIG_EXCEPTION_HPP
