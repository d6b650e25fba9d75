/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Configuration Exception Types

**************************************************/

#ifndef FLYSCAN_CONFIG_CORE_EXCEPTION_HPP
#define FLYSCAN_CONFIG_CORE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace flyscan::config {

/**
 * @brief Base exception for configuration errors
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_BAD_CONFIG_EXCEPTION(...)                                       \
    throw flyscan::config::BadConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                              ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                       \
    throw flyscan::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                             ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration validation failure
 */
class ConfigValidationException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_VALIDATION_EXCEPTION(...)        \
    throw flyscan::config::ConfigValidationException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for malformed configuration documents
 */
class ConfigSerializationException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_SERIALIZATION_EXCEPTION(...)        \
    throw flyscan::config::ConfigSerializationException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace flyscan::config

#endif  // FLYSCAN_CONFIG_CORE_EXCEPTION_HPP
