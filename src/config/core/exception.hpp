/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Configuration Exception Types

**************************************************/

#ifndef RUNSTEP_CONFIG_CORE_EXCEPTION_HPP
#define RUNSTEP_CONFIG_CORE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace runstep::config {

/**
 * @brief Base exception for configuration errors
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_BAD_CONFIG_EXCEPTION(...)                                       \
    throw runstep::config::BadConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                              ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for invalid configuration values
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...)        \
    throw runstep::config::InvalidConfigException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for unreadable configuration files
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                       \
    throw runstep::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                             ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration validation failure
 */
class ConfigValidationException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_VALIDATION_EXCEPTION(...)        \
    throw runstep::config::ConfigValidationException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace runstep::config

#endif  // RUNSTEP_CONFIG_CORE_EXCEPTION_HPP
