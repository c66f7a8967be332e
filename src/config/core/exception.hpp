/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Errors raised while reading docstore configuration

**************************************************/

#ifndef DOCSTORE_CONFIG_CORE_EXCEPTION_HPP
#define DOCSTORE_CONFIG_CORE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace docstore::config {

/// Common base so callers can catch every configuration failure at once.
class ConfigError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

/// The file could not be opened or read.
class ConfigIoError : public ConfigError {
    using ConfigError::ConfigError;
};

/// The content is not JSON, or a section holds a value of the wrong type.
class InvalidConfigError : public ConfigError {
    using ConfigError::ConfigError;
};

#define DOCSTORE_THROW_CONFIG(Type, ...)                                  \
    throw docstore::config::Type(ATOM_FILE_NAME, ATOM_FILE_LINE,          \
                                 ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_CONFIG_IO_ERROR(...) DOCSTORE_THROW_CONFIG(ConfigIoError, __VA_ARGS__)
#define THROW_INVALID_CONFIG_ERROR(...) \
    DOCSTORE_THROW_CONFIG(InvalidConfigError, __VA_ARGS__)

}  // namespace docstore::config

#endif  // DOCSTORE_CONFIG_CORE_EXCEPTION_HPP
