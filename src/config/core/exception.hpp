/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-04

Description: Errors raised while loading or publishing configuration

**************************************************/

#ifndef RAMPART_CONFIG_CORE_EXCEPTION_HPP
#define RAMPART_CONFIG_CORE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace rampart::config {

/// Any configuration failure; the published snapshot is left untouched.
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

/// A document was read but its values are unusable.
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

/// The configuration file could not be read or parsed.
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

}  // namespace rampart::config

#define RAMPART_THROW_CONFIG(Type, ...)                                  \
    throw rampart::config::Type(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_CONFIG_EXCEPTION(...) \
    RAMPART_THROW_CONFIG(InvalidConfigException, __VA_ARGS__)

#define THROW_CONFIG_IO_EXCEPTION(...) \
    RAMPART_THROW_CONFIG(ConfigIOException, __VA_ARGS__)

#endif  // RAMPART_CONFIG_CORE_EXCEPTION_HPP
