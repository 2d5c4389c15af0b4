/**
 * @file log_version.hpp
 * @brief Version information for the rotolog library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace rotolog
{

#ifndef ROTOLOG_VERSION_STRING
    #define ROTOLOG_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = ROTOLOG_VERSION_STRING;

} // namespace rotolog
