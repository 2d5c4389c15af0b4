/**
 * @file fmt_config.hpp
 * @brief Configuration for fmt library to be used in header-only mode
 *
 * rotolog is header-only; fmt is pulled in the same way so consumers do not
 * need to link a compiled fmt.
 */
#pragma once

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
