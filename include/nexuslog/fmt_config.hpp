/**
 * @file fmt_config.hpp
 * @brief Configuration for fmt library to be used in header-only mode
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 *
 * nexuslog is header-only; fmt is pulled in the same way so that users
 * do not have to link a separate fmt library.
 */
#pragma once

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
