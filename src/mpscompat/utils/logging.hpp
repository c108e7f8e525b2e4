////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mpscompat_config.h>
#include <mpscompat_export.h>

/**
 * @file spdlog logging for mpscompat.
 *
 * The macros with `LOG` in their names take a logger pointer as their
 * first argument. The others write to the default mpscompat logger.
 *
 * The guard logs at trace (fast path) and debug (fallback path)
 * levels only, so release builds with the default SPDLOG_ACTIVE_LEVEL
 * pay nothing on the fast path.
 */

#include <memory>

#include <spdlog/spdlog.h>

#define MPSCOMPAT_LOG_TRACE(logger, ...)                                       \
  SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__)
#define MPSCOMPAT_LOG_DEBUG(logger, ...)                                       \
  SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__)
#define MPSCOMPAT_LOG_INFO(logger, ...) SPDLOG_LOGGER_INFO(logger, __VA_ARGS__)
#define MPSCOMPAT_LOG_WARN(logger, ...) SPDLOG_LOGGER_WARN(logger, __VA_ARGS__)
#define MPSCOMPAT_LOG_ERROR(logger, ...)                                       \
  SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__)
#define MPSCOMPAT_LOG_CRITICAL(logger, ...)                                    \
  SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__)

#define MPSCOMPAT_TRACE(...)                                                   \
  MPSCOMPAT_LOG_TRACE(::mpscompat::default_logger(), __VA_ARGS__)
#define MPSCOMPAT_DEBUG(...)                                                   \
  MPSCOMPAT_LOG_DEBUG(::mpscompat::default_logger(), __VA_ARGS__)
#define MPSCOMPAT_INFO(...)                                                    \
  MPSCOMPAT_LOG_INFO(::mpscompat::default_logger(), __VA_ARGS__)
#define MPSCOMPAT_WARN(...)                                                    \
  MPSCOMPAT_LOG_WARN(::mpscompat::default_logger(), __VA_ARGS__)
#define MPSCOMPAT_ERROR(...)                                                   \
  MPSCOMPAT_LOG_ERROR(::mpscompat::default_logger(), __VA_ARGS__)
#define MPSCOMPAT_CRITICAL(...)                                                \
  MPSCOMPAT_LOG_CRITICAL(::mpscompat::default_logger(), __VA_ARGS__)

namespace mpscompat
{
/** @brief Get the default mpscompat logger.
 *
 *  The sink is chosen by `MPSCOMPAT_LOG_FILE` ("stdout", "stderr", or
 *  a file name; default "stdout") and the level by
 *  `MPSCOMPAT_LOG_LEVEL` ("trace", "debug", "info", "warn", "err",
 *  "critical", "off"; default "info"). Both are read once, on first
 *  use.
 */
MPSCOMPAT_EXPORT std::shared_ptr<::spdlog::logger>& default_logger();
}  // namespace mpscompat
