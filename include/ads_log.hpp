#pragma once
/**
 * @file ads_log.hpp
 * @brief Named spdlog loggers used by the library
 *
 * Loggers are created on first use and write to stderr. Applications that
 * install their own spdlog sinks under the same names ("ads_client",
 * "ads_reader", "ads_transport", "ads_symbol") take precedence.
 */

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ads {
namespace log {

/// Get or lazily create the named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Set the level of every logger created through get_logger()
void set_level(spdlog::level::level_enum level);

/**
 * @brief Hex dump of a buffer, 16 bytes per line
 *
 * Nothing is formatted unless the logger accepts `level`.
 */
void log_buffer(const std::shared_ptr<spdlog::logger>& logger,
                spdlog::level::level_enum level,
                const std::vector<uint8_t>& buffer,
                const std::string& header,
                size_t max_bytes = 256);

} // namespace log
} // namespace ads
