/**
 * @file log.hpp
 * @brief Access to the library logger.
 */
#pragma once
#include "buildplan/common/common.hpp"
#include <spdlog/spdlog.h>

namespace buildplan
{

/// Name under which the library logger is registered with spdlog.
inline constexpr const char* k_logger_name = "buildplan";

/**
 * @brief Get the logger used by the library.
 *
 * @details
 * On first use the logger is looked up in the spdlog registry by
 * `k_logger_name`; if the application has not registered one, a colored
 * stdout logger is created and registered. Level defaults to `info`.
 *
 * @par Thread safety
 * - Safe to call from any thread.
 */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Replace the logger used by the library.
 * @param logger The logger to use. Passing nullptr restores the default.
 */
void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace buildplan
