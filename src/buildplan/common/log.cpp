/**
 * @file log.cpp
 */
#include "buildplan/common/log.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace buildplan
{

namespace
{

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_default_logger()
{
    auto logger = spdlog::get(k_logger_name);
    if (!logger)
    {
        logger = spdlog::stdout_color_mt(k_logger_name);
        logger->set_level(spdlog::level::info);
    }
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get_logger()
{
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger)
    {
        g_logger = make_default_logger();
    }
    return g_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger)
{
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = std::move(logger);
}

} // namespace buildplan
