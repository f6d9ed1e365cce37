#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace optick {

// Async colored console logger installed as the spdlog default.
inline void init_logging(const std::string& name, spdlog::level::level_enum level = spdlog::level::info) {
    spdlog::init_thread_pool(8192, 1);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::async_logger>(
        name, console_sink, spdlog::thread_pool(),
        spdlog::async_overflow_policy::block
    );
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

} // namespace optick
