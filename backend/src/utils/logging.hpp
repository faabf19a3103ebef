#pragma once
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include "Config.hpp"

namespace Log
{
    inline void init(const AppConfig& config)
    {
        // File logger becomes the default; the terminal stays free for the UI
        auto file_logger = spdlog::basic_logger_mt("file_logger", config.log_file);
        spdlog::set_default_logger(file_logger);

        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::flush_on(spdlog::level::info);
    }
}
