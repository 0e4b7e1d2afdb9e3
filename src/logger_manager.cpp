#include "s3_cpp/utils/logger_manager.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <memory>
#include <vector>

namespace s3_cpp {

    void LoggerManager::init(const LoggingConfiguration& config) {
        try {
            spdlog::init_thread_pool(8192, 1);

            std::vector<spdlog::sink_ptr> sinks;

            if (config.output == "console" || config.output == "all") {
                sinks.push_back(
                    std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            }

            if (config.output == "file" || config.output == "all") {
                sinks.push_back(
                    std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        config.file_path, config.max_size_mb * 1024 * 1024,
                        config.max_files));
            }

            // "off" or anything unrecognised
            auto level = spdlog::level::from_str(config.level);
            if (sinks.empty()) {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
                level = spdlog::level::off;
            }

            auto logger = std::make_shared<spdlog::async_logger>(
                "s3_cpp", sinks.begin(), sinks.end(), spdlog::thread_pool(),
                spdlog::async_overflow_policy::overrun_oldest);
            logger->set_level(level);

            spdlog::set_default_logger(logger);
            spdlog::set_level(level);

            using namespace std::chrono_literals;
            spdlog::flush_every(5s);
            spdlog::flush_on(spdlog::level::err);
            spdlog::set_pattern(config.pattern);

            SPDLOG_INFO("Logger level : {}",
                        spdlog::level::to_string_view(level));
        } catch (const spdlog::spdlog_ex& ex) {
            std::fprintf(stderr, "Log init failed: %s\n", ex.what());
        }
    }

    void LoggerManager::shutdown() { spdlog::shutdown(); }

}  // namespace s3_cpp
