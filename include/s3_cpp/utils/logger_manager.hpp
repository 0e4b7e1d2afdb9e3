#pragma once

#include "s3_cpp/config.hpp"

namespace s3_cpp {

    /**
     * @brief Installs the process-wide spdlog logger used by the library.
     *
     * Optional: without init() the library logs through spdlog's default
     * stdout logger at its default level.
     */
    class LoggerManager {
       public:
        /// @brief Build an async logger over the configured sinks and make it
        /// the default. Sink failures are reported on stderr and leave the
        /// previous logger in place.
        static void init(const LoggingConfiguration& config);

        /// @brief Flush and drop all loggers. Call before main() returns.
        static void shutdown();

        LoggerManager() = delete;
    };

}  // namespace s3_cpp
