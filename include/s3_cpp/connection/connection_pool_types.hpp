#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace s3_cpp {

    /// @brief Metrics for monitoring connection pool behavior
    struct ConnectionPoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> total_in_use{0};  ///< Currently leased out
        std::atomic<std::size_t> total_idle{0};    ///< Currently idle
        std::atomic<std::size_t> total_connecting{0};  ///< Being created
        std::atomic<std::size_t> waiters_total{
            0};  ///< Currently waiting for a connection

        // Counters (cumulative)
        std::atomic<std::uint64_t> acquire_success{0};  ///< Successful acquires
        std::atomic<std::uint64_t> acquire_timeout{0};  ///< Acquire timed out
        std::atomic<std::uint64_t> acquire_shutdown{0};  ///< Pool shut down
        std::atomic<std::uint64_t> acquire_connect_failed{
            0};  ///< Transport could not open a channel
        std::atomic<std::uint64_t> connection_created{0};  ///< New connections
        std::atomic<std::uint64_t> connection_reused{0};   ///< Leased from idle
        std::atomic<std::uint64_t> connection_handed_off{
            0};  ///< Passed straight from release to a waiter
        std::atomic<std::uint64_t> connection_pruned{
            0};  ///< Idle past idle_timeout or closed by peer
        std::atomic<std::uint64_t> connection_closed{
            0};  ///< Closed on release (unusable or shutdown)

        std::atomic<std::uint64_t> release_invalid{
            0};  ///< Released empty, foreign or unknown lease
    };

}  // namespace s3_cpp
