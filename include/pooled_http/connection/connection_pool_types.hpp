#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace pooled_http {

    /// @brief Metrics for monitoring connection pool behavior
    struct ConnectionPoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> total_in_use{0};  ///< Currently leased out
        std::atomic<std::size_t> total_idle{0};    ///< Currently idle
        std::atomic<std::size_t> waiters_total{
            0};  ///< Currently waiting for a client

        // Counters (cumulative)
        std::atomic<std::uint64_t> acquire_success{0};  ///< Successful acquires
        std::atomic<std::uint64_t> acquire_timeout{0};  ///< Acquire timed out
        std::atomic<std::uint64_t> acquire_shutdown{0};  ///< Pool shutdown
        std::atomic<std::uint64_t> client_created{0};    ///< New clients
        std::atomic<std::uint64_t> client_reused{0};     ///< Reused idle
        std::atomic<std::uint64_t> client_pruned{0};     ///< Pruned idle
        std::atomic<std::uint64_t> released_while_busy{
            0};  ///< Returned with a response still pending
        std::atomic<std::uint64_t> release_invalid_id{
            0};  ///< Released unknown client
    };

}  // namespace pooled_http
