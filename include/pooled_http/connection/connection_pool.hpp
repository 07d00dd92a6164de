#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "pooled_http/client.hpp"
#include "pooled_http/config.hpp"
#include "pooled_http/connection/connection_pool_types.hpp"
#include "pooled_http/connection/lease.hpp"
#include "pooled_http/endpoint.hpp"
#include "pooled_http/result.hpp"

namespace pooled_http {

    /**
     * Thread-safe registry of reusable Clients, keyed by Endpoint.
     *
     * SAFETY:
     * - All public methods are thread-safe and can be called from any thread
     * - One mutex guards the buckets; waiting uses a condition variable
     *
     * INVARIANTS:
     * 1. For each bucket: client count == in_use.size() + idle.size()
     *    and never exceeds max_clients_per_endpoint
     * 2. Global: total_in_use_ == sum(bucket.in_use.size())
     * 3. No client is both idle and in use, so no two holders share one
     * 4. Buckets are created on first use of an endpoint and never removed
     *
     * ERRORS:
     * - Timeout: no client became free within acquire_timeout
     * - PoolShutdown: pool permanently closed, all future acquires fail
     *
     * Clients are created unconnected; connection failures surface from the
     * first request on the client, not from acquire().
     */
    class ConnectionPool {
       public:
        ConnectionPool(boost::asio::any_io_executor ex,
                       boost::asio::ssl::context& ssl_ctx,
                       ConnectionPoolConfiguration cfg = {},
                       ClientConfiguration client_cfg = {});

        ~ConnectionPool();

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        /// @brief Try to acquire a client immediately, returns nullopt if
        /// the endpoint is at capacity or the pool is shut down
        /// @note Non-blocking, does not wait
        std::optional<Lease> try_acquire(Endpoint ep);

        /**
         * @brief Acquire a client for @p ep, blocking while the endpoint is
         * at capacity.
         * @return Lease on success, Timeout or PoolShutdown otherwise.
         */
        Result<Lease> acquire(Endpoint ep);

        /// @brief Shutdown the pool, failing all waiters and making
        /// outstanding leases inert
        void shutdown();

        bool is_shut_down() const noexcept {
            return !state_->alive.load(std::memory_order_acquire);
        }

        /// @brief Disconnect and drop idle clients older than idle_ttl.
        /// @return Number of clients dropped.
        std::size_t reap_idle();

        /// @brief Idle plus in-use clients for an endpoint.
        std::size_t client_count(Endpoint ep) const;

        std::size_t idle_count(Endpoint ep) const;

        ///@brief Access metrics for monitoring
        ConnectionPoolMetrics const& metrics() const { return metrics_; }

        ConnectionPoolConfiguration const& config() const noexcept {
            return cfg_;
        }

       private:
        ///@brief Entry for an idle client
        struct IdleEntry {
            std::unique_ptr<Client> client;                  ///< Idle client
            std::chrono::steady_clock::time_point last_used;  ///< Last used
        };

        ///@brief Per-endpoint bucket
        struct Bucket {
            std::deque<IdleEntry> idle;  ///< Idle clients, oldest first
            std::unordered_map<std::uint64_t, std::unique_ptr<Client>>
                in_use;  ///< Leased clients by lease id
        };

        /// @brief Normalize endpoint (default port, lowercase host)
        static void normalize_(Endpoint& ep) {
            ep.normalize_default_port();
            ep.normalize_host();
        }

        /// @brief Check internal invariants, only in debug builds
        void check_invariants_locked_() const;

        /// @brief Release a client back to the pool
        void release(Endpoint const& ep, std::uint64_t id,
                     bool was_busy) noexcept;

        /// @brief Try to acquire a client under lock
        std::optional<Lease> try_acquire_locked_(Endpoint const& ep);

        /// @brief Prune idle clients that have expired under lock
        std::size_t prune_idle_locked_(
            std::chrono::steady_clock::time_point now);

        Lease make_lease_(Endpoint const& ep, Client* c, std::uint64_t id);

        boost::asio::any_io_executor ex_;     ///< Executor for new clients
        boost::asio::ssl::context& ssl_ctx_;  ///< SSL context for HTTPS
        ConnectionPoolConfiguration cfg_;     ///< Pool configuration
        ClientConfiguration client_cfg_;      ///< Handed to every new client

        mutable std::mutex mu_;       ///< Mutex for protecting internal state
        std::condition_variable cv_;  ///< Signalled on release and shutdown
        std::unordered_map<Endpoint, Bucket>
            buckets_;  ///< Per-endpoint buckets

        std::size_t total_in_use_{0};  ///< Total in-use clients
        std::uint64_t next_id_{1};     ///< Next lease ID

        std::shared_ptr<Lease::State> state_;  ///< Shared pool state
        ConnectionPoolMetrics metrics_;        ///< Metrics for monitoring
    };

}  // namespace pooled_http
