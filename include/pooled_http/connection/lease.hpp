#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

#include "pooled_http/endpoint.hpp"

namespace pooled_http {

    class Client;
    class ConnectionPool;

    /**
     * @brief Exclusive RAII checkout of one pooled Client.
     *
     * Move-only. The Client goes back to its pool exactly once: on
     * destruction, on move-assignment over a live lease, or on release().
     * After the pool has shut down the lease is inert and get() returns
     * nullptr.
     */
    class Lease {
       public:
        Lease() = default;

        Lease(Lease&& other) noexcept { move_from(std::move(other)); }

        /// @brief Move lease from another
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                move_from(std::move(other));
            }
            return *this;
        }

        Lease(Lease const&) = delete;
        Lease& operator=(Lease const&) = delete;

        ~Lease() { release(); }

        Client* operator->() const noexcept { return get(); }

        Client& operator*() const { return *get(); }

        /// @brief Get the underlying client, or nullptr if inert
        Client* get() const noexcept {
            auto st = state_.lock();
            if (!st || !st->alive.load(std::memory_order_acquire))
                return nullptr;
            return client_;
        }

        explicit operator bool() const noexcept { return get() != nullptr; }

        Endpoint const& endpoint() const noexcept { return endpoint_; }

        std::uint64_t id() const noexcept { return id_; }

        /**
         * @brief Return the client to the pool now.
         * @note A client that still awaits its response is disconnected
         * first, so a half-read transport never reaches the next holder.
         */
        void release() noexcept;

       private:
        friend class ConnectionPool;

        /// @brief Internal state shared with the pool
        /// @note Used to detect pool shutdown
        struct State {
            std::atomic<bool> alive{true};
        };

        Lease(std::weak_ptr<State> st, Client* c, Endpoint ep,
              std::uint64_t id,
              std::function<void(Endpoint const&, std::uint64_t, bool)> ret)
            : state_(std::move(st)),
              client_(c),
              endpoint_(std::move(ep)),
              id_(id),
              return_to_pool_(std::move(ret)) {}

        void move_from(Lease&& other) noexcept {
            state_ = std::move(other.state_);
            client_ = other.client_;
            endpoint_ = std::move(other.endpoint_);
            id_ = other.id_;
            return_to_pool_ = std::move(other.return_to_pool_);
            other.client_ = nullptr;
            other.id_ = 0;
        }

        std::weak_ptr<State> state_;
        Client* client_{nullptr};
        Endpoint endpoint_{};
        std::uint64_t id_{0};
        std::function<void(Endpoint const&, std::uint64_t, bool)> return_to_pool_;
    };

}  // namespace pooled_http
