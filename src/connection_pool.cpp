#include "pooled_http/connection/connection_pool.hpp"

#include <boost/log/trivial.hpp>
#include <cassert>
#include <unordered_set>

namespace pooled_http {

    void Lease::release() noexcept {
        auto st = state_.lock();
        if (!client_) return;

        // If pool is already dead, do not call back into it.
        if (!st || !st->alive.load(std::memory_order_acquire)) {
            client_ = nullptr;
            return;
        }

        const bool was_busy = client_->busy();
        if (was_busy) {
            BOOST_LOG_TRIVIAL(warning)
                << "pooled_http: lease on " << to_string(endpoint_)
                << " released while a response was pending; disconnecting";
            client_->disconnect();
        }

        auto ret = std::move(return_to_pool_);
        return_to_pool_ = nullptr;
        client_ = nullptr;
        if (ret) ret(endpoint_, id_, was_busy);
    }

    ConnectionPool::ConnectionPool(boost::asio::any_io_executor ex,
                                   boost::asio::ssl::context& ssl_ctx,
                                   ConnectionPoolConfiguration cfg,
                                   ClientConfiguration client_cfg)
        : ex_(std::move(ex)),
          ssl_ctx_(ssl_ctx),
          cfg_(cfg),
          client_cfg_(std::move(client_cfg)),
          state_(std::make_shared<Lease::State>()) {}

    ConnectionPool::~ConnectionPool() {
        shutdown();

        // Leased clients are torn down too; their pending responses are
        // abandoned so nothing points back into the pool.
        std::unordered_map<Endpoint, Bucket> buckets;
        {
            std::lock_guard<std::mutex> lk(mu_);
            buckets.swap(buckets_);
        }
        for (auto& [_, bucket] : buckets) {
            for (auto& [__, client] : bucket.in_use) {
                if (client) client->disconnect();
            }
        }
    }

    std::optional<Lease> ConnectionPool::try_acquire(Endpoint ep) {
        normalize_(ep);
        std::lock_guard<std::mutex> lk(mu_);
        auto l = try_acquire_locked_(ep);
        if (l) metrics_.acquire_success.fetch_add(1, std::memory_order_relaxed);
        return l;
    }

    Result<Lease> ConnectionPool::acquire(Endpoint ep) {
        normalize_(ep);

        const bool bounded = cfg_.acquire_timeout.count() > 0;
        const auto deadline =
            std::chrono::steady_clock::now() + cfg_.acquire_timeout;
        bool waiting = false;

        std::unique_lock<std::mutex> lk(mu_);
        for (;;) {
            if (!state_->alive.load(std::memory_order_acquire)) {
                if (waiting) {
                    metrics_.waiters_total.fetch_sub(1,
                                                     std::memory_order_relaxed);
                }
                metrics_.acquire_shutdown.fetch_add(1,
                                                    std::memory_order_relaxed);
                return Result<Lease>::err(Error::Code::PoolShutdown,
                                          "Pool is shutting down");
            }

            if (auto l = try_acquire_locked_(ep)) {
                if (waiting) {
                    metrics_.waiters_total.fetch_sub(1,
                                                     std::memory_order_relaxed);
                }
                metrics_.acquire_success.fetch_add(1,
                                                   std::memory_order_relaxed);
                return Result<Lease>::ok(std::move(*l));
            }

            if (!waiting) {
                waiting = true;
                metrics_.waiters_total.fetch_add(1, std::memory_order_relaxed);
            }

            if (!bounded) {
                cv_.wait(lk);
                continue;
            }

            if (cv_.wait_until(lk, deadline) == std::cv_status::timeout) {
                // Last chance: a release may have raced the deadline.
                if (state_->alive.load(std::memory_order_acquire)) {
                    if (auto l = try_acquire_locked_(ep)) {
                        metrics_.waiters_total.fetch_sub(
                            1, std::memory_order_relaxed);
                        metrics_.acquire_success.fetch_add(
                            1, std::memory_order_relaxed);
                        return Result<Lease>::ok(std::move(*l));
                    }
                }
                metrics_.waiters_total.fetch_sub(1, std::memory_order_relaxed);
                metrics_.acquire_timeout.fetch_add(1,
                                                   std::memory_order_relaxed);
                return Result<Lease>::err(
                    Error::Code::Timeout,
                    "Timed out waiting for a client to " + to_string(ep));
            }
        }
    }

    void ConnectionPool::shutdown() {
        state_->alive.store(false, std::memory_order_release);

        {
            std::lock_guard<std::mutex> lk(mu_);
            if (cfg_.close_on_shutdown) {
                for (auto& [_, bucket] : buckets_) {
                    for (auto& e : bucket.idle) {
                        if (e.client) e.client->disconnect();
                    }
                }
            }
        }

        // Wake every waiter so it observes the shutdown.
        cv_.notify_all();
    }

    std::size_t ConnectionPool::reap_idle() {
        std::lock_guard<std::mutex> lk(mu_);
        return prune_idle_locked_(std::chrono::steady_clock::now());
    }

    std::size_t ConnectionPool::client_count(Endpoint ep) const {
        normalize_(ep);
        std::lock_guard<std::mutex> lk(mu_);
        auto it = buckets_.find(ep);
        if (it == buckets_.end()) return 0;
        return it->second.idle.size() + it->second.in_use.size();
    }

    std::size_t ConnectionPool::idle_count(Endpoint ep) const {
        normalize_(ep);
        std::lock_guard<std::mutex> lk(mu_);
        auto it = buckets_.find(ep);
        if (it == buckets_.end()) return 0;
        return it->second.idle.size();
    }

    void ConnectionPool::check_invariants_locked_() const {
#ifndef NDEBUG
        std::size_t computed_total = 0;

        for (auto const& [ep, b] : buckets_) {
            computed_total += b.in_use.size();

            // Invariant: no client in both idle and in_use
            std::unordered_set<Client const*> in_use_ptrs;
            for (auto const& [id, up] : b.in_use) {
                assert(up && "in_use client is null");
                in_use_ptrs.insert(up.get());
            }

            for (auto const& entry : b.idle) {
                assert(entry.client && "idle client is null");
                assert(in_use_ptrs.find(entry.client.get()) ==
                           in_use_ptrs.end() &&
                       "client in both idle and in_use");
            }

            assert(b.idle.size() + b.in_use.size() <=
                       cfg_.max_clients_per_endpoint &&
                   "endpoint over capacity");
        }

        assert(computed_total == total_in_use_ && "total_in_use_ drift");
#endif
    }

    void ConnectionPool::release(Endpoint const& ep, std::uint64_t id,
                                 bool was_busy) noexcept {
        if (was_busy) {
            metrics_.released_while_busy.fetch_add(1,
                                                   std::memory_order_relaxed);
        }
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = buckets_.find(ep);

            if (it == buckets_.end()) {
                metrics_.release_invalid_id.fetch_add(
                    1, std::memory_order_relaxed);
                return;
            }

            auto& b = it->second;
            auto it2 = b.in_use.find(id);

            if (it2 == b.in_use.end()) {
                metrics_.release_invalid_id.fetch_add(
                    1, std::memory_order_relaxed);
                return;
            }

            auto up = std::move(it2->second);
            b.in_use.erase(it2);
            --total_in_use_;
            metrics_.total_in_use.store(total_in_use_,
                                        std::memory_order_relaxed);

            b.idle.push_back(
                IdleEntry{std::move(up), std::chrono::steady_clock::now()});
            metrics_.total_idle.fetch_add(1, std::memory_order_relaxed);

            check_invariants_locked_();
        }

        // Notify outside the lock; waiters of other endpoints simply recheck.
        cv_.notify_all();
    }

    std::optional<Lease> ConnectionPool::try_acquire_locked_(
        Endpoint const& ep) {
        // Check shutdown
        if (!state_->alive.load(std::memory_order_acquire)) {
            return std::nullopt;
        }

        prune_idle_locked_(std::chrono::steady_clock::now());

        auto& b = buckets_[ep];

        // Prefer the most recently used idle client
        if (!b.idle.empty()) {
            auto entry = std::move(b.idle.back());
            b.idle.pop_back();
            metrics_.total_idle.fetch_sub(1, std::memory_order_relaxed);

            auto id = next_id_++;
            Client* raw = entry.client.get();
            b.in_use.emplace(id, std::move(entry.client));
            ++total_in_use_;

            metrics_.total_in_use.store(total_in_use_,
                                        std::memory_order_relaxed);
            metrics_.client_reused.fetch_add(1, std::memory_order_relaxed);

            check_invariants_locked_();
            return make_lease_(ep, raw, id);
        }

        // No idle clients available, check capacity for creating new
        const std::size_t endpoint_total = b.in_use.size() + b.idle.size();
        if (endpoint_total >= cfg_.max_clients_per_endpoint)
            return std::nullopt;

        // Create a new client and mark it in-use. It connects lazily.
        auto up = std::make_unique<Client>(ex_, ssl_ctx_, client_cfg_);
        up->connect(ep);
        Client* raw = up.get();
        auto id = next_id_++;

        b.in_use.emplace(id, std::move(up));
        ++total_in_use_;

        metrics_.total_in_use.store(total_in_use_, std::memory_order_relaxed);
        metrics_.client_created.fetch_add(1, std::memory_order_relaxed);
        BOOST_LOG_TRIVIAL(debug) << "pooled_http: created client for "
                                 << to_string(ep) << " ("
                                 << b.in_use.size() + b.idle.size() << "/"
                                 << cfg_.max_clients_per_endpoint << ")";

        check_invariants_locked_();
        return make_lease_(ep, raw, id);
    }

    std::size_t ConnectionPool::prune_idle_locked_(
        std::chrono::steady_clock::time_point now) {
        if (cfg_.idle_ttl.count() <= 0) return 0;

        std::size_t pruned = 0;
        for (auto& [ep, b] : buckets_) {
            while (!b.idle.empty()) {
                auto const& front = b.idle.front();
                if (now - front.last_used < cfg_.idle_ttl) break;

                if (front.client) front.client->disconnect();
                b.idle.pop_front();
                ++pruned;
                metrics_.total_idle.fetch_sub(1, std::memory_order_relaxed);
                metrics_.client_pruned.fetch_add(1, std::memory_order_relaxed);
            }
        }
        if (pruned > 0) {
            BOOST_LOG_TRIVIAL(debug)
                << "pooled_http: pruned " << pruned << " idle client(s)";
        }
        return pruned;
    }

    Lease ConnectionPool::make_lease_(Endpoint const& ep, Client* c,
                                      std::uint64_t id) {
        return Lease(state_, c, ep, id,
                     [this](Endpoint const& e, std::uint64_t id_, bool busy) {
                         release(e, id_, busy);
                     });
    }

}  // namespace pooled_http
