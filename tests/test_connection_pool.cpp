#include <gtest/gtest.h>

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

#include "pooled_http/config.hpp"
#include "pooled_http/connection/connection_pool.hpp"
#include "pooled_http/endpoint.hpp"
#include "test_support.hpp"

using namespace pooled_http;
using namespace std::chrono_literals;

namespace {

    ConnectionPoolConfiguration default_cfg() {
        ConnectionPoolConfiguration cfg;
        cfg.max_clients_per_endpoint = 2;
        cfg.acquire_timeout = std::chrono::milliseconds(2000);
        cfg.close_on_shutdown = true;
        return cfg;
    }

    Endpoint make_ep(std::string host = "localhost", std::uint16_t port = 80) {
        Endpoint ep;
        ep.host = std::move(host);
        ep.port = port;
        return ep;
    }

    /// Poll @p pred for up to two seconds.
    template <typename Pred>
    bool eventually(Pred pred) {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!pred()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(2ms);
        }
        return true;
    }

    TEST(ConnectionPoolTest, TryAcquireCreatesAndReusesIdle) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
        Endpoint ep = make_ep();

        // First acquire creates new
        auto lease1 = pool.try_acquire(ep);
        ASSERT_TRUE(lease1.has_value());
        auto* client1 = lease1->get();
        ASSERT_NE(client1, nullptr);
        EXPECT_EQ(client1->endpoint(), ep);
        EXPECT_EQ(client1->state(), Client::State::Disconnected);
        EXPECT_EQ(pool.client_count(ep), 1u);
        EXPECT_EQ(pool.idle_count(ep), 0u);

        lease1 = Lease{};
        EXPECT_EQ(pool.idle_count(ep), 1u);

        // Host case and the default port do not split the bucket.
        auto lease2 = pool.try_acquire(make_ep("LocalHost", 0));
        ASSERT_TRUE(lease2.has_value());
        EXPECT_EQ(lease2->get(), client1);
        EXPECT_EQ(pool.metrics().client_created.load(), 1u);
        EXPECT_EQ(pool.metrics().client_reused.load(), 1u);
    }

    TEST(ConnectionPoolTest, TryAcquireRespectsEndpointCapacity) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
        auto l1 = pool.try_acquire(make_ep("a"));
        auto l2 = pool.try_acquire(make_ep("a"));
        auto l3 = pool.try_acquire(make_ep("a"));
        EXPECT_TRUE(l1.has_value());
        EXPECT_TRUE(l2.has_value());
        EXPECT_FALSE(l3.has_value());
        EXPECT_NE(l1->get(), l2->get());

        // Other endpoints have their own budget.
        auto other = pool.try_acquire(make_ep("b"));
        EXPECT_TRUE(other.has_value());

        Endpoint tls = make_ep("a", 443);
        tls.tls = true;
        auto secure = pool.try_acquire(tls);
        EXPECT_TRUE(secure.has_value());
        EXPECT_EQ(pool.metrics().total_in_use.load(), 4u);
    }

    TEST(ConnectionPoolTest, LeaseMoveSemantics) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
        Endpoint ep = make_ep();
        auto lease1 = pool.try_acquire(ep);
        ASSERT_TRUE(lease1.has_value());
        auto* client = lease1->get();

        Lease lease2 = std::move(*lease1);
        EXPECT_EQ(lease2.get(), client);
        EXPECT_EQ(lease1->get(), nullptr);
        EXPECT_FALSE(static_cast<bool>(*lease1));

        Lease lease3;
        lease3 = std::move(lease2);
        EXPECT_EQ(lease3.get(), client);
        EXPECT_EQ(lease2.get(), nullptr);
        EXPECT_EQ(pool.idle_count(ep), 0u);

        // Explicit release is idempotent.
        lease3.release();
        lease3.release();
        EXPECT_EQ(lease3.get(), nullptr);
        EXPECT_EQ(pool.idle_count(ep), 1u);
        EXPECT_EQ(pool.metrics().release_invalid_id.load(), 0u);
    }

    TEST(ConnectionPoolTest, AcquireTimesOutAtCapacity) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        auto cfg = default_cfg();
        cfg.max_clients_per_endpoint = 1;
        cfg.acquire_timeout = 50ms;
        ConnectionPool pool(io.get_executor(), ssl_ctx, cfg);
        Endpoint ep = make_ep();

        auto held = pool.acquire(ep);
        ASSERT_TRUE(held.has_value());

        auto start = std::chrono::steady_clock::now();
        auto blocked = pool.acquire(ep);
        ASSERT_TRUE(blocked.has_error());
        EXPECT_EQ(blocked.error().code, Error::Code::Timeout);
        EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
        EXPECT_EQ(pool.metrics().acquire_timeout.load(), 1u);
        EXPECT_EQ(pool.metrics().waiters_total.load(), 0u);
    }

    TEST(ConnectionPoolTest, ReleaseWakesBlockedAcquire) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        auto cfg = default_cfg();
        cfg.max_clients_per_endpoint = 1;
        ConnectionPool pool(io.get_executor(), ssl_ctx, cfg);
        Endpoint ep = make_ep();

        auto held = pool.acquire(ep);
        ASSERT_TRUE(held.has_value());
        Client* client = held.value().get();

        std::atomic<Client*> got{nullptr};
        std::thread waiter([&] {
            auto l = pool.acquire(ep);
            if (l.has_value()) got = l.value().get();
        });

        ASSERT_TRUE(eventually(
            [&] { return pool.metrics().waiters_total.load() == 1u; }));
        EXPECT_EQ(got.load(), nullptr);

        held.value().release();
        waiter.join();

        // The waiter got the same client, never a second one.
        EXPECT_EQ(got.load(), client);
        EXPECT_EQ(pool.metrics().client_created.load(), 1u);
        EXPECT_EQ(pool.metrics().waiters_total.load(), 0u);
    }

    TEST(ConnectionPoolTest, ConcurrentAcquireStaysWithinCapacity) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        auto cfg = default_cfg();
        cfg.acquire_timeout = 5000ms;
        ConnectionPool pool(io.get_executor(), ssl_ctx, cfg);
        Endpoint ep = make_ep();

        std::atomic<bool> over_capacity{false};
        std::atomic<int> completed{0};

        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 100; ++i) {
                    auto l = pool.acquire(ep);
                    if (!l.has_value()) continue;
                    if (pool.metrics().total_in_use.load() > 2u) {
                        over_capacity = true;
                    }
                    completed.fetch_add(1);
                }
            });
        }
        for (auto& t : threads) t.join();

        EXPECT_FALSE(over_capacity.load());
        EXPECT_EQ(completed.load(), 800);
        EXPECT_LE(pool.client_count(ep), 2u);
        EXPECT_EQ(pool.metrics().total_in_use.load(), 0u);
        EXPECT_EQ(pool.metrics().release_invalid_id.load(), 0u);
    }

    TEST(ConnectionPoolTest, ShutdownFailsWaitersAndMakesLeasesInert) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        auto cfg = default_cfg();
        cfg.max_clients_per_endpoint = 1;
        cfg.acquire_timeout = 0ms;  // wait forever
        ConnectionPool pool(io.get_executor(), ssl_ctx, cfg);
        Endpoint ep = make_ep();

        auto held = pool.try_acquire(ep);
        ASSERT_TRUE(held.has_value());

        std::optional<Error::Code> waiter_code;
        std::thread waiter([&] {
            auto l = pool.acquire(ep);
            if (l.has_error()) waiter_code = l.error().code;
        });
        ASSERT_TRUE(eventually(
            [&] { return pool.metrics().waiters_total.load() == 1u; }));

        pool.shutdown();
        waiter.join();

        ASSERT_TRUE(waiter_code.has_value());
        EXPECT_EQ(*waiter_code, Error::Code::PoolShutdown);
        EXPECT_TRUE(pool.is_shut_down());
        EXPECT_EQ(held->get(), nullptr);
        EXPECT_FALSE(pool.try_acquire(ep).has_value());

        auto late = pool.acquire(ep);
        ASSERT_TRUE(late.has_error());
        EXPECT_EQ(late.error().code, Error::Code::PoolShutdown);
        EXPECT_EQ(pool.metrics().acquire_shutdown.load(), 2u);
    }

    TEST(ConnectionPoolTest, LeaseOutlivingPoolIsInert) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        auto lease_ptr = std::make_unique<Lease>();
        {
            ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
            auto lease = pool.try_acquire(make_ep());
            ASSERT_TRUE(lease.has_value());
            *lease_ptr = std::move(*lease);
        }
        EXPECT_EQ(lease_ptr->get(), nullptr);
        // Destroying it must not touch the dead pool.
        lease_ptr.reset();
    }

    TEST(ConnectionPoolTest, IdleClientsExpire) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        auto cfg = default_cfg();
        cfg.idle_ttl = 10ms;
        ConnectionPool pool(io.get_executor(), ssl_ctx, cfg);
        Endpoint ep = make_ep();
        {
            auto a = pool.try_acquire(ep);
            auto b = pool.try_acquire(ep);
            ASSERT_TRUE(a.has_value());
            ASSERT_TRUE(b.has_value());
        }
        EXPECT_EQ(pool.idle_count(ep), 2u);

        std::this_thread::sleep_for(20ms);
        EXPECT_EQ(pool.reap_idle(), 2u);
        EXPECT_EQ(pool.idle_count(ep), 0u);
        EXPECT_EQ(pool.client_count(ep), 0u);
        EXPECT_EQ(pool.metrics().client_pruned.load(), 2u);

        auto fresh = pool.try_acquire(ep);
        EXPECT_TRUE(fresh.has_value());
        EXPECT_EQ(pool.metrics().client_created.load(), 3u);
    }

    TEST(ConnectionPoolTest, ZeroTtlKeepsIdleClients) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
        Endpoint ep = make_ep();
        { auto l = pool.try_acquire(ep); }
        std::this_thread::sleep_for(5ms);
        EXPECT_EQ(pool.reap_idle(), 0u);
        EXPECT_EQ(pool.idle_count(ep), 1u);
    }

    TEST(ConnectionPoolTest, ReleasingBusyClientDisconnectsIt) {
        test_support::ScriptedServer server(
            [](const test_support::ScriptedServer::Request&, std::size_t) {
                return test_support::Reply{
                    test_support::http_response(200, "never read")};
            });
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
        Endpoint ep = make_ep("127.0.0.1", server.port());

        auto lease = pool.try_acquire(ep);
        ASSERT_TRUE(lease.has_value());
        Client* client = lease->get();
        auto res = client->request([](RequestWriter&) {});
        ASSERT_TRUE(res.has_value());
        EXPECT_TRUE(client->busy());

        lease->release();
        EXPECT_TRUE(res.value().is_finalized());
        EXPECT_EQ(client->state(), Client::State::Disconnected);
        EXPECT_EQ(pool.metrics().released_while_busy.load(), 1u);

        // The next holder gets a clean client.
        auto next = pool.try_acquire(ep);
        ASSERT_TRUE(next.has_value());
        EXPECT_EQ(next->get(), client);
        auto again = (*next)->request([](RequestWriter&) {});
        ASSERT_TRUE(again.has_value());
        EXPECT_EQ(again.value().read_body().value(), "never read");
    }

    TEST(ConnectionPoolTest, AttachedLeaseReturnsOnceOnFinalize) {
        test_support::ScriptedServer server(
            [](const test_support::ScriptedServer::Request&, std::size_t) {
                return test_support::Reply{
                    test_support::http_response(200, "payload")};
            });
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(
            boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
        Endpoint ep = make_ep("127.0.0.1", server.port());

        auto lease = pool.acquire(ep);
        ASSERT_TRUE(lease.has_value());
        auto res = lease.value()->request([](RequestWriter&) {});
        ASSERT_TRUE(res.has_value());
        res.value().attach_lease(std::move(lease).value());
        EXPECT_EQ(pool.idle_count(ep), 0u);

        EXPECT_EQ(res.value().read_body().value(), "payload");
        EXPECT_EQ(pool.idle_count(ep), 1u);

        res.value().finalize();
        res.value().finalize();
        EXPECT_EQ(pool.idle_count(ep), 1u);
        EXPECT_EQ(pool.metrics().release_invalid_id.load(), 0u);
        EXPECT_EQ(pool.metrics().released_while_busy.load(), 0u);
    }

}  // namespace
