#pragma once

#include <sys/socket.h>
#include <zlib.h>

#include <atomic>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <cstdio>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace test_support {
    namespace net = boost::asio;
    namespace beast = boost::beast;
    namespace http = beast::http;
    using tcp = net::ip::tcp;

    /// @brief Canned bytes for one request, plus whether to hang up after.
    struct Reply {
        std::string raw;
        bool close_after{false};
    };

    /**
     * Loopback HTTP server that answers each request with raw bytes chosen
     * by a handler. Every accepted connection is served on its own thread so
     * that pooled clients can hold several connections at once.
     */
    class ScriptedServer {
       public:
        using Request = http::request<http::string_body>;
        /// @param connection 1-based index of the connection the request
        /// arrived on.
        using Handler =
            std::function<Reply(const Request& req, std::size_t connection)>;

        explicit ScriptedServer(Handler h)
            : handler_(std::move(h)), ioc_(1), acceptor_(ioc_) {
            tcp::endpoint ep{net::ip::make_address("127.0.0.1"), 0};
            beast::error_code ec;

            acceptor_.open(ep.protocol(), ec);
            if (ec) throw beast::system_error(ec);

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec) throw beast::system_error(ec);

            acceptor_.bind(ep, ec);
            if (ec) throw beast::system_error(ec);

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec) throw beast::system_error(ec);

            port_ = acceptor_.local_endpoint().port();

            accept_thread_ = std::thread([this] { this->accept_loop(); });
        }

        ~ScriptedServer() {
            stop_.store(true, std::memory_order_relaxed);

            // Wake the blocking accept().
            {
                beast::error_code ec;
                net::io_context tmp_ioc;
                tcp::socket s(tmp_ioc);
                s.connect(
                    tcp::endpoint(net::ip::make_address("127.0.0.1"), port_),
                    ec);
            }
            if (accept_thread_.joinable()) accept_thread_.join();

            std::vector<std::thread> sessions;
            {
                std::lock_guard<std::mutex> lk(mu_);
                // Unblock session reads; ::shutdown is safe across threads.
                for (auto& s : sockets_) {
                    if (s->is_open()) ::shutdown(s->native_handle(), SHUT_RDWR);
                }
                sessions.swap(sessions_);
            }
            for (auto& t : sessions) {
                if (t.joinable()) t.join();
            }
        }

        std::uint16_t port() const noexcept { return port_; }

        std::string base_url() const {
            return "http://127.0.0.1:" + std::to_string(port_);
        }

        std::size_t connections_accepted() const noexcept {
            return accepted_.load();
        }

        std::size_t connections_closed() const noexcept {
            return closed_.load();
        }

        std::size_t request_count() const {
            std::lock_guard<std::mutex> lk(mu_);
            return requests_.size();
        }

        Request request_at(std::size_t i) const {
            std::lock_guard<std::mutex> lk(mu_);
            return requests_.at(i);
        }

        /// @brief Poll until at least @p n connections were closed.
        bool wait_for_closed(std::size_t n,
                             std::chrono::milliseconds timeout =
                                 std::chrono::milliseconds(2000)) const {
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (closed_.load() < n) {
                if (std::chrono::steady_clock::now() > deadline) return false;
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
            // Let the FIN reach the peer.
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            return true;
        }

       private:
        void accept_loop() {
            while (!stop_.load(std::memory_order_relaxed)) {
                beast::error_code ec;
                auto sock = std::make_shared<tcp::socket>(ioc_);
                acceptor_.accept(*sock, ec);
                if (ec) continue;
                if (stop_.load(std::memory_order_relaxed)) break;

                std::size_t index = ++accepted_;
                std::lock_guard<std::mutex> lk(mu_);
                sockets_.push_back(sock);
                sessions_.emplace_back(
                    [this, sock, index] { this->serve(*sock, index); });
            }
        }

        void serve(tcp::socket& sock, std::size_t index) {
            beast::flat_buffer buffer;
            for (;;) {
                beast::error_code ec;
                Request req;
                http::read(sock, buffer, req, ec);
                if (ec) break;

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    requests_.push_back(req);
                }

                Reply reply = handler_(req, index);
                net::write(sock, net::buffer(reply.raw), ec);
                if (ec || reply.close_after) break;
            }
            beast::error_code ignored;
            sock.shutdown(tcp::socket::shutdown_both, ignored);
            closed_.fetch_add(1);
        }

        Handler handler_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        std::uint16_t port_{0};

        std::atomic<bool> stop_{false};
        std::atomic<std::size_t> accepted_{0};
        std::atomic<std::size_t> closed_{0};

        mutable std::mutex mu_;
        std::vector<Request> requests_;
        std::vector<std::shared_ptr<tcp::socket>> sockets_;
        std::vector<std::thread> sessions_;
        std::thread accept_thread_;
    };

    /// @brief "HTTP/1.1 <status> <phrase>" head with the given fields and a
    /// Content-Length framed body.
    inline std::string http_response(
        int status, std::string_view body,
        const std::vector<std::pair<std::string, std::string>>& fields = {},
        std::string_view phrase = "OK") {
        std::string out = "HTTP/1.1 " + std::to_string(status) + " ";
        out.append(phrase);
        out += "\r\n";
        for (auto const& [k, v] : fields) out += k + ": " + v + "\r\n";
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
        out.append(body);
        return out;
    }

    /// @brief Chunked framing of @p chunks, terminal chunk included.
    inline std::string chunked(const std::vector<std::string>& chunks) {
        std::string out;
        char size[32];
        for (auto const& c : chunks) {
            std::snprintf(size, sizeof(size), "%zx\r\n", c.size());
            out += size;
            out += c;
            out += "\r\n";
        }
        out += "0\r\n\r\n";
        return out;
    }

    /// @brief Compress with zlib. @p window_bits: 15+16 gzip, 15 zlib,
    /// -15 raw deflate.
    inline std::string compress(std::string_view in, int window_bits) {
        z_stream zs{};
        if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits,
                         8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("deflateInit2 failed");
        }
        std::string out;
        out.resize(deflateBound(&zs, static_cast<uLong>(in.size())) + 32);

        zs.next_in =
            reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
        zs.avail_in = static_cast<uInt>(in.size());
        zs.next_out = reinterpret_cast<Bytef*>(out.data());
        zs.avail_out = static_cast<uInt>(out.size());

        int rc = deflate(&zs, Z_FINISH);
        deflateEnd(&zs);
        if (rc != Z_STREAM_END) throw std::runtime_error("deflate failed");
        out.resize(zs.total_out);
        return out;
    }

    inline std::string gzip_compress(std::string_view in) {
        return compress(in, 15 + 16);
    }

    inline std::string zlib_compress(std::string_view in) {
        return compress(in, 15);
    }

    inline std::string raw_deflate_compress(std::string_view in) {
        return compress(in, -15);
    }

}  // namespace test_support
