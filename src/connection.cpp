#include "pooled_http/connection/connection.hpp"

#include <algorithm>
#include <atomic>
#include <boost/asio/connect.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/write.hpp>
#include <boost/log/trivial.hpp>

namespace pooled_http {
    namespace beast = boost::beast;

    namespace {
        constexpr std::size_t read_chunk_size = 8 * 1024;
        constexpr std::size_t write_buffer_limit = 16 * 1024;

        std::atomic<std::uint64_t> next_transport_id{1};
    }  // namespace

    Connection::Connection(boost::asio::any_io_executor executor,
                           boost::asio::ssl::context& ssl_ctx,
                           Endpoint endpoint, bool verify_host)
        : m_ex(std::move(executor)),
          m_ssl_ctx(ssl_ctx),
          m_endpoint(std::move(endpoint)),
          m_verify_host(verify_host) {
        m_endpoint.normalize_default_port();
        m_endpoint.normalize_host();
    }

    Result<std::uint64_t> Connection::open() {
        close();

        boost::system::error_code ec;
        tcp::resolver resolver(m_ex);
        auto results = resolver.resolve(
            m_endpoint.host, std::to_string(m_endpoint.port), ec);
        if (ec) {
            return Result<std::uint64_t>::err(
                Error::Code::ConnectionFailed,
                "Failed to resolve " + m_endpoint.host + ": " + ec.message());
        }

        if (!m_endpoint.tls) {
            auto& s = m_stream.emplace<HttpStream>(m_ex);
            s.connect(results, ec);
            if (ec) {
                close();
                return Result<std::uint64_t>::err(
                    Error::Code::ConnectionFailed,
                    "Failed to connect to " + to_string(m_endpoint) + ": " +
                        ec.message());
            }
        } else {
            auto& s = m_stream.emplace<HttpsStream>(m_ex, m_ssl_ctx);
            beast::get_lowest_layer(s).connect(results, ec);
            if (ec) {
                close();
                return Result<std::uint64_t>::err(
                    Error::Code::ConnectionFailed,
                    "Failed to connect to " + to_string(m_endpoint) + ": " +
                        ec.message());
            }

            if (set_sni(s, m_endpoint.host, ec)) {
                if (m_verify_host) {
                    s.set_verify_callback(
                        boost::asio::ssl::host_name_verification(
                            m_endpoint.host),
                        ec);
                }
                if (!ec) s.handshake(boost::asio::ssl::stream_base::client, ec);
            }
            if (ec) {
                close();
                return Result<std::uint64_t>::err(
                    Error::Code::TlsHandshakeFailed,
                    "TLS handshake with " + to_string(m_endpoint) +
                        " failed: " + ec.message());
            }
        }

        m_id = next_transport_id.fetch_add(1, std::memory_order_relaxed);
        BOOST_LOG_TRIVIAL(debug) << "pooled_http: opened transport #" << m_id
                                 << " to " << to_string(m_endpoint);
        return Result<std::uint64_t>::ok(m_id);
    }

    void Connection::close() noexcept {
        boost::system::error_code ec;
        if (auto* sock = raw_socket()) {
            sock->shutdown(tcp::socket::shutdown_both, ec);
            sock->close(ec);
            BOOST_LOG_TRIVIAL(debug) << "pooled_http: closed transport #"
                                     << m_id << " to " << to_string(m_endpoint);
        }
        // mark connection as "no stream"
        m_stream.emplace<std::monostate>();
        m_rx.clear();
        m_tx.clear();
        m_id = 0;
    }

    bool Connection::is_open() const noexcept {
        return std::visit(
            [](auto const& s) -> bool {
                using T = std::decay_t<decltype(s)>;

                if constexpr (std::is_same_v<T, std::monostate>) {
                    return false;
                } else if constexpr (std::is_same_v<T, HttpStream>) {
                    return s.socket().is_open();
                } else {  // HttpsStream
                    return beast::get_lowest_layer(s).socket().is_open();
                }
            },
            m_stream);
    }

    bool Connection::is_alive() noexcept {
        auto* sock = raw_socket();
        if (!sock || !sock->is_open()) return false;

        // Leftover bytes mean the previous exchange was not read to the end.
        if (m_rx.size() > 0) {
            close();
            return false;
        }

        boost::system::error_code ec;
        char c = 0;
        sock->non_blocking(true, ec);
        if (ec) {
            close();
            return false;
        }
        std::size_t n = sock->receive(boost::asio::buffer(&c, 1),
                                      tcp::socket::message_peek, ec);
        bool alive = (ec == boost::asio::error::would_block);
        if (!ec && n > 0) alive = false;  // unsolicited data, e.g. a 408

        boost::system::error_code restore_ec;
        sock->non_blocking(false, restore_ec);
        if (!alive || restore_ec) {
            close();
            return false;
        }
        return true;
    }

    std::size_t Connection::read_some(net::mutable_buffer buffer,
                                      boost::system::error_code& ec) {
        ec = {};
        if (buffer.size() == 0) return 0;

        if (m_rx.size() == 0) {
            fill(ec);
            if (ec) return 0;
        }

        std::size_t n = net::buffer_copy(buffer, m_rx.data());
        m_rx.consume(n);
        return n;
    }

    bool Connection::empty(boost::system::error_code& ec) {
        ec = {};
        if (m_rx.size() > 0) return false;
        fill(ec);
        if (ec == net::error::eof) {
            ec = {};
            return true;
        }
        return false;
    }

    void Connection::write(net::const_buffer buffer,
                           boost::system::error_code& ec) {
        ec = {};
        if (m_tx.size() + buffer.size() > write_buffer_limit) {
            flush(ec);
            if (ec) return;
            if (buffer.size() > write_buffer_limit) {
                socket_write(buffer, ec);
                return;
            }
        }
        m_tx.append(static_cast<const char*>(buffer.data()), buffer.size());
    }

    void Connection::flush(boost::system::error_code& ec) {
        ec = {};
        if (m_tx.empty()) return;
        socket_write(net::buffer(m_tx), ec);
        m_tx.clear();
    }

    void Connection::fill(boost::system::error_code& ec) {
        auto dst = m_rx.prepare(read_chunk_size);
        std::size_t n = socket_read(dst, ec);
        m_rx.commit(n);
        if (ec && n == 0) {
            if (ec != net::error::eof) {
                BOOST_LOG_TRIVIAL(debug)
                    << "pooled_http: read on transport #" << m_id
                    << " failed: " << ec.message();
            }
            close();
        } else {
            ec = {};
        }
    }

    std::size_t Connection::socket_read(net::mutable_buffer buffer,
                                        boost::system::error_code& ec) {
        return std::visit(
            [&](auto& s) -> std::size_t {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    ec = net::error::not_connected;
                    return 0;
                } else {
                    return s.read_some(buffer, ec);
                }
            },
            m_stream);
    }

    std::size_t Connection::parser_read(net::mutable_buffer buffer,
                                        boost::system::error_code& ec) {
        std::size_t n = socket_read(buffer, ec);
        if (ec && ec != net::error::eof) {
            BOOST_LOG_TRIVIAL(debug) << "pooled_http: read on transport #"
                                     << m_id << " failed: " << ec.message();
        }
        return n;
    }

    void Connection::socket_write(net::const_buffer buffer,
                                  boost::system::error_code& ec) {
        std::visit(
            [&](auto& s) {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    ec = net::error::not_connected;
                } else {
                    net::write(s, buffer, ec);
                }
            },
            m_stream);
        if (ec) {
            BOOST_LOG_TRIVIAL(debug) << "pooled_http: write on transport #"
                                     << m_id << " failed: " << ec.message();
            close();
        }
    }

    Connection::tcp::socket* Connection::raw_socket() noexcept {
        if (auto* s = std::get_if<HttpStream>(&m_stream)) return &s->socket();
        if (auto* s = std::get_if<HttpsStream>(&m_stream))
            return &beast::get_lowest_layer(*s).socket();
        return nullptr;
    }

}  // namespace pooled_http
