#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/system_error.hpp>
#include <cstdint>
#include <string>
#include <variant>

#include "pooled_http/endpoint.hpp"
#include "pooled_http/result.hpp"
#include "pooled_http/stream/input_stream.hpp"

namespace pooled_http {

    /**
     * @brief One plain or TLS socket to one endpoint.
     *
     * All reads go through one buffer. The Beast response parser fills it
     * through socket_reader() and read_buffer(); whatever it leaves unparsed
     * is served first by read_some(), so a raw body consumer picks up
     * exactly where the header block ended. Writes are collected and sent
     * on flush(). A write error, or a failed read_some(), closes the
     * socket, so is_open() going false is the signal that the transport has
     * to be reopened.
     */
    class Connection final : public InputStream, public OutputStream {
       private:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

       public:
        /**
         * @brief Beast SyncReadStream over the raw socket.
         *
         * Hands bytes straight to Beast's read algorithms, which keep them in
         * read_buffer(). Errors are reported, not acted on: the owner of the
         * exchange decides whether the transport is closed.
         */
        class SocketReader {
           public:
            explicit SocketReader(Connection& conn) noexcept : m_conn(&conn) {}

            template <class MutableBufferSequence>
            std::size_t read_some(const MutableBufferSequence& buffers) {
                boost::system::error_code ec;
                std::size_t n = read_some(buffers, ec);
                if (ec) throw boost::system::system_error(ec);
                return n;
            }

            template <class MutableBufferSequence>
            std::size_t read_some(const MutableBufferSequence& buffers,
                                  boost::system::error_code& ec) {
                net::mutable_buffer first =
                    *net::buffer_sequence_begin(buffers);
                return m_conn->parser_read(first, ec);
            }

           private:
            Connection* m_conn;
        };

        /**
         * @brief Constructs a closed Connection.
         * @param executor The executor sockets are created on.
         * @param ssl_ctx The SSL context for HTTPS.
         * @param endpoint The target endpoint.
         * @param verify_host Check the peer certificate against the host name.
         */
        Connection(boost::asio::any_io_executor executor,
                   boost::asio::ssl::context& ssl_ctx, Endpoint endpoint,
                   bool verify_host = true);

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        ~Connection() noexcept override { close(); }

        /**
         * @brief Resolve, connect and (for TLS) handshake.
         * @return The new transport id, or ConnectionFailed /
         * TlsHandshakeFailed.
         */
        Result<std::uint64_t> open();

        /// @brief Close the socket if open (best-effort).
        /// @note No TLS shutdown is performed.
        void close() noexcept;

        bool is_open() const noexcept;

        /**
         * @brief True if the socket is open and usable for a new request:
         * nothing unread is buffered and the peer has not closed its side.
         * @note Non-blocking; a dead socket is closed as a side effect.
         */
        bool is_alive() noexcept;

        /// @brief Identity of the currently open socket, 0 when closed.
        std::uint64_t id() const noexcept { return m_id; }

        const Endpoint& endpoint() const noexcept { return m_endpoint; }

        // InputStream
        std::size_t read_some(net::mutable_buffer buffer,
                              boost::system::error_code& ec) override;
        bool empty(boost::system::error_code& ec) override;

        /// @brief Stream for http::read_header() and http::read_some().
        SocketReader socket_reader() noexcept { return SocketReader(*this); }

        /// @brief Bytes received but not yet consumed, shared with the
        /// parser.
        boost::beast::flat_buffer& read_buffer() noexcept { return m_rx; }

        // OutputStream
        void write(net::const_buffer buffer,
                   boost::system::error_code& ec) override;
        void flush(boost::system::error_code& ec) override;
        void finalize(boost::system::error_code& ec) override { flush(ec); }

       private:
        /// @brief Read more bytes from the socket into m_rx.
        void fill(boost::system::error_code& ec);
        std::size_t socket_read(net::mutable_buffer buffer,
                                boost::system::error_code& ec);
        std::size_t parser_read(net::mutable_buffer buffer,
                                boost::system::error_code& ec);
        void socket_write(net::const_buffer buffer,
                          boost::system::error_code& ec);
        tcp::socket* raw_socket() noexcept;

        boost::asio::any_io_executor m_ex;
        boost::asio::ssl::context& m_ssl_ctx;
        Endpoint m_endpoint;
        bool m_verify_host;

        Stream m_stream;
        std::uint64_t m_id{0};
        boost::beast::flat_buffer m_rx;
        std::string m_tx;
    };

}  // namespace pooled_http
