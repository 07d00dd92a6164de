#pragma once

#include <array>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>

#include "pooled_http/connection/connection.hpp"
#include "pooled_http/stream/input_stream.hpp"

namespace pooled_http {
    namespace http = boost::beast::http;

    /// @brief Parser for a response head whose body is pulled on demand.
    using ResponseParser = http::response_parser<http::buffer_body>;

    /**
     * @brief Message body read through a Beast response parser.
     *
     * The parser removes the transfer framing (Content-Length or chunked)
     * from bytes arriving on the Connection. The stream ends when the parser
     * reports the message complete, which leaves the Connection at the
     * start of the next message.
     *
     * Errors: the parser's http::error codes, http::error::partial_message
     * if the peer closes inside the body.
     */
    class ParserInputStream final : public InputStream {
       public:
        ParserInputStream(Connection& conn, ResponseParser& parser) noexcept
            : m_conn(&conn), m_parser(&parser) {}

        std::size_t read_some(net::mutable_buffer buffer,
                              boost::system::error_code& ec) override;

        bool empty(boost::system::error_code& ec) override;

       private:
        /// @brief Parse body bytes into @p buffer. Returns 0 only once the
        /// message is complete or on error.
        std::size_t parse_into(net::mutable_buffer buffer,
                               boost::system::error_code& ec);

        Connection* m_conn;
        ResponseParser* m_parser;

        // Bytes parsed by empty() and not yet handed out.
        std::array<char, 4 * 1024> m_ahead{};
        std::size_t m_ahead_begin{0};
        std::size_t m_ahead_end{0};
    };

}  // namespace pooled_http
