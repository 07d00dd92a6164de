#include "pooled_http/connection/parser_input_stream.hpp"

#include <algorithm>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>

namespace pooled_http {

    std::size_t ParserInputStream::read_some(net::mutable_buffer buffer,
                                             boost::system::error_code& ec) {
        ec = {};
        if (buffer.size() == 0) return 0;

        if (m_ahead_begin != m_ahead_end) {
            std::size_t n =
                std::min(buffer.size(), m_ahead_end - m_ahead_begin);
            std::copy_n(m_ahead.data() + m_ahead_begin, n,
                        static_cast<char*>(buffer.data()));
            m_ahead_begin += n;
            return n;
        }

        std::size_t n = parse_into(buffer, ec);
        if (!ec && n == 0) ec = net::error::eof;
        return n;
    }

    bool ParserInputStream::empty(boost::system::error_code& ec) {
        ec = {};
        if (m_ahead_begin != m_ahead_end) return false;

        m_ahead_begin = 0;
        m_ahead_end = parse_into(net::buffer(m_ahead), ec);
        if (ec) return false;
        return m_ahead_end == 0;
    }

    std::size_t ParserInputStream::parse_into(net::mutable_buffer buffer,
                                              boost::system::error_code& ec) {
        auto& body = m_parser->get().body();
        auto reader = m_conn->socket_reader();

        // A parse step may end on a chunk header and yield no body bytes.
        while (!m_parser->is_done()) {
            body.data = buffer.data();
            body.size = buffer.size();
            http::read_some(reader, m_conn->read_buffer(), *m_parser, ec);
            std::size_t n = buffer.size() - body.size;
            body.data = nullptr;
            body.size = 0;

            if (ec == http::error::need_buffer) ec = {};
            if (ec) return 0;
            if (n > 0) return n;
        }
        return 0;
    }

}  // namespace pooled_http
