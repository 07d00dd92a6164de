#include "pooled_http/stream/input_stream.hpp"

#include <algorithm>
#include <array>
#include <boost/beast/http/error.hpp>

#include "pooled_http/stream/memory_stream.hpp"

namespace pooled_http {
    namespace http = boost::beast::http;

    namespace {
        constexpr std::size_t copy_buffer_size = 16 * 1024;
    }

    std::string read_all(InputStream& in, boost::system::error_code& ec) {
        StringOutputStream out;
        pipe(in, out, ec);
        if (ec) return {};
        return out.take();
    }

    std::uint64_t pipe(InputStream& in, OutputStream& out,
                       boost::system::error_code& ec) {
        std::array<char, copy_buffer_size> buf;
        std::uint64_t total = 0;
        for (;;) {
            std::size_t n = in.read_some(net::buffer(buf), ec);
            if (ec == net::error::eof) {
                ec = {};
                return total;
            }
            if (ec) return total;
            out.write(net::buffer(buf.data(), n), ec);
            if (ec) return total;
            total += n;
        }
    }

    std::uint64_t pipe(InputStream& in, OutputStream& out,
                       std::uint64_t length, boost::system::error_code& ec) {
        std::array<char, copy_buffer_size> buf;
        std::uint64_t total = 0;
        ec = {};
        while (total < length) {
            auto want = static_cast<std::size_t>(
                std::min<std::uint64_t>(buf.size(), length - total));
            std::size_t n = in.read_some(net::buffer(buf.data(), want), ec);
            if (ec == net::error::eof) {
                ec = http::error::partial_message;
                return total;
            }
            if (ec) return total;
            out.write(net::buffer(buf.data(), n), ec);
            if (ec) return total;
            total += n;
        }
        return total;
    }

    std::size_t MemoryInputStream::read_some(net::mutable_buffer buffer,
                                             boost::system::error_code& ec) {
        if (m_pos >= m_data.size()) {
            ec = net::error::eof;
            return 0;
        }
        ec = {};
        std::size_t n = std::min(buffer.size(), m_data.size() - m_pos);
        std::copy_n(m_data.data() + m_pos, n,
                    static_cast<char*>(buffer.data()));
        m_pos += n;
        return n;
    }

}  // namespace pooled_http
