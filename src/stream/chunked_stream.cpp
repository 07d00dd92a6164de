#include "pooled_http/stream/chunked_stream.hpp"

#include <boost/beast/core/buffers_range.hpp>
#include <boost/beast/http/chunk_encode.hpp>

namespace pooled_http {
    namespace beast = boost::beast;
    namespace http = beast::http;

    void ChunkedOutputStream::write(net::const_buffer buffer,
                                    boost::system::error_code& ec) {
        ec = {};
        if (buffer.size() == 0) return;  // a zero-size chunk would end the body
        auto chunk = http::make_chunk(buffer);
        for (net::const_buffer b : beast::buffers_range_ref(chunk)) {
            m_out->write(b, ec);
            if (ec) return;
        }
    }

    void ChunkedOutputStream::finalize(boost::system::error_code& ec) {
        ec = {};
        if (m_finalized) return;
        m_finalized = true;
        auto last = http::make_chunk_last();
        for (net::const_buffer b : beast::buffers_range_ref(last)) {
            m_out->write(b, ec);
            if (ec) return;
        }
        m_out->flush(ec);
    }

}  // namespace pooled_http
