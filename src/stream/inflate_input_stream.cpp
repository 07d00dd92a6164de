#include "pooled_http/stream/inflate_input_stream.hpp"

#include <algorithm>
#include <boost/beast/http/error.hpp>
#include <boost/beast/zlib/error.hpp>
#include <boost/system/error_code.hpp>

namespace pooled_http {
    namespace http = boost::beast::http;
    namespace zlib = boost::beast::zlib;

    namespace {
        constexpr int gzip_window_bits = 15 + 16;
        constexpr int zlib_window_bits = 15;
        constexpr int raw_window_bits = -15;
        constexpr std::size_t output_buffer_size = 16 * 1024;
    }  // namespace

    InflateInputStream::InflateInputStream(InputStream& in, Format format)
        : m_in(&in), m_format(format), m_out_buf(output_buffer_size) {
        int bits =
            format == Format::Gzip ? gzip_window_bits : zlib_window_bits;
        m_initialized = ::inflateInit2(&m_zs, bits) == Z_OK;
    }

    InflateInputStream::~InflateInputStream() {
        if (m_initialized) ::inflateEnd(&m_zs);
    }

    std::size_t InflateInputStream::read_some(net::mutable_buffer buffer,
                                              boost::system::error_code& ec) {
        fill(ec);
        if (ec) return 0;
        if (m_out_begin == m_out_end) {
            ec = net::error::eof;
            return 0;
        }

        std::size_t n = std::min(buffer.size(), m_out_end - m_out_begin);
        std::copy_n(m_out_buf.data() + m_out_begin, n,
                    static_cast<unsigned char*>(buffer.data()));
        m_out_begin += n;
        return n;
    }

    bool InflateInputStream::empty(boost::system::error_code& ec) {
        fill(ec);
        if (ec) return false;
        return m_out_begin == m_out_end;
    }

    void InflateInputStream::fill(boost::system::error_code& ec) {
        ec = {};
        if (!m_initialized) {
            ec = zlib::error::stream_error;
            return;
        }

        while (m_out_begin == m_out_end && !m_finished) {
            if (m_zs.avail_in == 0) {
                std::size_t n = m_in->read_some(net::buffer(m_in_buf), ec);
                if (ec == net::error::eof && m_in_reads == 0) {
                    // An empty body carries no compressed stream at all.
                    ec = {};
                    m_finished = true;
                    return;
                }
                if (ec == net::error::eof) {
                    ec = http::error::partial_message;
                    return;
                }
                if (ec) return;
                if (m_in_reads++ == 0) m_first_read_size = n;
                m_zs.next_in = m_in_buf.data();
                m_zs.avail_in = static_cast<uInt>(n);
            }

            m_zs.next_out = m_out_buf.data();
            m_zs.avail_out = static_cast<uInt>(m_out_buf.size());
            int rc = ::inflate(&m_zs, Z_NO_FLUSH);
            m_out_begin = 0;
            m_out_end = m_out_buf.size() - m_zs.avail_out;

            switch (rc) {
                case Z_OK:
                case Z_BUF_ERROR:
                    break;
                case Z_STREAM_END:
                    if (m_format == Format::Gzip) {
                        // Concatenated gzip members decode as one stream.
                        if (m_zs.avail_in == 0 && m_in->empty(ec)) {
                            m_finished = true;
                            return;
                        }
                        if (ec) return;
                        if (::inflateReset(&m_zs) != Z_OK) {
                            ec = zlib::error::stream_error;
                            return;
                        }
                        break;
                    }
                    m_finished = true;
                    drain_input(ec);
                    return;
                case Z_NEED_DICT:
                    ec = zlib::error::need_dict;
                    return;
                case Z_DATA_ERROR:
                    // Not zlib-wrapped: retry the first block as raw deflate.
                    if (m_format == Format::Deflate && !m_raw_fallback_tried &&
                        m_zs.total_out == 0 && m_in_reads == 1) {
                        m_raw_fallback_tried = true;
                        if (::inflateReset2(&m_zs, raw_window_bits) != Z_OK) {
                            ec = zlib::error::stream_error;
                            return;
                        }
                        m_zs.next_in = m_in_buf.data();
                        m_zs.avail_in = static_cast<uInt>(m_first_read_size);
                        break;
                    }
                    ec = zlib::error::general;
                    return;
                case Z_MEM_ERROR:
                    ec = make_error_code(
                        boost::system::errc::not_enough_memory);
                    return;
                default:
                    ec = zlib::error::stream_error;
                    return;
            }
        }
    }

    void InflateInputStream::drain_input(boost::system::error_code& ec) {
        m_zs.avail_in = 0;
        for (;;) {
            m_in->read_some(net::buffer(m_in_buf), ec);
            if (ec == net::error::eof) {
                ec = {};
                return;
            }
            if (ec) return;
        }
    }

}  // namespace pooled_http
