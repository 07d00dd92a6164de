#pragma once

#include <zlib.h>

#include <array>
#include <cstdint>
#include <vector>

#include "pooled_http/stream/input_stream.hpp"

namespace pooled_http {

    /**
     * @brief Decompresses a gzip or deflate coded stream with zlib.
     *
     * Gzip input may hold several members back to back; their output is
     * concatenated. Deflate accepts the zlib-wrapped format and falls back
     * to raw deflate data, which some servers send instead. Once a deflate
     * stream ends, whatever is left of the wrapped stream is read and
     * discarded.
     *
     * Errors: boost::beast::zlib::error codes for corrupt data,
     * http::error::partial_message if the input ends before the compressed
     * stream does.
     */
    class InflateInputStream final : public InputStream {
       public:
        enum class Format { Gzip, Deflate };

        InflateInputStream(InputStream& in, Format format);
        ~InflateInputStream() override;

        InflateInputStream(const InflateInputStream&) = delete;
        InflateInputStream& operator=(const InflateInputStream&) = delete;

        std::size_t read_some(net::mutable_buffer buffer,
                              boost::system::error_code& ec) override;

        bool empty(boost::system::error_code& ec) override;

        Format format() const noexcept { return m_format; }

       private:
        /// @brief Inflate until some output is pending or the stream ends.
        void fill(boost::system::error_code& ec);
        void drain_input(boost::system::error_code& ec);

        InputStream* m_in;
        Format m_format;
        z_stream m_zs{};
        bool m_initialized{false};
        bool m_finished{false};
        bool m_raw_fallback_tried{false};

        std::array<unsigned char, 8 * 1024> m_in_buf{};
        std::size_t m_in_reads{0};
        std::size_t m_first_read_size{0};

        std::vector<unsigned char> m_out_buf;
        std::size_t m_out_begin{0};
        std::size_t m_out_end{0};
    };

}  // namespace pooled_http
