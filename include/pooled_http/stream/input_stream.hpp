#pragma once

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pooled_http {
    namespace net = boost::asio;

    /**
     * @brief Blocking source of bytes.
     *
     * Errors are reported through @p ec in the Beast style. At the end of the
     * stream read_some() returns 0 and sets net::error::eof.
     */
    class InputStream {
       public:
        virtual ~InputStream() = default;

        /// @brief Read at least one byte into @p buffer, blocking if needed.
        virtual std::size_t read_some(net::mutable_buffer buffer,
                                      boost::system::error_code& ec) = 0;

        /// @brief True once no more bytes will be produced. May block to
        /// find out.
        virtual bool empty(boost::system::error_code& ec) = 0;
    };

    /// @brief Blocking sink of bytes.
    class OutputStream {
       public:
        virtual ~OutputStream() = default;

        /// @brief Write all of @p buffer.
        virtual void write(net::const_buffer buffer,
                           boost::system::error_code& ec) = 0;

        virtual void flush(boost::system::error_code& ec) = 0;

        /// @brief Write any framing trailer and flush. Calling it again is a
        /// no-op.
        virtual void finalize(boost::system::error_code& ec) = 0;
    };

    /// @brief Write a string to @p out.
    inline void write(OutputStream& out, std::string_view s,
                      boost::system::error_code& ec) {
        out.write(net::buffer(s.data(), s.size()), ec);
    }

    /// @brief Read everything up to end of stream.
    std::string read_all(InputStream& in, boost::system::error_code& ec);

    /// @brief Copy @p in to @p out until end of stream.
    /// @return Number of bytes copied.
    std::uint64_t pipe(InputStream& in, OutputStream& out,
                       boost::system::error_code& ec);

    /// @brief Copy exactly @p length bytes from @p in to @p out. Ending early
    /// is http::error::partial_message.
    std::uint64_t pipe(InputStream& in, OutputStream& out,
                       std::uint64_t length, boost::system::error_code& ec);

}  // namespace pooled_http
