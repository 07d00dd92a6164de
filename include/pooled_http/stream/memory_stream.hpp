#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "pooled_http/stream/input_stream.hpp"

namespace pooled_http {

    /// @brief InputStream over an owned string.
    class MemoryInputStream final : public InputStream {
       public:
        MemoryInputStream() = default;
        explicit MemoryInputStream(std::string data) : m_data(std::move(data)) {}

        std::size_t read_some(net::mutable_buffer buffer,
                              boost::system::error_code& ec) override;

        bool empty(boost::system::error_code& ec) override {
            ec = {};
            return m_pos >= m_data.size();
        }

        std::size_t remaining() const noexcept { return m_data.size() - m_pos; }

       private:
        std::string m_data;
        std::size_t m_pos{0};
    };

    /// @brief OutputStream that appends to a string.
    class StringOutputStream final : public OutputStream {
       public:
        void write(net::const_buffer buffer,
                   boost::system::error_code& ec) override {
            ec = {};
            m_data.append(static_cast<const char*>(buffer.data()),
                          buffer.size());
        }

        void flush(boost::system::error_code& ec) override { ec = {}; }
        void finalize(boost::system::error_code& ec) override { ec = {}; }

        const std::string& str() const noexcept { return m_data; }
        std::string take() { return std::move(m_data); }

       private:
        std::string m_data;
    };

    /// @brief OutputStream that discards everything, counting bytes.
    class NullOutputStream final : public OutputStream {
       public:
        void write(net::const_buffer buffer,
                   boost::system::error_code& ec) override {
            ec = {};
            m_count += buffer.size();
        }

        void flush(boost::system::error_code& ec) override { ec = {}; }
        void finalize(boost::system::error_code& ec) override { ec = {}; }

        std::uint64_t bytes_written() const noexcept { return m_count; }

       private:
        std::uint64_t m_count{0};
    };

}  // namespace pooled_http
