#pragma once

#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "pooled_http/http_method.hpp"
#include "pooled_http/stream/chunked_stream.hpp"
#include "pooled_http/stream/input_stream.hpp"

namespace pooled_http {

    /**
     * @brief Serializes one HTTP/1.x request onto an OutputStream.
     *
     * Method, target and header fields may be changed until the header
     * block is written. The header block is written exactly once, either by
     * write_header() or by the first body_writer() call, through Beast's
     * request serializer. Body framing follows the headers at that moment:
     * `Transfer-Encoding: chunked` selects the chunk encoder, anything else
     * writes the body bytes as they are.
     *
     * Breaking that order throws UsageError. Transport errors do not throw;
     * the first one is kept in error() and later writes are skipped.
     */
    class RequestWriter {
       public:
        enum class Framing { None, FixedLength, Chunked };

        explicit RequestWriter(OutputStream& out) : m_out(&out) {}

        RequestWriter(const RequestWriter&) = delete;
        RequestWriter& operator=(const RequestWriter&) = delete;

        void method(HttpMethod m) { method(to_beast_verb(m)); }
        void method(http::verb v);
        http::verb method() const noexcept { return m_head.method(); }

        void target(std::string_view t);
        std::string_view target() const noexcept { return m_head.target(); }

        /// @brief 11 for HTTP/1.1 (the default), 10 for HTTP/1.0.
        void version(unsigned v);
        unsigned version() const noexcept { return m_head.version(); }

        /// @brief Set a header, replacing any previous value.
        void set(http::field name, std::string_view value);
        void set(std::string_view name, std::string_view value);

        void erase(http::field name);
        void erase(std::string_view name);

        /// @brief Case-insensitive view of the header fields.
        const http::fields& headers() const noexcept { return m_head; }

        bool header_written() const noexcept { return m_header_written; }
        bool finalized() const noexcept { return m_finalized; }
        Framing framing() const noexcept { return m_framing; }

        /// @brief Write the request line and the header block.
        /// @throws UsageError if the header block was already written.
        void write_header();

        /**
         * @brief Stream that body bytes go through. Writes the header block
         * on first use.
         */
        OutputStream& body_writer();

        /// @brief Send @p body with a Content-Length, then finalize.
        void write_body(std::string_view body,
                        std::optional<std::string_view> content_type =
                            std::nullopt);

        /// @brief Send exactly @p length bytes of @p body with a
        /// Content-Length, then finalize.
        void write_body(InputStream& body, std::uint64_t length);

        /// @brief Send @p body chunked until it is exhausted, then finalize.
        void write_body(InputStream& body);

        /// @brief Send @p body as `application/json`.
        void write_json_body(const nlohmann::json& body);

        /**
         * @brief Complete the request. Writes the header block if nothing
         * was written yet, otherwise ends the body (last chunk) and flushes.
         * @note Idempotent.
         */
        void finalize();

        /// @brief First transport or source error seen while writing.
        const boost::system::error_code& error() const noexcept {
            return m_error;
        }

       private:
        /// @brief Forwards to the selected body stream, keeping the first
        /// error in the writer.
        class BodySink final : public OutputStream {
           public:
            explicit BodySink(RequestWriter& owner) : m_owner(&owner) {}

            void write(net::const_buffer buffer,
                       boost::system::error_code& ec) override;
            void flush(boost::system::error_code& ec) override;
            void finalize(boost::system::error_code& ec) override;

           private:
            RequestWriter* m_owner;
        };

        void record(const boost::system::error_code& ec);
        void ensure_head_mutable(const char* what) const;
        void ensure_not_finalized(const char* what) const;

        OutputStream* m_out;
        http::request<http::empty_body> m_head{http::verb::get, "/", 11};

        bool m_header_written{false};
        bool m_finalized{false};
        Framing m_framing{Framing::None};
        std::optional<ChunkedOutputStream> m_chunked;
        OutputStream* m_body{nullptr};
        BodySink m_sink{*this};
        boost::system::error_code m_error;
    };

}  // namespace pooled_http
