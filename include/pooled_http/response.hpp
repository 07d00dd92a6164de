#pragma once

#include <boost/beast/http/fields.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "pooled_http/connection/lease.hpp"
#include "pooled_http/result.hpp"
#include "pooled_http/stream/input_stream.hpp"

namespace pooled_http {
    namespace http = boost::beast::http;

    class Client;
    class Connection;
    struct ClientConfiguration;

    /** @brief How the body is delimited on the wire. */
    enum class TransferCoding {
        None,          /**< No framing headers: the body is empty. */
        LengthLimited, /**< Content-Length bytes. */
        Chunked,       /**< Transfer-Encoding: chunked. */
    };

    /** @brief How the body bytes are compressed. */
    enum class ContentCoding { Identity, Gzip, Deflate };

    /// @brief Decode selection resolved once from the response headers.
    struct BodyCoding {
        TransferCoding transfer{TransferCoding::None};
        std::uint64_t content_length{0};
        ContentCoding content{ContentCoding::Identity};

        /// @brief True when the body is known to be empty without reading.
        bool known_empty() const noexcept {
            return transfer == TransferCoding::None ||
                   (transfer == TransferCoding::LengthLimited &&
                    content_length == 0);
        }
    };

    /**
     * @brief Choose the decode pipeline from Transfer-Encoding,
     * Content-Length and Content-Encoding.
     * @return UnsupportedEncoding naming an unknown coding, ParseError for
     * an invalid Content-Length.
     */
    Result<BodyCoding> select_body_coding(const http::fields& headers);

    /**
     * @brief One HTTP response, bound to the Client that received it until
     * it is finalized.
     *
     * The head is parsed by a Beast response parser, which then stays with
     * the response to pull the body. The body is exposed as a lazily built
     * decode pipeline: transfer decoding by that parser, then content
     * decoding (gzip or deflate), then an end-of-stream hook that finalizes
     * the response.
     * Finalizing gives the Client back (Connected, or Disconnected when the
     * transport cannot be reused) and releases an attached Lease.
     *
     * Move-only. A response must not outlive the Client that produced it.
     */
    class Response {
       public:
        Response(Response&& other) noexcept;
        Response& operator=(Response&& other) noexcept;
        Response(const Response&) = delete;
        Response& operator=(const Response&) = delete;

        /// @brief An unfinalized response disconnects its Client.
        ~Response();

        int status_code() const noexcept;
        std::string_view status_phrase() const noexcept;

        /// @brief 10 for HTTP/1.0, 11 for HTTP/1.1.
        unsigned version() const noexcept;

        /// @brief Case-insensitive header fields, in wire order.
        const http::fields& headers() const noexcept;

        /// @brief True for the answer to a HEAD request.
        bool is_head_response() const noexcept;

        bool is_finalized() const noexcept;

        /// @brief Whether the transport may be reused after this response.
        bool keep_alive() const noexcept;

        /**
         * @brief Decoded body stream, built on first call and cached.
         *
         * The stream stays valid for the lifetime of the Response; once the
         * body is exhausted it keeps reporting end of stream. A response
         * without a body yields an empty stream.
         *
         * @throws UsageError after read_raw_body(), or if the response was
         * finalized before the body was ever requested.
         * @return UnsupportedEncoding (or ParseError) if the headers name a
         * coding that cannot be decoded; the Client is then disconnected
         * and the response finalized.
         */
        Result<InputStream*> body_reader();

        /// @brief Read the whole decoded body into a string.
        Result<std::string> read_body();

        /// @brief Read the body and parse it as JSON.
        Result<nlohmann::json> read_json();

        /// @brief read_json() converted with nlohmann::json::get<T>().
        template <typename T>
        Result<T> read_json_as() {
            auto j = read_json();
            if (j.has_error()) return j.template forward_error<T>();
            try {
                return Result<T>::ok(j.value().template get<T>());
            } catch (const nlohmann::json::exception& e) {
                return Result<T>::err(Error::Code::InvalidJson, e.what());
            }
        }

        /**
         * @brief Hand the undecoded transport to @p consumer, then finalize.
         *
         * The consumer must read exactly the body as framed by the headers.
         * If it throws, the Client is disconnected and the exception
         * propagates.
         * @throws UsageError if body_reader() was used or the response is
         * already finalized.
         */
        void read_raw_body(const std::function<void(InputStream&)>& consumer);

        /**
         * @brief Discard the rest of the body so the transport can be
         * reused.
         * @return Number of decoded bytes discarded.
         */
        Result<std::uint64_t> drop_body();

        /**
         * @brief Give the Client back and release the decode stages and any
         * attached Lease.
         * @note Idempotent. A body that was not read to the end makes the
         * transport unusable, so it is closed.
         */
        void finalize() noexcept;

        /// @brief Keep @p lease checked out until this response finalizes.
        void attach_lease(Lease lease);

       private:
        friend class Client;
        struct Impl;

        explicit Response(std::unique_ptr<Impl> impl);

        /**
         * @brief Parse the status line and headers arriving on @p conn for
         * @p client.
         * @return ParseError for a malformed head or one exceeding the
         * limits in @p config, ReceiveFailed if the transport fails first.
         */
        static Result<Response> read(Client& client, Connection& conn,
                                     bool head_request,
                                     const ClientConfiguration& config);

        static void finalize(Impl& impl) noexcept;
        static void on_body_end(Impl& impl,
                                const boost::system::error_code& ec) noexcept;

        /// @brief The Client is tearing its transport down.
        static void abandon(Impl& impl) noexcept;

        void discard() noexcept;

        std::unique_ptr<Impl> m_impl;
    };

}  // namespace pooled_http
