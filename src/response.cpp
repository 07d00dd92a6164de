#include "pooled_http/response.hpp"

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/log/trivial.hpp>
#include <charconv>
#include <limits>
#include <optional>
#include <utility>
#include <variant>

#include "pooled_http/client.hpp"
#include "pooled_http/config.hpp"
#include "pooled_http/connection/connection.hpp"
#include "pooled_http/connection/parser_input_stream.hpp"
#include "pooled_http/stream/end_callback_input_stream.hpp"
#include "pooled_http/stream/inflate_input_stream.hpp"
#include "pooled_http/stream/memory_stream.hpp"

namespace pooled_http {
    namespace beast = boost::beast;

    namespace {
        std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
                s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
                s.remove_suffix(1);
            return s;
        }

        std::string format_fields(const http::fields& fields) {
            std::string out;
            for (auto const& f : fields) {
                out.append(f.name_string());
                out.append(": ");
                out.append(f.value());
                out.push_back('\n');
            }
            return out;
        }

        /// @brief Malformed or oversized input, as opposed to a transport
        /// failure or the peer going away.
        bool is_protocol_error(const boost::system::error_code& ec) {
            static const auto& category =
                make_error_code(http::error::bad_version).category();
            return ec.category() == category &&
                   ec != http::error::end_of_stream &&
                   ec != http::error::partial_message;
        }

        /// @brief Enforce what the parser does not check on its own.
        std::optional<std::string> check_head(
            const http::response_header<>& head, std::size_t max_line_length) {
            if (head.version() != 10 && head.version() != 11) {
                return "Unsupported HTTP version " +
                       std::to_string(head.version() / 10) + "." +
                       std::to_string(head.version() % 10);
            }
            if (head.result_int() < 100) {
                return "Malformed status code " +
                       std::to_string(head.result_int());
            }
            // "HTTP/1.1 " + code + " " + phrase
            if (9 + 3 + 1 + head.reason().size() > max_line_length) {
                return "Status line exceeds " +
                       std::to_string(max_line_length) + " bytes";
            }
            for (auto const& f : head) {
                if (f.name_string().size() + 2 + f.value().size() >
                    max_line_length) {
                    return "Header line \"" + std::string(f.name_string()) +
                           "\" exceeds " + std::to_string(max_line_length) +
                           " bytes";
                }
            }
            return std::nullopt;
        }
    }  // namespace

    Result<BodyCoding> select_body_coding(const http::fields& headers) {
        BodyCoding out;

        if (auto te = headers.find(http::field::transfer_encoding);
            te != headers.end()) {
            auto value = trim(te->value());
            if (!beast::iequals(value, "chunked") ||
                headers.count(http::field::transfer_encoding) > 1) {
                return Result<BodyCoding>::err(
                    Error::Code::UnsupportedEncoding,
                    "Unsupported Transfer-Encoding: " + std::string(value));
            }
            out.transfer = TransferCoding::Chunked;
        } else if (headers.count(http::field::content_length) > 0) {
            std::optional<std::uint64_t> length;
            for (auto const& f : headers) {
                if (f.name() != http::field::content_length) continue;
                auto text = trim(f.value());
                std::uint64_t n = 0;
                auto [ptr, ec] =
                    std::from_chars(text.data(), text.data() + text.size(), n);
                if (text.empty() || ec != std::errc{} ||
                    ptr != text.data() + text.size() ||
                    (length && *length != n)) {
                    return Result<BodyCoding>::err(
                        Error::Code::ParseError,
                        "Invalid Content-Length: " + std::string(text));
                }
                length = n;
            }
            out.transfer = TransferCoding::LengthLimited;
            out.content_length = *length;
        }

        if (auto ce = headers.find(http::field::content_encoding);
            ce != headers.end()) {
            auto value = trim(ce->value());
            if (value.empty() || beast::iequals(value, "identity")) {
                out.content = ContentCoding::Identity;
            } else if (beast::iequals(value, "gzip") ||
                       beast::iequals(value, "x-gzip")) {
                out.content = ContentCoding::Gzip;
            } else if (beast::iequals(value, "deflate")) {
                out.content = ContentCoding::Deflate;
            } else {
                return Result<BodyCoding>::err(
                    Error::Code::UnsupportedEncoding,
                    "Unsupported Content-Encoding: " + std::string(value));
            }
        }

        return Result<BodyCoding>::ok(out);
    }

    struct Response::Impl {
        Client* client{nullptr};  // nulled once finalized
        Connection* transport{nullptr};

        ResponseParser parser;
        bool head_request{false};
        bool bodiless{false};
        bool close_transport{false};
        bool body_complete{false};
        bool finalized{false};
        bool raw_read{false};

        const http::response_header<>& head() const noexcept {
            return parser.get();
        }

        // Decode pipeline, outermost last.
        std::variant<std::monostate, MemoryInputStream, ParserInputStream>
            transfer;
        std::optional<InflateInputStream> content;
        std::optional<EndCallbackInputStream> end;

        Lease lease;
    };

    Response::Response(std::unique_ptr<Impl> impl) : m_impl(std::move(impl)) {}

    Response::Response(Response&& other) noexcept = default;

    Response& Response::operator=(Response&& other) noexcept {
        if (this != &other) {
            discard();
            m_impl = std::move(other.m_impl);
        }
        return *this;
    }

    Response::~Response() { discard(); }

    void Response::discard() noexcept {
        if (!m_impl || m_impl->finalized) return;
        auto& impl = *m_impl;

        if (impl.end == std::nullopt) {
            // Nothing was read, but an empty body needs no draining.
            auto coding = select_body_coding(impl.head());
            if (coding && coding.value().known_empty()) {
                impl.body_complete = true;
                finalize(impl);
                return;
            }
        }

        BOOST_LOG_TRIVIAL(warning)
            << "pooled_http: dropping unread body of HTTP "
            << impl.head().result_int() << " response";
        if (impl.client) {
            impl.client->disconnect();
        }
        finalize(impl);
    }

    int Response::status_code() const noexcept {
        return static_cast<int>(m_impl->head().result_int());
    }

    std::string_view Response::status_phrase() const noexcept {
        return m_impl->head().reason();
    }

    unsigned Response::version() const noexcept {
        return m_impl->head().version();
    }

    const http::fields& Response::headers() const noexcept {
        return m_impl->head();
    }

    bool Response::is_head_response() const noexcept {
        return m_impl->head_request;
    }

    bool Response::is_finalized() const noexcept { return m_impl->finalized; }

    bool Response::keep_alive() const noexcept {
        return !m_impl->close_transport;
    }

    Result<Response> Response::read(Client& client, Connection& conn,
                                    bool head_request,
                                    const ClientConfiguration& config) {
        auto impl = std::make_unique<Impl>();
        auto& parser = impl->parser;
        parser.header_limit(config.max_header_size);
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        parser.skip(head_request);

        boost::system::error_code ec;
        auto reader = conn.socket_reader();
        http::read_header(reader, conn.read_buffer(), parser, ec);
        if (ec) {
            auto code = is_protocol_error(ec) ? Error::Code::ParseError
                                              : Error::Code::ReceiveFailed;
            return Result<Response>::err(
                code, "Failed to read response head: " + ec.message());
        }
        if (auto bad =
                check_head(impl->head(), config.max_header_line_length)) {
            return Result<Response>::err(Error::Code::ParseError, *bad);
        }
        parser.eager(true);

        const auto& head = impl->head();
        BOOST_LOG_TRIVIAL(trace)
            << "pooled_http: response head HTTP/" << head.version() / 10
            << '.' << head.version() % 10 << ' ' << head.result_int() << ' '
            << head.reason() << '\n'
            << format_fields(head);

        const unsigned code = head.result_int();
        impl->head_request = head_request;
        impl->bodiless =
            head_request || code == 204 || code == 304 || code < 200;
        impl->close_transport = !parser.get().keep_alive();

        impl->client = &client;
        impl->transport = &conn;
        client.m_pending = impl.get();

        Response res(std::move(impl));
        if (res.m_impl->bodiless) {
            res.m_impl->body_complete = true;
            finalize(*res.m_impl);
        }
        return Result<Response>::ok(std::move(res));
    }

    Result<InputStream*> Response::body_reader() {
        auto& impl = *m_impl;
        if (impl.raw_read) {
            throw UsageError("Body already consumed by read_raw_body()");
        }
        if (impl.end) return Result<InputStream*>::ok(&*impl.end);

        if (impl.bodiless) {
            auto& empty = impl.transfer.emplace<MemoryInputStream>();
            impl.end.emplace(empty, nullptr);
            return Result<InputStream*>::ok(&*impl.end);
        }
        if (impl.finalized) {
            throw UsageError("Response already finalized");
        }

        auto coding = select_body_coding(impl.head());
        if (coding.has_error()) {
            BOOST_LOG_TRIVIAL(error) << "pooled_http: " << coding.error().message;
            impl.close_transport = true;
            if (impl.client) impl.client->disconnect();
            finalize(impl);
            return coding.forward_error<InputStream*>();
        }
        const auto& bc = coding.value();

        InputStream* stage = nullptr;
        switch (bc.transfer) {
            case TransferCoding::Chunked:
            case TransferCoding::LengthLimited:
                stage = &impl.transfer.emplace<ParserInputStream>(
                    *impl.transport, impl.parser);
                break;
            case TransferCoding::None:
                stage = &impl.transfer.emplace<MemoryInputStream>();
                break;
        }

        if (bc.content != ContentCoding::Identity && !bc.known_empty()) {
            stage = &impl.content.emplace(
                *stage, bc.content == ContentCoding::Gzip
                            ? InflateInputStream::Format::Gzip
                            : InflateInputStream::Format::Deflate);
        }

        Impl* self = &impl;
        impl.end.emplace(*stage, [self](const boost::system::error_code& ec) {
            on_body_end(*self, ec);
        });
        return Result<InputStream*>::ok(&*impl.end);
    }

    Result<std::string> Response::read_body() {
        auto reader = body_reader();
        if (reader.has_error()) return reader.forward_error<std::string>();

        boost::system::error_code ec;
        auto body = read_all(*reader.value(), ec);
        if (ec) {
            return Result<std::string>::err(
                Error::Code::ReceiveFailed,
                "Failed to read response body: " + ec.message());
        }
        return Result<std::string>::ok(std::move(body));
    }

    Result<nlohmann::json> Response::read_json() {
        auto body = read_body();
        if (body.has_error()) return body.forward_error<nlohmann::json>();
        try {
            return Result<nlohmann::json>::ok(
                nlohmann::json::parse(body.value()));
        } catch (const nlohmann::json::parse_error& e) {
            return Result<nlohmann::json>::err(Error::Code::InvalidJson,
                                               e.what());
        }
    }

    void Response::read_raw_body(
        const std::function<void(InputStream&)>& consumer) {
        auto& impl = *m_impl;
        if (impl.end) {
            throw UsageError("read_raw_body() after body_reader()");
        }
        if (impl.raw_read || impl.finalized || impl.transport == nullptr) {
            throw UsageError("Response already finalized");
        }
        impl.raw_read = true;

        try {
            consumer(*impl.transport);
        } catch (...) {
            impl.close_transport = true;
            if (impl.client) impl.client->disconnect();
            finalize(impl);
            throw;
        }
        impl.body_complete = true;
        finalize(impl);
    }

    Result<std::uint64_t> Response::drop_body() {
        auto& impl = *m_impl;
        if (impl.finalized) return Result<std::uint64_t>::ok(0u);

        auto reader = body_reader();
        if (reader.has_error()) return reader.forward_error<std::uint64_t>();

        boost::system::error_code ec;
        NullOutputStream sink;
        auto n = pipe(*reader.value(), sink, ec);
        if (ec) {
            return Result<std::uint64_t>::err(
                Error::Code::ReceiveFailed,
                "Failed to drain response body: " + ec.message());
        }
        return Result<std::uint64_t>::ok(n);
    }

    void Response::finalize() noexcept {
        if (m_impl) finalize(*m_impl);
    }

    void Response::attach_lease(Lease lease) {
        if (m_impl->finalized) return;  // released when `lease` goes
        m_impl->lease = std::move(lease);
    }

    void Response::finalize(Impl& impl) noexcept {
        if (impl.finalized) return;
        impl.finalized = true;

        // Detach the outer stream before its inner stages go away.
        if (impl.end && !impl.end->ended()) impl.end->abort();

        Client* client = std::exchange(impl.client, nullptr);
        if (client) {
            bool reuse = impl.body_complete && !impl.close_transport;
            client->on_response_finalized(reuse);
        }

        impl.content.reset();
        impl.transfer.emplace<std::monostate>();
        impl.transport = nullptr;

        impl.lease.release();
    }

    void Response::on_body_end(Impl& impl,
                               const boost::system::error_code& ec) noexcept {
        if (ec) {
            BOOST_LOG_TRIVIAL(debug)
                << "pooled_http: response body failed: " << ec.message();
            impl.close_transport = true;
        } else {
            impl.body_complete = true;
        }
        finalize(impl);
    }

    void Response::abandon(Impl& impl) noexcept {
        // The client already dropped its transport.
        impl.client = nullptr;
        impl.close_transport = true;
        finalize(impl);
    }

}  // namespace pooled_http
