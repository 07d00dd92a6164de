#include "pooled_http/request.hpp"

#include <boost/beast/core/buffers_range.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/rfc7230.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/log/trivial.hpp>
#include <boost/system/system_error.hpp>
#include <nlohmann/json.hpp>

#include "pooled_http/error.hpp"

namespace pooled_http {
    namespace beast = boost::beast;

    namespace {
        /// @brief Beast SyncWriteStream over an OutputStream.
        class OutputStreamWriter {
           public:
            explicit OutputStreamWriter(OutputStream& out) : m_out(&out) {}

            template <class ConstBufferSequence>
            std::size_t write_some(const ConstBufferSequence& buffers) {
                boost::system::error_code ec;
                std::size_t n = write_some(buffers, ec);
                if (ec) throw boost::system::system_error(ec);
                return n;
            }

            template <class ConstBufferSequence>
            std::size_t write_some(const ConstBufferSequence& buffers,
                                   boost::system::error_code& ec) {
                ec = {};
                std::size_t n = 0;
                for (net::const_buffer b : beast::buffers_range_ref(buffers)) {
                    m_out->write(b, ec);
                    if (ec) return n;
                    n += b.size();
                }
                return n;
            }

           private:
            OutputStream* m_out;
        };

        bool has_line_break(std::string_view s) {
            return s.find_first_of("\r\n") != std::string_view::npos;
        }

        bool is_chunked(const http::fields& fields) {
            auto it = fields.find(http::field::transfer_encoding);
            if (it == fields.end()) return false;
            http::token_list codings{it->value()};
            bool last_chunked = false;
            for (auto const& coding : codings) {
                last_chunked = beast::iequals(coding, "chunked");
            }
            return last_chunked;
        }
    }  // namespace

    void RequestWriter::method(http::verb v) {
        ensure_head_mutable("method");
        if (v == http::verb::unknown) {
            throw UsageError("Unknown request method");
        }
        m_head.method(v);
    }

    void RequestWriter::target(std::string_view t) {
        ensure_head_mutable("target");
        if (t.empty() || has_line_break(t) ||
            t.find(' ') != std::string_view::npos) {
            throw UsageError("Invalid request target: " + std::string(t));
        }
        m_head.target(t);
    }

    void RequestWriter::version(unsigned v) {
        ensure_head_mutable("version");
        if (v != 10 && v != 11) {
            throw UsageError("Unsupported HTTP version " + std::to_string(v));
        }
        m_head.version(v);
    }

    void RequestWriter::set(http::field name, std::string_view value) {
        ensure_head_mutable("header");
        if (has_line_break(value)) {
            throw UsageError("Header value contains a line break");
        }
        m_head.set(name, value);
    }

    void RequestWriter::set(std::string_view name, std::string_view value) {
        ensure_head_mutable("header");
        if (name.empty() || has_line_break(name) || has_line_break(value) ||
            name.find(':') != std::string_view::npos) {
            throw UsageError("Invalid header field: " + std::string(name));
        }
        m_head.set(name, value);
    }

    void RequestWriter::erase(http::field name) {
        ensure_head_mutable("header");
        m_head.erase(name);
    }

    void RequestWriter::erase(std::string_view name) {
        ensure_head_mutable("header");
        m_head.erase(name);
    }

    void RequestWriter::write_header() {
        if (m_header_written) {
            throw UsageError("Request header block already written");
        }
        ensure_not_finalized("write the header block");

        if (is_chunked(m_head)) {
            m_framing = Framing::Chunked;
        } else if (m_head.count(http::field::content_length) > 0) {
            m_framing = Framing::FixedLength;
        } else {
            m_framing = Framing::None;
        }

        BOOST_LOG_TRIVIAL(trace) << "pooled_http: request head\n"
                                 << m_head.base();

        m_header_written = true;
        OutputStreamWriter stream(*m_out);
        http::request_serializer<http::empty_body> sr{m_head};
        boost::system::error_code ec;
        http::write_header(stream, sr, ec);
        record(ec);
    }

    OutputStream& RequestWriter::body_writer() {
        ensure_not_finalized("write the body");
        if (m_body) return m_sink;

        if (!m_header_written) write_header();

        if (m_framing == Framing::Chunked) {
            m_chunked.emplace(*m_out);
            m_body = &*m_chunked;
        } else {
            m_body = m_out;
        }
        return m_sink;
    }

    void RequestWriter::write_body(std::string_view body,
                                   std::optional<std::string_view> content_type) {
        ensure_not_finalized("write the body");
        if (content_type) set(http::field::content_type, *content_type);
        set(http::field::content_length, std::to_string(body.size()));

        auto& out = body_writer();
        if (!body.empty()) {
            boost::system::error_code ec;
            pooled_http::write(out, body, ec);
        }
        finalize();
    }

    void RequestWriter::write_body(InputStream& body, std::uint64_t length) {
        ensure_not_finalized("write the body");
        set(http::field::content_length, std::to_string(length));

        auto& out = body_writer();
        boost::system::error_code ec;
        pipe(body, out, length, ec);
        record(ec);
        finalize();
    }

    void RequestWriter::write_body(InputStream& body) {
        ensure_not_finalized("write the body");
        erase(http::field::content_length);
        set(http::field::transfer_encoding, "chunked");

        auto& out = body_writer();
        boost::system::error_code ec;
        pipe(body, out, ec);
        record(ec);
        finalize();
    }

    void RequestWriter::write_json_body(const nlohmann::json& body) {
        write_body(body.dump(), std::string_view("application/json"));
    }

    void RequestWriter::finalize() {
        if (m_finalized) return;
        if (!m_body) body_writer();

        boost::system::error_code ec;
        if (!m_error) {
            if (m_chunked) {
                m_chunked->finalize(ec);
            } else {
                m_out->flush(ec);
            }
            record(ec);
        }
        m_finalized = true;
        m_body = nullptr;
    }

    void RequestWriter::BodySink::write(net::const_buffer buffer,
                                        boost::system::error_code& ec) {
        if (m_owner->m_error) {
            ec = m_owner->m_error;
            return;
        }
        if (!m_owner->m_body) {
            throw UsageError("Request body written after finalize");
        }
        m_owner->m_body->write(buffer, ec);
        m_owner->record(ec);
    }

    void RequestWriter::BodySink::flush(boost::system::error_code& ec) {
        if (m_owner->m_error) {
            ec = m_owner->m_error;
            return;
        }
        if (!m_owner->m_body) {
            ec = {};
            return;
        }
        m_owner->m_body->flush(ec);
        m_owner->record(ec);
    }

    void RequestWriter::BodySink::finalize(boost::system::error_code& ec) {
        m_owner->finalize();
        ec = m_owner->m_error;
    }

    void RequestWriter::record(const boost::system::error_code& ec) {
        if (ec && !m_error) m_error = ec;
    }

    void RequestWriter::ensure_head_mutable(const char* what) const {
        if (m_header_written) {
            throw UsageError(std::string("Cannot change request ") + what +
                             " after the header block was written");
        }
    }

    void RequestWriter::ensure_not_finalized(const char* what) const {
        if (m_finalized) {
            throw UsageError(std::string("Cannot ") + what +
                             ": request already finalized");
        }
    }

}  // namespace pooled_http
