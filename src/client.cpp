#include "pooled_http/client.hpp"

#include <boost/log/trivial.hpp>
#include <utility>

#include "pooled_http/error.hpp"

namespace pooled_http {

    Client::Client(boost::asio::any_io_executor executor,
                   boost::asio::ssl::context& ssl_ctx,
                   ClientConfiguration config)
        : m_ex(std::move(executor)),
          m_ssl_ctx(ssl_ctx),
          m_config(std::move(config)) {}

    Client::~Client() { disconnect(); }

    void Client::connect(std::string host, std::uint16_t port, bool tls) {
        Endpoint ep;
        ep.host = std::move(host);
        ep.port = port;
        ep.tls = tls;
        connect(std::move(ep));
    }

    void Client::connect(Endpoint endpoint) {
        if (busy()) {
            throw UsageError("Cannot connect: a response is still pending");
        }
        endpoint.normalize_default_port();
        endpoint.normalize_host();
        if (m_conn && endpoint == m_endpoint) return;

        disconnect();
        m_endpoint = std::move(endpoint);
        m_conn = std::make_unique<Connection>(m_ex, m_ssl_ctx, m_endpoint,
                                              m_config.verify_tls);
    }

    void Client::disconnect() noexcept {
        Response::Impl* pending = std::exchange(m_pending, nullptr);
        if (m_conn) m_conn->close();
        m_state = State::Disconnected;
        if (pending) Response::abandon(*pending);
    }

    Result<Response> Client::request(
        const std::function<void(RequestWriter&)>& build) {
        if (busy()) {
            throw UsageError(
                "Interleaved request: the previous response has not been "
                "finalized");
        }
        if (!m_conn) {
            throw UsageError("Client has no endpoint; call connect() first");
        }

        if (!m_conn->is_alive()) {
            if (m_state == State::Connected) {
                BOOST_LOG_TRIVIAL(debug)
                    << "pooled_http: transport to " << to_string(m_endpoint)
                    << " went stale, reconnecting";
            }
            m_state = State::Disconnected;
            auto opened = m_conn->open();
            if (opened.has_error()) {
                return opened.forward_error<Response>();
            }
            m_state = State::Connected;
        } else {
            BOOST_LOG_TRIVIAL(debug) << "pooled_http: reusing transport #"
                                     << m_conn->id() << " to "
                                     << to_string(m_endpoint);
        }

        m_state = State::Requesting;
        RequestWriter writer(*m_conn);
        apply_default_headers(writer);

        try {
            build(writer);
            writer.finalize();
        } catch (...) {
            // The request may be half written.
            disconnect();
            throw;
        }

        if (writer.error()) {
            auto msg = writer.error().message();
            disconnect();
            return Result<Response>::err(Error::Code::SendFailed,
                                         "Failed to send request: " + msg);
        }

        m_state = State::AwaitingResponse;
        auto res = Response::read(*this, *m_conn,
                                  writer.method() == http::verb::head,
                                  m_config);
        if (res.has_error()) {
            if (res.error().code == Error::Code::ParseError) {
                BOOST_LOG_TRIVIAL(error)
                    << "pooled_http: bad response from "
                    << to_string(m_endpoint) << ": " << res.error().message;
            }
            disconnect();
        }
        return res;
    }

    void Client::on_response_finalized(bool reuse_transport) noexcept {
        m_pending = nullptr;
        if (reuse_transport && m_conn && m_conn->is_open()) {
            m_state = State::Connected;
            return;
        }
        if (m_conn) m_conn->close();
        m_state = State::Disconnected;
    }

    void Client::apply_default_headers(RequestWriter& writer) const {
        writer.set(http::field::user_agent, m_config.user_agent);
        writer.set(http::field::connection, "keep-alive");
        writer.set(http::field::accept_encoding, "gzip, deflate");
        writer.set(http::field::host, host_header_value(m_endpoint));
        for (auto const& [name, value] : m_config.default_headers) {
            writer.set(name, value);
        }
    }

}  // namespace pooled_http
