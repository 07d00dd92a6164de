#include "pooled_http/http_client.hpp"

#include <stdexcept>
#include <utility>

#include "pooled_http/log.hpp"

namespace pooled_http {

    HttpClient::HttpClient(HttpClientConfiguration config)
        : m_config(std::move(config)),
          m_pool(m_io.get_executor(), m_ssl_context, m_config.pool,
                 static_cast<const ClientConfiguration&>(m_config)) {
        if (m_config.log_level) {
            set_log_level(*m_config.log_level);
        }

        if (m_config.base_url && !m_config.base_url->empty()) {
            auto parsed = url_utils::parse_base_url(*m_config.base_url);
            if (!parsed) {
                throw std::runtime_error("Invalid base_url: " +
                                         parsed.error().message);
            }
            m_base_url = std::move(parsed).value();
        }

        init_tls_on_ssl_context(m_ssl_context, m_config.verify_tls);
    }

    HttpClient::~HttpClient() noexcept { m_pool.shutdown(); }

    Result<Response> HttpClient::request(
        std::string_view url,
        const std::function<void(RequestWriter&)>& configure) {
        auto resolved = resolve_request_url(url);
        if (!resolved) {
            return resolved.forward_error<Response>();
        }
        const UrlComponents& u = resolved.value();

        auto lease = m_pool.acquire(endpoint_from_url(u));
        if (!lease) {
            return lease.forward_error<Response>();
        }
        Client* client = lease.value().get();
        if (!client) {
            return Result<Response>::err(Error::Code::PoolShutdown,
                                         "Pool is shutting down");
        }

        auto res = client->request([&](RequestWriter& w) {
            w.target(u.target);
            if (configure) configure(w);
        });
        if (!res) {
            return res;
        }

        // The client stays checked out while the body is pending.
        if (!res.value().is_finalized()) {
            res.value().attach_lease(std::move(lease).value());
        }
        return res;
    }

    Result<Lease> HttpClient::open(std::string host, std::uint16_t port,
                                   bool tls) {
        Endpoint ep;
        ep.host = std::move(host);
        ep.port = port;
        ep.tls = tls;
        if (ep.host.empty()) {
            return Result<Lease>::err(Error::Code::InvalidUrl,
                                      "Host must not be empty");
        }
        return m_pool.acquire(std::move(ep));
    }

    Result<Response> HttpClient::get(std::string_view url) {
        return request(url);
    }

    Result<Response> HttpClient::head(std::string_view url) {
        return request(url,
                       [](RequestWriter& w) { w.method(HttpMethod::Head); });
    }

    Result<Response> HttpClient::del(std::string_view url) {
        return request(
            url, [](RequestWriter& w) { w.method(HttpMethod::Delete); });
    }

    Result<Response> HttpClient::options(std::string_view url) {
        return request(
            url, [](RequestWriter& w) { w.method(HttpMethod::Options); });
    }

    Result<Response> HttpClient::post(
        std::string_view url, std::string_view body,
        std::optional<std::string_view> content_type) {
        return send_with_body(HttpMethod::Post, url, body, content_type);
    }

    Result<Response> HttpClient::put(
        std::string_view url, std::string_view body,
        std::optional<std::string_view> content_type) {
        return send_with_body(HttpMethod::Put, url, body, content_type);
    }

    Result<Response> HttpClient::patch(
        std::string_view url, std::string_view body,
        std::optional<std::string_view> content_type) {
        return send_with_body(HttpMethod::Patch, url, body, content_type);
    }

    Result<Response> HttpClient::send_with_body(
        HttpMethod method, std::string_view url, std::string_view body,
        std::optional<std::string_view> content_type) {
        return request(url, [&](RequestWriter& w) {
            w.method(method);
            w.write_body(body, content_type);
        });
    }

}  // namespace pooled_http
