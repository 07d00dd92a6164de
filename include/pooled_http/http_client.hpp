#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "pooled_http/config.hpp"
#include "pooled_http/connection/connection_pool.hpp"
#include "pooled_http/request.hpp"
#include "pooled_http/response.hpp"
#include "pooled_http/result.hpp"
#include "pooled_http/url.hpp"

namespace pooled_http {

    /**
     * @brief A blocking HTTP/1.1 client with per-endpoint connection reuse.
     *
     * Owns the I/O context, the TLS context and the ConnectionPool. Each
     * call checks a Client out of the pool for the URL's endpoint; the
     * checkout follows the returned Response until that response is
     * finalized.
     *
     * Thread-safe: any number of threads may issue requests concurrently.
     * A returned Response belongs to the calling thread.
     */
    class HttpClient {
       public:
        /**
         * @brief Constructs an HttpClient with the given configuration.
         * @param config Client defaults, pool sizing, base URL, log level.
         * @throws std::runtime_error if base_url is set but invalid.
         */
        explicit HttpClient(HttpClientConfiguration config = {});
        ~HttpClient() noexcept;

        HttpClient(const HttpClient&) = delete;
        HttpClient& operator=(const HttpClient&) = delete;

        HttpClient(HttpClient&&) = delete;
        HttpClient& operator=(HttpClient&&) = delete;

        /**
         * @brief Returns the client's configuration.
         */
        [[nodiscard]] const HttpClientConfiguration& config() const noexcept {
            return m_config;
        }

        [[nodiscard]] ConnectionPool& pool() noexcept { return m_pool; }

        /**
         * @brief Sends a request to @p url.
         *
         * The target is taken from the URL; @p configure then sets the
         * method, headers and body on the writer. A GET with no body is
         * sent when @p configure is empty.
         *
         * @param url Absolute http(s) URL, or a path when base_url is set.
         * @return The response, or InvalidUrl, Timeout, PoolShutdown and
         * the transport errors of Client::request().
         */
        [[nodiscard]] Result<Response> request(
            std::string_view url,
            const std::function<void(RequestWriter&)>& configure = {});

        /**
         * @brief Check out a pooled Client for manual driving.
         * @param host Host name or address.
         * @param port Port, 0 for the scheme default.
         * @param tls Whether to use https.
         */
        [[nodiscard]] Result<Lease> open(std::string host,
                                         std::uint16_t port = 0,
                                         bool tls = false);

        /**
         * @brief Convenience methods for common HTTP verbs.
         * @{
         */
        [[nodiscard]] Result<Response> get(std::string_view url);
        [[nodiscard]] Result<Response> head(std::string_view url);
        [[nodiscard]] Result<Response> del(std::string_view url);
        [[nodiscard]] Result<Response> options(std::string_view url);

        /**
         * @brief Performs a POST request.
         * @param url The target URL or path.
         * @param body The request body, sent with a Content-Length.
         * @param content_type Content-Type header, if any.
         */
        [[nodiscard]] Result<Response> post(
            std::string_view url, std::string_view body,
            std::optional<std::string_view> content_type = std::nullopt);

        [[nodiscard]] Result<Response> put(
            std::string_view url, std::string_view body,
            std::optional<std::string_view> content_type = std::nullopt);

        [[nodiscard]] Result<Response> patch(
            std::string_view url, std::string_view body,
            std::optional<std::string_view> content_type = std::nullopt);
        /** @} */

       private:
        Result<Response> send_with_body(
            HttpMethod method, std::string_view url, std::string_view body,
            std::optional<std::string_view> content_type);

        [[nodiscard]] Result<UrlComponents> resolve_request_url(
            std::string_view url) const {
            const UrlComponents* base = m_base_url ? &*m_base_url : nullptr;
            return url_utils::resolve_url(url, base);
        }

        HttpClientConfiguration m_config{};
        std::optional<UrlComponents> m_base_url;

        boost::asio::io_context m_io{1};
        boost::asio::ssl::context m_ssl_context{
            boost::asio::ssl::context::tls_client};

        ConnectionPool m_pool;
    };

}  // namespace pooled_http
