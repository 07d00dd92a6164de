#pragma once
#include <boost/log/trivial.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace pooled_http {
    /**
     * @brief Configuration shared by every Client created for an endpoint.
     */
    struct ClientConfiguration {
        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"pooled_http/1.0"};

        /** @brief Extra headers applied to every request before the build
         * callback runs. The callback may still override them. */
        std::map<std::string, std::string> default_headers;

        /** @brief Longest accepted status or header line, in bytes. */
        std::size_t max_header_line_length{4096};

        /** @brief Largest accepted response head (status line and all
         * header fields), in bytes. */
        std::uint32_t max_header_size{64 * 1024};

        /** @brief Whether to verify TLS peer certificates. */
        bool verify_tls{true};
    };

    /**
     * @brief Configuration for the per-endpoint client pool.
     */
    struct ConnectionPoolConfiguration {
        /** @brief Maximum Clients per endpoint (host, port, tls). Callers
         * beyond this block in acquire(). */
        std::size_t max_clients_per_endpoint{8};

        /** @brief How long acquire() may block. Zero waits forever. */
        std::chrono::milliseconds acquire_timeout{30000};

        /** @brief Idle Clients older than this are disconnected and dropped.
         * Zero keeps idle Clients indefinitely. */
        std::chrono::milliseconds idle_ttl{0};

        /** @brief Whether to close idle transports on pool shutdown. */
        bool close_on_shutdown{true};
    };

    /**
     * @brief Configuration for the HttpClient facade.
     */
    struct HttpClientConfiguration : public ClientConfiguration {
        /** @brief Optional base URL that relative request URLs resolve
         * against. */
        std::optional<std::string> base_url;

        /** @brief Pool sizing and idle policy. */
        ConnectionPoolConfiguration pool;

        /** @brief When set, installs a global Boost.Log severity filter. */
        std::optional<boost::log::trivial::severity_level> log_level;
    };
}  // namespace pooled_http
