#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pooled_http {

    /**
     * @brief Pooling identity of a server: host, port and whether TLS is
     * used. Two requests with equal endpoints may share a Client.
     */
    struct Endpoint {
        std::string host;
        std::uint16_t port{0};
        bool tls{false};

        void clear() {
            host.clear();
            port = 0;
            tls = false;
        }

        /// @brief Port 0 means the scheme default.
        inline void normalize_default_port() {
            if (port == 0) port = tls ? 443 : 80;
        }

        inline void normalize_host() {
            if (host.empty()) host = "localhost";
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        inline bool has_default_port() const noexcept {
            return port == (tls ? 443 : 80);
        }

        friend bool operator==(Endpoint const& a, Endpoint const& b) noexcept {
            return a.tls == b.tls && a.host == b.host && a.port == b.port;
        }

        friend bool operator!=(Endpoint const& a, Endpoint const& b) noexcept {
            return !(a == b);
        }
    };

    /// @brief "host:port", with an "https://" prefix for TLS endpoints.
    inline std::string to_string(const Endpoint& ep) {
        std::string out = ep.tls ? "https://" : "http://";
        out += ep.host;
        out += ':';
        out += std::to_string(ep.port);
        return out;
    }

    /// @brief Value for the Host request header: the port is only spelled
    /// out when it differs from the scheme default.
    inline std::string host_header_value(const Endpoint& ep) {
        if (ep.port == 0 || ep.has_default_port()) return ep.host;
        return ep.host + ":" + std::to_string(ep.port);
    }

    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Load the system trust store and choose the verification mode.
    inline void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                        bool verify_peer) {
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }

        ssl_context.set_verify_mode(verify_peer
                                        ? boost::asio::ssl::verify_peer
                                        : boost::asio::ssl::verify_none);
    }

}  // namespace pooled_http

namespace std {
    template <>
    struct hash<pooled_http::Endpoint> {
        size_t operator()(pooled_http::Endpoint const& e) const noexcept {
            // FNV-1a over tls, port and host.
            size_t h = 1469598103934665603ull;
            auto mix = [&](unsigned char c) {
                h ^= c;
                h *= 1099511628211ull;
            };
            mix(static_cast<unsigned char>(e.tls));
            mix(static_cast<unsigned char>(e.port & 0xff));
            mix(static_cast<unsigned char>(e.port >> 8));
            for (unsigned char c : e.host) mix(c);
            return h;
        }
    };
}  // namespace std
