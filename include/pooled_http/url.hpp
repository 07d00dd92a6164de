#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

#include "endpoint.hpp"
#include "result.hpp"

namespace pooled_http {

    struct UrlComponents {
        bool https{false};
        std::string host;
        std::uint16_t port{0};
        // For a parsed absolute URL: path + optional query.
        // For a parsed base URL (via parse_base_url): normalized prefix path
        // ("" or "/api"). For a resolved URL: the full request target.
        std::string target;
    };

    /// @brief The pooling key a URL maps to.
    inline Endpoint endpoint_from_url(const UrlComponents& u) {
        Endpoint ep;
        ep.host = u.host;
        ep.port = u.port;
        ep.tls = u.https;
        ep.normalize_default_port();
        ep.normalize_host();
        return ep;
    }

    namespace url_utils {

        /// @brief True if the URL starts with "http://" or "https://".
        inline bool is_absolute_url_with_protocol(std::string_view s) {
            return (s.rfind("https://", 0) == 0) ||
                   (s.rfind("http://", 0) == 0);
        }

        inline std::string trim_trailing_slashes(std::string s) {
            while (!s.empty() && s.back() == '/') s.pop_back();
            return s;
        }

        inline Result<UrlComponents> invalid_url(std::string msg) {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg));
        }

        /// @brief Parse a base_url into components suitable for resolving
        /// relative targets. The returned target is a normalized prefix:
        /// "/" becomes "", trailing '/' is removed, a query is rejected.
        inline Result<UrlComponents> parse_base_url(std::string_view base_url);

        /// @brief Resolve an absolute URL, or a relative one against a base
        /// parsed with parse_base_url.
        inline Result<UrlComponents> resolve_url(
            std::string_view uri_or_url,
            const UrlComponents* base /*nullable*/);

    }  // namespace url_utils

    /// @brief Parse an absolute http(s) URL into its components.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        using url_utils::invalid_url;

        std::string_view s(url);

        bool https = false;
        if (s.rfind("https://", 0) == 0) {
            https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return invalid_url("URL schema must be http or https");
        }

        // Split authority from path; a query may follow the host directly.
        std::string_view hostport = s;
        std::string_view path = "/";
        if (auto cut = s.find_first_of("/?#"); cut != std::string_view::npos) {
            hostport = s.substr(0, cut);
            path = s.substr(cut);
        }
        if (auto frag = path.find('#'); frag != std::string_view::npos) {
            path = path.substr(0, frag);
        }

        if (hostport.empty()) {
            return invalid_url("URL must contain a host name");
        }
        if (hostport.find('@') != std::string_view::npos) {
            return invalid_url("URL user info is not supported");
        }

        std::string_view host = hostport;
        std::string_view port;

        if (hostport.front() == '[') {
            // [v6-address]:port
            auto close = hostport.find(']');
            if (close == std::string_view::npos) {
                return invalid_url("URL has an unterminated IPv6 literal");
            }
            host = hostport.substr(1, close - 1);
            std::string_view rest = hostport.substr(close + 1);
            if (!rest.empty()) {
                if (rest.front() != ':') {
                    return invalid_url("URL has junk after IPv6 literal");
                }
                port = rest.substr(1);
                if (port.empty()) return invalid_url("URL has empty port");
            }
        } else if (auto colon = hostport.rfind(':');
                   colon != std::string_view::npos) {
            host = hostport.substr(0, colon);
            port = hostport.substr(colon + 1);
            if (port.empty()) return invalid_url("URL has empty port");
        }

        if (host.empty()) return invalid_url("URL must contain a host name");

        std::uint16_t port_num = 0;
        if (!port.empty()) {
            auto [ptr, ec] =
                std::from_chars(port.data(), port.data() + port.size(),
                                port_num);
            if (ec != std::errc{} || ptr != port.data() + port.size() ||
                port_num == 0) {
                return invalid_url("URL has an invalid port: " +
                                   std::string(port));
            }
        } else {
            port_num = https ? 443 : 80;
        }

        UrlComponents out;
        out.https = https;
        out.host = std::string(host);
        out.port = port_num;
        if (path.empty()) {
            out.target = "/";
        } else if (path.front() == '?') {
            out.target = "/" + std::string(path);
        } else {
            out.target = std::string(path);
        }
        return Result<UrlComponents>::ok(std::move(out));
    }

    namespace url_utils {

        inline Result<UrlComponents> parse_base_url(std::string_view base_url) {
            if (base_url.empty()) {
                return invalid_url("base_url is empty");
            }
            if (!is_absolute_url_with_protocol(base_url)) {
                return invalid_url("base_url must start with http:// or https://");
            }

            auto parsed = pooled_http::parse_url(base_url);
            if (parsed.has_error()) return parsed;

            UrlComponents b = std::move(parsed).value();

            b.target = trim_trailing_slashes(std::move(b.target));
            if (b.target.find('?') != std::string::npos) {
                return invalid_url("base_url must not include query parameters");
            }

            return Result<UrlComponents>::ok(std::move(b));
        }

        inline Result<UrlComponents> resolve_url(std::string_view uri_or_url,
                                                 const UrlComponents* base) {
            if (is_absolute_url_with_protocol(uri_or_url)) {
                return pooled_http::parse_url(uri_or_url);
            }

            if (base == nullptr || base->host.empty()) {
                return invalid_url("Relative URI provided but base_url is empty");
            }

            // "" => "/", "health" => "/health"
            std::string rel;
            if (uri_or_url.empty() || uri_or_url.front() != '/') {
                rel.push_back('/');
            }
            rel.append(uri_or_url);

            UrlComponents out;
            out.https = base->https;
            out.host = base->host;
            out.port = base->port;
            out.target = base->target + rel;  // prefix has no trailing '/'
            return Result<UrlComponents>::ok(std::move(out));
        }

    }  // namespace url_utils

}  // namespace pooled_http
