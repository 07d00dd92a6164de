#pragma once
#include <boost/beast/http/verb.hpp>
#include <string_view>

namespace pooled_http {
    namespace http = boost::beast::http;

    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options,
        Trace,
        Connect,
    };

    inline constexpr http::verb to_beast_verb(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Patch:
                return http::verb::patch;
            case HttpMethod::Delete:
                return http::verb::delete_;
            case HttpMethod::Head:
                return http::verb::head;
            case HttpMethod::Options:
                return http::verb::options;
            case HttpMethod::Trace:
                return http::verb::trace;
            case HttpMethod::Connect:
                return http::verb::connect;
            default:
                return http::verb::unknown;
        }
    }

    /// @brief Method token as written on the request line, e.g. "DELETE".
    inline std::string_view to_string(HttpMethod method) {
        auto verb = to_beast_verb(method);
        if (verb == http::verb::unknown) return {};
        return http::to_string(verb);
    }

}  // namespace pooled_http
