#pragma once
#include <stdexcept>
#include <string>

namespace pooled_http {
    /**
     * @brief Represents an error reported by an HTTP operation.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,          /**< The provided URL is malformed or invalid. */
            ConnectionFailed,    /**< Failed to resolve or connect the TCP socket. */
            TlsHandshakeFailed,  /**< Failed to perform the TLS handshake. */
            Timeout,             /**< Waiting for a pooled client timed out. */
            SendFailed,          /**< Failed to send the request. */
            ReceiveFailed,       /**< Failed to receive the response. */
            ParseError,          /**< The peer sent a malformed response head. */
            UnsupportedEncoding, /**< Unknown Transfer- or Content-Encoding. */
            InvalidJson,         /**< The response body is not valid JSON. */
            PoolShutdown,        /**< The connection pool has been shut down. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Return a stable name for an error code, for logs and messages.
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::ParseError:
                return "ParseError";
            case Error::Code::UnsupportedEncoding:
                return "UnsupportedEncoding";
            case Error::Code::InvalidJson:
                return "InvalidJson";
            case Error::Code::PoolShutdown:
                return "PoolShutdown";
        }
        return "Unknown";
    }

    /**
     * @brief Thrown when the caller breaks the request/response protocol of
     * use, e.g. issuing a second request on a client whose response is still
     * pending.
     *
     * These are programmer errors and are not meant to be recovered from.
     */
    class UsageError : public std::logic_error {
       public:
        using std::logic_error::logic_error;
    };
}  // namespace pooled_http
