#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "pooled_http/config.hpp"
#include "pooled_http/connection/connection.hpp"
#include "pooled_http/endpoint.hpp"
#include "pooled_http/request.hpp"
#include "pooled_http/response.hpp"
#include "pooled_http/result.hpp"

namespace pooled_http {

    /**
     * @brief Drives one request/response exchange at a time over a reusable
     * transport to a single endpoint.
     *
     * States: Disconnected -> Connected -> Requesting -> AwaitingResponse ->
     * Connected (response finalized) or Disconnected (transport dropped).
     * The transport is opened lazily by request() and reopened whenever it
     * has died in between.
     *
     * Not thread-safe; a ConnectionPool Lease gives one thread exclusive use.
     */
    class Client {
       public:
        enum class State { Disconnected, Connected, Requesting, AwaitingResponse };

        /**
         * @brief Constructs a Client bound to no endpoint yet.
         * @param executor Executor the transport sockets run on.
         * @param ssl_ctx TLS context used for https endpoints.
         * @param config User-Agent, default headers and limits.
         */
        Client(boost::asio::any_io_executor executor,
               boost::asio::ssl::context& ssl_ctx,
               ClientConfiguration config = {});

        ~Client();

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;
        Client(Client&&) = delete;
        Client& operator=(Client&&) = delete;

        /**
         * @brief Bind the target endpoint. Nothing is opened until the first
         * request.
         * @throws UsageError while a response is pending.
         */
        void connect(std::string host, std::uint16_t port = 0, bool tls = false);
        void connect(Endpoint endpoint);

        /// @brief Abandon any pending response and close the transport.
        void disconnect() noexcept;

        /**
         * @brief Issue one request.
         *
         * Opens the transport if needed, applies the default headers
         * (User-Agent, Connection, Accept-Encoding, Host and the configured
         * extras), then lets @p build set method, target, headers and body.
         * Whatever @p build leaves unfinished is finalized afterwards.
         *
         * @throws UsageError while the previous response is still pending,
         * or if no endpoint was bound. Exceptions thrown by @p build
         * disconnect the client and propagate.
         * @return The parsed response, or ConnectionFailed,
         * TlsHandshakeFailed, SendFailed, ReceiveFailed, ParseError.
         */
        Result<Response> request(const std::function<void(RequestWriter&)>& build);

        State state() const noexcept { return m_state; }

        /// @brief True while a request is being written or its response is
        /// not yet finalized.
        bool busy() const noexcept {
            return m_state == State::Requesting ||
                   m_state == State::AwaitingResponse;
        }

        const Endpoint& endpoint() const noexcept { return m_endpoint; }

        /// @brief Identity of the open transport, 0 when there is none.
        std::uint64_t transport_id() const noexcept {
            return m_conn ? m_conn->id() : 0;
        }

        const ClientConfiguration& config() const noexcept { return m_config; }

       private:
        friend class Response;

        /// @brief Called by the pending response when it finalizes.
        void on_response_finalized(bool reuse_transport) noexcept;

        void apply_default_headers(RequestWriter& writer) const;

        boost::asio::any_io_executor m_ex;
        boost::asio::ssl::context& m_ssl_ctx;
        ClientConfiguration m_config;

        Endpoint m_endpoint{};
        std::unique_ptr<Connection> m_conn;
        State m_state{State::Disconnected};
        Response::Impl* m_pending{nullptr};
    };

    inline const char* to_string(Client::State state) {
        switch (state) {
            case Client::State::Disconnected:
                return "Disconnected";
            case Client::State::Connected:
                return "Connected";
            case Client::State::Requesting:
                return "Requesting";
            case Client::State::AwaitingResponse:
                return "AwaitingResponse";
        }
        return "Unknown";
    }

}  // namespace pooled_http
