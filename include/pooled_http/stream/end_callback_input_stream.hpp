#pragma once

#include <functional>

#include "pooled_http/stream/input_stream.hpp"

namespace pooled_http {

    /**
     * @brief Invokes a hook exactly once when the wrapped stream is
     * exhausted or fails.
     *
     * The hook receives a clear error_code on normal exhaustion and the
     * failure otherwise. Exhaustion is detected eagerly: after each read the
     * wrapped stream is asked whether it is empty, so the hook runs together
     * with the read that returned the last byte. Once the hook has run the
     * wrapped stream is never touched again; reads report end of stream, or
     * the failure that ended it.
     */
    class EndCallbackInputStream final : public InputStream {
       public:
        using Callback = std::function<void(const boost::system::error_code&)>;

        EndCallbackInputStream(InputStream& in, Callback on_end)
            : m_in(&in), m_on_end(std::move(on_end)) {}

        std::size_t read_some(net::mutable_buffer buffer,
                              boost::system::error_code& ec) override;

        bool empty(boost::system::error_code& ec) override;

        /// @brief Detach from the wrapped stream without running the hook.
        /// Later reads fail with net::error::operation_aborted.
        void abort() noexcept {
            m_in = nullptr;
            m_on_end = nullptr;
            m_aborted = true;
        }

        bool ended() const noexcept { return m_in == nullptr; }

       private:
        void fire(const boost::system::error_code& ec);

        InputStream* m_in;
        Callback m_on_end;
        boost::system::error_code m_failure;
        bool m_aborted{false};
    };

}  // namespace pooled_http
