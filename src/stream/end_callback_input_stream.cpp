#include "pooled_http/stream/end_callback_input_stream.hpp"

namespace pooled_http {

    std::size_t EndCallbackInputStream::read_some(
        net::mutable_buffer buffer, boost::system::error_code& ec) {
        if (m_in == nullptr) {
            if (m_aborted) {
                ec = net::error::operation_aborted;
            } else if (m_failure) {
                ec = m_failure;
            } else {
                ec = net::error::eof;
            }
            return 0;
        }

        std::size_t n = m_in->read_some(buffer, ec);
        if (ec == net::error::eof) {
            fire({});
            ec = net::error::eof;
            return 0;
        }
        if (ec) {
            m_failure = ec;
            fire(m_failure);
            ec = m_failure;
            return 0;
        }

        boost::system::error_code empty_ec;
        bool done = m_in->empty(empty_ec);
        if (empty_ec) {
            // The bytes already read are still good; the next read reports
            // the failure.
            m_failure = empty_ec;
            fire(m_failure);
        } else if (done) {
            fire({});
        }
        return n;
    }

    bool EndCallbackInputStream::empty(boost::system::error_code& ec) {
        ec = {};
        if (m_in == nullptr) {
            if (m_failure) ec = m_failure;
            return true;
        }

        bool done = m_in->empty(ec);
        if (ec) {
            m_failure = ec;
            fire(m_failure);
            ec = m_failure;
            return false;
        }
        if (done) fire({});
        return done;
    }

    void EndCallbackInputStream::fire(const boost::system::error_code& ec) {
        m_in = nullptr;
        auto cb = std::move(m_on_end);
        m_on_end = nullptr;
        if (cb) cb(ec);
    }

}  // namespace pooled_http
