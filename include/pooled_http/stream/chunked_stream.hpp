#pragma once

#include "pooled_http/stream/input_stream.hpp"

namespace pooled_http {

    /**
     * @brief Frames every write as one chunk with Beast's chunk encoder;
     * finalize() writes the last chunk and an empty trailer.
     *
     * Responses are never decoded here: the response parser removes chunk
     * framing itself.
     */
    class ChunkedOutputStream final : public OutputStream {
       public:
        explicit ChunkedOutputStream(OutputStream& out) : m_out(&out) {}

        void write(net::const_buffer buffer,
                   boost::system::error_code& ec) override;

        void flush(boost::system::error_code& ec) override { m_out->flush(ec); }

        void finalize(boost::system::error_code& ec) override;

       private:
        OutputStream* m_out;
        bool m_finalized{false};
    };

}  // namespace pooled_http
