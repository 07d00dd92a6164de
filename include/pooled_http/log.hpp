#pragma once

#include <boost/log/trivial.hpp>

namespace pooled_http {

    /**
     * @brief Drop every Boost.Log record below @p min_severity.
     *
     * pooled_http logs through BOOST_LOG_TRIVIAL: request and response
     * heads at trace, transport and pool events at debug, dropped bodies at
     * warning, protocol faults at error. The filter is process-wide.
     */
    void set_log_level(boost::log::trivial::severity_level min_severity);

}  // namespace pooled_http
