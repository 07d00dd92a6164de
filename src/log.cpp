#include "pooled_http/log.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace pooled_http {

    void set_log_level(boost::log::trivial::severity_level min_severity) {
        boost::log::core::get()->set_filter(boost::log::trivial::severity >=
                                            min_severity);
    }

}  // namespace pooled_http
