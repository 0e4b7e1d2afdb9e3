#pragma once
#include <boost/beast/http/verb.hpp>

namespace http = boost::beast::http;

namespace s3_cpp {
    /// @brief Verbs the object operations put on the wire. Head is only
    /// used for probes and has no response body.
    enum class HttpMethod {
        Get,
        Put,
        Head,
    };

    inline constexpr http::verb to_boost_http_method(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Head:
                return http::verb::head;
        }
        return http::verb::unknown;
    }

}  // namespace s3_cpp
