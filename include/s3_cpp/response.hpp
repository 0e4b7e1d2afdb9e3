#pragma once

#include <boost/beast/http/fields.hpp>

#include "request.hpp"

namespace s3_cpp {

    /// @brief Copy Boost.Beast response headers into a HeaderList.
    /// @note Wire order and duplicate names are kept.
    inline void copy_response_headers(const boost::beast::http::fields& in,
                                      HeaderList& out) {
        out.clear();
        for (auto const& field : in) {
            out.push_back({std::string(field.name_string()),
                           std::string(field.value())});
        }
    }

    inline bool is_success_status(int status) noexcept {
        return status >= 200 && status < 300;
    }

}  // namespace s3_cpp
