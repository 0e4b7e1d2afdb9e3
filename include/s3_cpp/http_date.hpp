#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace s3_cpp {

    using Timestamp = std::chrono::sys_seconds;

    /// @brief Format as RFC 1123, e.g. `Sun, 06 Nov 1994 08:49:37 GMT`.
    std::string format_http_date(Timestamp t);

    /// @brief Parse the RFC 1123 form produced by format_http_date().
    /// @return nullopt when the text is not a valid RFC 1123 date.
    /// @note The weekday name must be well formed but is not cross-checked
    /// against the date.
    std::optional<Timestamp> parse_http_date(std::string_view text);

}  // namespace s3_cpp
