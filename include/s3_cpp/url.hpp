#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

#include "endpoint.hpp"
#include "result.hpp"

namespace s3_cpp {

    namespace url_utils {

        /// @brief Percent-encode everything outside the RFC 3986 unreserved
        /// set. When `keep_slash` is true, '/' passes through unchanged so
        /// object keys keep their "directory" structure.
        inline std::string url_encode(std::string_view in,
                                      bool keep_slash = false) {
            static constexpr char hex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(in.size());
            for (unsigned char c : in) {
                const bool unreserved = (c >= 'A' && c <= 'Z') ||
                                        (c >= 'a' && c <= 'z') ||
                                        (c >= '0' && c <= '9') || c == '-' ||
                                        c == '_' || c == '.' || c == '~';
                if (unreserved || (keep_slash && c == '/')) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back('%');
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0x0F]);
                }
            }
            return out;
        }

        /// @brief Append `name=value` to a target, choosing '?' or '&'.
        inline void append_query(std::string& target, std::string_view name,
                                 std::string_view value) {
            target.push_back(target.find('?') == std::string::npos ? '?' : '&');
            target += url_encode(name);
            target.push_back('=');
            target += url_encode(value);
        }

    }  // namespace url_utils

    /// @brief Parse `scheme://host[:port][/]` into an Endpoint.
    /// @return InvalidConfig when the scheme is absent or not http/https,
    /// when the host is absent, or when the port is not a number in
    /// [1, 65535]. A path other than "/" is rejected too: a pool is bound to
    /// a service, not to a resource.
    inline Result<Endpoint> parse_endpoint_uri(std::string_view uri) {
        auto make_err = [&](std::string msg) -> Result<Endpoint> {
            return Result<Endpoint>::err(Error::Code::InvalidConfig,
                                         std::move(msg));
        };

        auto sep = uri.find("://");
        if (sep == std::string_view::npos || sep == 0) {
            return make_err("Endpoint URI does not have a scheme");
        }

        Endpoint ep;
        std::string_view scheme = uri.substr(0, sep);
        if (scheme == "https") {
            ep.https = true;
        } else if (scheme == "http") {
            ep.https = false;
        } else {
            return make_err("Endpoint URI has unknown scheme '" +
                            std::string(scheme) + "'");
        }

        std::string_view rest = uri.substr(sep + 3);
        std::string_view hostport = rest;
        if (auto slash = rest.find('/'); slash != std::string_view::npos) {
            hostport = rest.substr(0, slash);
            std::string_view path = rest.substr(slash);
            if (path != "/") {
                return make_err("Endpoint URI must not carry a path");
            }
        }

        if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
            std::string_view port = hostport.substr(colon + 1);
            unsigned value = 0;
            auto [ptr, ec] =
                std::from_chars(port.data(), port.data() + port.size(), value);
            if (port.empty() || ec != std::errc{} ||
                ptr != port.data() + port.size() || value == 0 ||
                value > 65535) {
                return make_err("Endpoint URI has an invalid port");
            }
            ep.port = std::string(port);
            hostport = hostport.substr(0, colon);
        }

        if (hostport.empty()) {
            return make_err("Endpoint URI does not have a host name");
        }

        ep.host = std::string(hostport);
        ep.normalize_default_port();
        ep.normalize_host();
        return Result<Endpoint>::ok(std::move(ep));
    }

    /// @brief Regional S3 endpoint, e.g. https://s3.us-west-2.amazonaws.com
    inline std::string default_endpoint_uri(std::string_view region) {
        return "https://s3." + std::string(region) + ".amazonaws.com";
    }

}  // namespace s3_cpp
