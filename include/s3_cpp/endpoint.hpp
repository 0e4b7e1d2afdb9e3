#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <boost/asio/ssl/error.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <string>
#include <string_view>

namespace s3_cpp {

    /// @brief scheme + host + port of the single service a pool talks to.
    struct Endpoint {
        std::string host;
        std::string port;
        bool https{false};

        void clear() {
            host.clear();
            port.clear();
            https = false;
        }

        inline void normalize_default_port() {
            if (port.empty()) port = https ? "443" : "80";
        }

        inline void normalize_host() {
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        inline bool is_default_port() const noexcept {
            return port.empty() || port == (https ? "443" : "80");
        }

        /// @brief Value for the Host header: the port is only spelled out
        /// when it is not the scheme default.
        inline std::string host_header() const {
            if (is_default_port()) return host;
            return host + ":" + port;
        }

        inline std::string_view scheme() const noexcept {
            return https ? "https" : "http";
        }

        friend bool operator==(Endpoint const& a, Endpoint const& b) noexcept {
            return a.https == b.https && a.host == b.host && a.port == b.port;
        }
    };

    /// @brief Set SNI on an OpenSSL handle owned by an asio/beast ssl stream.
    template <class SslStream>
    inline bool set_sni(SslStream& stream, const std::string& host,
                        boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

}  // namespace s3_cpp

namespace std {
    template <>
    struct hash<s3_cpp::Endpoint> {
        size_t operator()(s3_cpp::Endpoint const& e) const noexcept {
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
            };
            h ^= static_cast<size_t>(e.https);
            h *= 1099511628211ull;
            mix(e.host);
            mix(e.port);
            return h;
        }
    };
}  // namespace std
