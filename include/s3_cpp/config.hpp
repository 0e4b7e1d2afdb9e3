#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace s3_cpp {

    class RequestInterceptor;

    /**
     * @brief TLS settings for the endpoint (or for the proxy hop).
     */
    struct TlsConfiguration {
        /** @brief Whether to verify the peer certificate chain and host name. */
        bool verify_peer{true};
        /** @brief Extra PEM bundle to trust, in addition to system roots. */
        std::optional<std::string> ca_file;
        /** @brief Extra hashed CA directory to trust. */
        std::optional<std::string> ca_path;
        /** @brief SNI / verification name override. Defaults to the host. */
        std::optional<std::string> server_name;
    };

    /**
     * @brief HTTP proxy used as a CONNECT tunnel.
     */
    struct ProxyConfiguration {
        enum class AuthType : std::uint8_t { None, Basic };

        std::string host;
        std::uint16_t port{0};
        /** @brief Speak TLS to the proxy itself. */
        std::optional<TlsConfiguration> tls;
        AuthType auth_type{AuthType::None};
        std::string username;
        std::string password;
    };

    /**
     * @brief Socket-level behaviour of every pooled connection.
     */
    struct SocketOptions {
        /** @brief Timeout for resolve + connect + handshakes. */
        std::chrono::milliseconds connect_timeout{3000};
        /** @brief Timeout applied to each read or write. */
        std::chrono::milliseconds io_timeout{30000};
        bool keep_alive{true};
    };

    /**
     * @brief Configuration for ConnectionPoolManager.
     */
    struct ConnectionPoolConfiguration {
        /** @brief `scheme://host[:port]`, scheme is http or https. */
        std::string endpoint_uri;

        /** @brief Upper bound on live connections (idle + leased + connecting). */
        std::int64_t max_connections{16};

        /** @brief Flow-control window in bytes. */
        std::int64_t window_size{8 * 1024 * 1024};

        /** @brief Size of the I/O buffer used for each read and write. */
        std::int64_t buffer_size{64 * 1024};

        /** @brief Required iff the endpoint scheme is https. */
        std::optional<TlsConfiguration> tls;

        std::optional<ProxyConfiguration> proxy;

        SocketOptions socket;

        /** @brief How long acquire() may wait in the queue. Unset waits forever. */
        std::optional<std::chrono::milliseconds> acquire_timeout;

        /** @brief Idle connections older than this are dropped. Zero disables. */
        std::chrono::milliseconds idle_timeout{60000};
    };

    /**
     * @brief Configuration for MetaRequestEngine.
     */
    struct MetaRequestConfiguration {
        /** @brief Address buckets as `/bucket/key` instead of `bucket.host`. */
        bool path_style{false};

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"s3_cpp/1.0"};

        /** @brief Attempts per operation, including the first. */
        std::uint32_t max_attempts{3};

        /** @brief Cap on the error body kept for non-2xx responses. */
        std::size_t max_error_body_bytes{64 * 1024};

        /** @brief Applied in order to every wire request, e.g. a signer. */
        std::vector<std::shared_ptr<const RequestInterceptor>> interceptors;
    };

    /**
     * @brief Sink setup for LoggerManager::init().
     */
    struct LoggingConfiguration {
        /** @brief trace, debug, info, warn, error, critical or off. */
        std::string level{"info"};
        /** @brief console, file, all or off. */
        std::string output{"console"};
        std::string file_path{"logs/s3_cpp.log"};
        std::size_t max_size_mb{10};
        std::size_t max_files{3};
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};
    };

}  // namespace s3_cpp
