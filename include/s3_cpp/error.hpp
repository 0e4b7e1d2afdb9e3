#pragma once
#include <string>

namespace s3_cpp {
    /**
     * @brief Represents an error occurred during a pool or transfer operation.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidConfig,     /**< Pool, TLS or proxy configuration rejected. */
            ConnectionFailed,  /**< Failed to establish a TCP connection. */
            TlsHandshakeFailed,/**< Failed to perform TLS handshake. */
            ProxyFailed,       /**< Proxy refused or broke the tunnel. */
            Timeout,           /**< The operation timed out. */
            SendFailed,        /**< Failed to send the request. */
            ReceiveFailed,     /**< Failed to receive the response. */
            NetworkError,      /**< General network error. */
            Shutdown,          /**< The pool has been shut down. */
            InvalidRelease,    /**< Released a lease the pool does not own. */
            HeaderMapping,     /**< A single header could not be interpreted. */
            SupplierFailed,    /**< The request data supplier raised. */
            ConsumerCallbackFailed, /**< A caller callback raised. */
            HttpStatus,        /**< The service answered with a non-2xx status. */
            Unknown,           /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
        /** @brief Native transport error value (0 when not applicable). */
        int native_code{0};
        /** @brief HTTP status for Code::HttpStatus, 0 otherwise. */
        int http_status{0};
        /** @brief Service error code from the error body, e.g. NoSuchKey. */
        std::string service_code{};
    };

    /// @brief Convert Error::Code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidConfig:
                return "InvalidConfig";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::ProxyFailed:
                return "ProxyFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::NetworkError:
                return "NetworkError";
            case Error::Code::Shutdown:
                return "Shutdown";
            case Error::Code::InvalidRelease:
                return "InvalidRelease";
            case Error::Code::HeaderMapping:
                return "HeaderMapping";
            case Error::Code::SupplierFailed:
                return "SupplierFailed";
            case Error::Code::ConsumerCallbackFailed:
                return "ConsumerCallbackFailed";
            case Error::Code::HttpStatus:
                return "HttpStatus";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    /// @brief Transport failures that may succeed on a fresh connection.
    /// @note Says nothing about whether the request body can be replayed.
    inline bool is_retryable(const Error& e) noexcept {
        switch (e.code) {
            case Error::Code::ConnectionFailed:
            case Error::Code::SendFailed:
            case Error::Code::ReceiveFailed:
            case Error::Code::Timeout:
                return true;
            default:
                return false;
        }
    }
}  // namespace s3_cpp
