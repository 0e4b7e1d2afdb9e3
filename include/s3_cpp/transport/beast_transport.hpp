#pragma once

#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without it

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>
#include <string_view>

#include "s3_cpp/config.hpp"
#include "s3_cpp/result.hpp"
#include "s3_cpp/transport/transport.hpp"

namespace s3_cpp {

    /**
     * @brief Default Transport on Boost.Beast.
     *
     * Opens plain TCP or TLS channels, optionally through an HTTP CONNECT
     * proxy (itself reached over TCP or TLS, with optional Basic auth).
     * Request bodies are streamed with a buffer_body serializer; response
     * bodies are read in chunks of min(window_size, buffer_size), each
     * handed to the ExchangeHandler before the next read.
     */
    class BeastTransport final : public Transport {
       public:
        explicit BeastTransport(boost::asio::any_io_executor ex)
            : m_ex(std::move(ex)) {}

        boost::asio::awaitable<Result<std::unique_ptr<Channel>>> connect(
            const ConnectOptions& options) override;

       private:
        boost::asio::any_io_executor m_ex;
    };

    /// @brief Client TLS context: system roots plus the configured CA file
    /// or directory, peer verification per `tls.verify_peer`.
    /// @return InvalidConfig when a CA location cannot be loaded.
    Result<std::shared_ptr<boost::asio::ssl::context>> make_tls_context(
        const TlsConfiguration& tls);

    /// @brief Standard base64, as used by `Proxy-Authorization: Basic`.
    std::string base64_encode(std::string_view in);

}  // namespace s3_cpp
