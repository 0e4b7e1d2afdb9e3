#pragma once

#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without it

#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

#include "s3_cpp/config.hpp"
#include "s3_cpp/endpoint.hpp"
#include "s3_cpp/request.hpp"
#include "s3_cpp/result.hpp"

namespace s3_cpp {

    /**
     * @brief Receives the response of one exchange, in wire order.
     *
     * on_response_headers() is called once, before any body chunk. Each
     * on_response_body() call completes before the channel reads more data
     * from the socket. Returning an error from either aborts the exchange and
     * becomes the result of Channel::exchange().
     */
    class ExchangeHandler {
       public:
        virtual ~ExchangeHandler() = default;

        virtual Status on_response_headers(int status,
                                           const HeaderList& headers) = 0;

        virtual Status on_response_body(std::span<const std::uint8_t> chunk) = 0;
    };

    /**
     * @brief An established connection to the endpoint, able to run one
     * request/response exchange at a time.
     */
    class Channel {
       public:
        virtual ~Channel() = default;

        /// @brief Send `req` (pulling its body stream) and stream the
        /// response into `handler`.
        /// @return ok once the whole response was delivered, otherwise the
        /// transport error or the error returned by the handler.
        virtual boost::asio::awaitable<Status> exchange(
            const WireRequest& req, ExchangeHandler& handler) = 0;

        /// @brief False once the peer or a failed exchange closed the channel.
        virtual bool is_open() const noexcept = 0;

        virtual void close() noexcept = 0;
    };

    /// @brief Everything a transport needs to open one channel.
    struct ConnectOptions {
        Endpoint endpoint;
        SocketOptions socket;
        std::optional<TlsConfiguration> tls;
        std::optional<ProxyConfiguration> proxy;
        std::size_t window_size{0};
        std::size_t buffer_size{0};
    };

    /**
     * @brief Injected I/O provider used by the pool to open channels.
     */
    class Transport {
       public:
        virtual ~Transport() = default;

        virtual boost::asio::awaitable<Result<std::unique_ptr<Channel>>>
        connect(const ConnectOptions& options) = 0;
    };

}  // namespace s3_cpp
