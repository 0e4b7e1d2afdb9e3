#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "s3_cpp/error.hpp"
#include "s3_cpp/request.hpp"

namespace s3_cpp {

    /// @brief Receives the status line and headers of a response.
    class ResponseHeadersHandler {
       public:
        virtual ~ResponseHeadersHandler() = default;

        virtual void on_response_headers(int /*status*/,
                                         const HeaderList& /*headers*/) {}
    };

    /// @brief Receives body chunks of a retrieval, in order.
    ///
    /// The next chunk is not read from the connection until this returns.
    /// Throwing aborts the transfer.
    class ResponseBodyHandler {
       public:
        virtual ~ResponseBodyHandler() = default;

        virtual void on_response_data(std::span<const std::uint8_t> data) = 0;
    };

    /// @brief Terminal notification; exactly one of the two is called.
    class CompletionHandler {
       public:
        virtual ~CompletionHandler() = default;

        virtual void on_finished() {}

        virtual void on_exception(const Error& /*error*/) {}
    };

    /// @brief Produces the body of a store request.
    class RequestBodySupplier {
       public:
        virtual ~RequestBodySupplier() = default;

        /// @brief Write up to `buffer.size()` bytes and set `written`.
        /// @return true while more data follows.
        virtual bool get_request_bytes(std::span<std::uint8_t> buffer,
                                       std::size_t& written) = 0;

        /// @brief Rewind to the first byte for a retry.
        /// @return false when rewinding is not supported.
        virtual bool reset_position() { return false; }

        /// @brief Total body size when known up front.
        virtual std::optional<std::uint64_t> content_length() const {
            return std::nullopt;
        }
    };

    /// @brief Everything a retrieval reports to its caller.
    class ResponseDataConsumer : public ResponseHeadersHandler,
                                 public ResponseBodyHandler,
                                 public CompletionHandler {};

    /// @brief Everything a store pulls from, and reports to, its caller.
    class RequestDataSupplier : public RequestBodySupplier,
                                public ResponseHeadersHandler,
                                public CompletionHandler {};

}  // namespace s3_cpp
