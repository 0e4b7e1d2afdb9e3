#pragma once
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/fields.hpp>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "http_method.hpp"
#include "result.hpp"

namespace s3_cpp {

    /// @brief One wire header. Order and duplicates are preserved.
    struct HttpHeader {
        std::string name;
        std::string value;
    };

    using HeaderList = std::vector<HttpHeader>;

    /// @brief First header named `name` (case-insensitive), or nullptr.
    inline const HttpHeader* find_header(const HeaderList& headers,
                                         std::string_view name) {
        for (const auto& h : headers) {
            if (boost::beast::iequals(h.name, name)) return &h;
        }
        return nullptr;
    }

    /// @brief Replace every header named `name` with a single one.
    inline void set_header(HeaderList& headers, std::string name,
                           std::string value) {
        std::erase_if(headers, [&](const HttpHeader& h) {
            return boost::beast::iequals(h.name, name);
        });
        headers.push_back({std::move(name), std::move(value)});
    }

    /**
     * @brief Pull-based request body handed to the transport.
     *
     * The transport calls read() until it yields false. reset() rewinds the
     * stream for a retry and returns false when that is not possible.
     */
    class RequestBodyStream {
       public:
        virtual ~RequestBodyStream() = default;

        /// @brief Fill up to `buffer.size()` bytes, reporting the count in
        /// `written`.
        /// @return true while more data follows, false once the body is
        /// complete, or an error that aborts the exchange.
        virtual Result<bool> read(std::span<std::uint8_t> buffer,
                                  std::size_t& written) = 0;

        virtual bool reset() = 0;

        /// @brief Declared total length; nullopt selects chunked encoding.
        virtual std::optional<std::uint64_t> length() const = 0;
    };

    /// @brief In-memory body, used for small payloads and tests.
    class StringBodyStream final : public RequestBodyStream {
       public:
        explicit StringBodyStream(std::string data) : data_(std::move(data)) {}

        Result<bool> read(std::span<std::uint8_t> buffer,
                          std::size_t& written) override {
            written = std::min(buffer.size(), data_.size() - offset_);
            std::memcpy(buffer.data(), data_.data() + offset_, written);
            offset_ += written;
            return Result<bool>::ok(offset_ < data_.size());
        }

        bool reset() override {
            offset_ = 0;
            return true;
        }

        std::optional<std::uint64_t> length() const override {
            return data_.size();
        }

       private:
        std::string data_;
        std::size_t offset_{0};
    };

    /// @brief A fully serialized request, ready for a Channel.
    struct WireRequest {
        HttpMethod method{HttpMethod::Get};
        /// Origin-form target: path plus optional query.
        std::string target{"/"};
        HeaderList headers;
        std::shared_ptr<RequestBodyStream> body;
    };

    /// @brief Apply a HeaderList into a Boost.Beast header container.
    /// @note Uses `insert()`, so repeated names are all sent.
    inline void apply_request_headers(const HeaderList& in,
                                      boost::beast::http::fields& out) {
        for (const auto& h : in) {
            out.insert(h.name, h.value);
        }
    }

}  // namespace s3_cpp
