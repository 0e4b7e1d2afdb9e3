#pragma once

#include <memory>
#include <string>

#include "endpoint.hpp"
#include "request.hpp"

namespace s3_cpp {

    /**
     * @brief Interface for intercepting and modifying requests before they are sent.
     *
     * Interceptors run after all operation headers are in place, so a request
     * signer sees the final header set. They run again on every attempt.
     */
    class RequestInterceptor {
       public:
        virtual ~RequestInterceptor() = default;

        /**
         * @brief Performs modifications on the outgoing request.
         * @param req The wire request to modify.
         * @param endpoint The endpoint the request is about to be sent to.
         */
        virtual void prepare(WireRequest& req,
                             const Endpoint& endpoint) const = 0;
    };

    /**
     * @brief Interceptor that adds one fixed header, e.g. a session token.
     */
    class StaticHeaderInterceptor : public RequestInterceptor {
       public:
        StaticHeaderInterceptor(std::string name, std::string value)
            : name_(std::move(name)), value_(std::move(value)) {}

        void prepare(WireRequest& req,
                     const Endpoint& /*endpoint*/) const override {
            set_header(req.headers, name_, value_);
        }

       private:
        std::string name_;
        std::string value_;
    };

}  // namespace s3_cpp
