#pragma once

#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without it

#include <boost/asio/awaitable.hpp>
#include <memory>

#include "s3_cpp/config.hpp"
#include "s3_cpp/connection/connection_pool_manager.hpp"
#include "s3_cpp/handlers.hpp"
#include "s3_cpp/model/get_object.hpp"
#include "s3_cpp/model/put_object.hpp"
#include "s3_cpp/request.hpp"
#include "s3_cpp/result.hpp"

namespace s3_cpp {

    /**
     * @brief Runs typed object operations over pooled connections.
     *
     * Each call is one MetaRequest: the typed request is serialized through
     * the header mapper, sent on a leased connection (retried on a fresh one
     * for transport failures that happen before any response arrives), and
     * resolved exactly once with either the typed output or an Error.
     */
    class MetaRequestEngine {
       public:
        /// @throws std::invalid_argument for a null pool or max_attempts == 0.
        MetaRequestEngine(std::shared_ptr<ConnectionPoolManager> pool,
                          MetaRequestConfiguration config = {});

        MetaRequestEngine(const MetaRequestEngine&) = delete;
        MetaRequestEngine& operator=(const MetaRequestEngine&) = delete;

        /// @brief Retrieve an object, streaming its body into `consumer`.
        /// @note `consumer` may be null when only the output is wanted.
        boost::asio::awaitable<Result<GetObjectOutput>> get_object(
            GetObjectRequest request,
            std::shared_ptr<ResponseDataConsumer> consumer);

        /// @brief Store an object whose body is pulled from `supplier`.
        /// @note A null `supplier` sends an empty body.
        boost::asio::awaitable<Result<PutObjectOutput>> put_object(
            PutObjectRequest request,
            std::shared_ptr<RequestDataSupplier> supplier);

        /// @brief The wire request for a retrieval, before interceptors run.
        WireRequest build_get_object_request(const GetObjectRequest& req) const;

        /// @brief The wire request for a store, before interceptors run.
        WireRequest build_put_object_request(
            const PutObjectRequest& req,
            std::shared_ptr<RequestBodyStream> body) const;

        const MetaRequestConfiguration& config() const noexcept {
            return m_config;
        }

        const std::shared_ptr<ConnectionPoolManager>& pool() const noexcept {
            return m_pool;
        }

       private:
        template <typename Output>
        struct Operation;

        template <typename Output>
        boost::asio::awaitable<Result<Output>> execute(Operation<Output>& op);

        WireRequest base_request(HttpMethod method, const std::string& bucket,
                                 const std::string& key) const;

        std::shared_ptr<ConnectionPoolManager> m_pool;
        MetaRequestConfiguration m_config;
    };

}  // namespace s3_cpp
