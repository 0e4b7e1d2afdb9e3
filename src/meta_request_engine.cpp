#include "s3_cpp/meta_request_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

#include "s3_cpp/header_mapper.hpp"
#include "s3_cpp/meta_request.hpp"
#include "s3_cpp/middleware.hpp"
#include "s3_cpp/response.hpp"
#include "s3_cpp/url.hpp"

namespace s3_cpp {

    namespace engine_detail {

        /// @brief Run a caller callback whose failure must not affect the
        /// operation.
        template <typename F>
        void invoke_guarded(const MetaRequestBase& meta, const char* callback,
                            F&& f) noexcept {
            try {
                f();
            } catch (const std::exception& e) {
                SPDLOG_WARN("MetaRequest {}: {} threw '{}'; ignored", meta.id(),
                            callback, e.what());
            } catch (...) {
                SPDLOG_WARN(
                    "MetaRequest {}: {} threw a non-standard exception; "
                    "ignored",
                    meta.id(), callback);
            }
        }

        /// @brief Text of the first `<tag>...</tag>` in an S3 XML error body.
        std::string xml_tag(std::string_view body, std::string_view tag) {
            const std::string open = "<" + std::string(tag) + ">";
            const std::string close = "</" + std::string(tag) + ">";
            auto begin = body.find(open);
            if (begin == std::string_view::npos) return {};
            begin += open.size();
            auto end = body.find(close, begin);
            if (end == std::string_view::npos) return {};
            return std::string(body.substr(begin, end - begin));
        }

        Error http_status_error(int status, std::string_view body) {
            Error e{Error::Code::HttpStatus, "HTTP " + std::to_string(status)};
            e.http_status = status;
            e.service_code = xml_tag(body, "Code");
            if (!e.service_code.empty()) e.message += " " + e.service_code;
            if (auto msg = xml_tag(body, "Message"); !msg.empty()) {
                e.message += ": " + msg;
            }
            return e;
        }

        /**
         * @brief Adapts a RequestDataSupplier to the transport's pull
         * interface.
         *
         * A supplier exception is sticky: every later read fails with the
         * same SupplierFailed error and reset() refuses, so the transfer is
         * neither continued nor retried.
         */
        class SupplierBodyStream final : public RequestBodyStream {
           public:
            SupplierBodyStream(std::shared_ptr<RequestDataSupplier> supplier,
                               std::optional<std::uint64_t> declared_length)
                : m_supplier(std::move(supplier)),
                  m_declared_length(declared_length) {}

            void attach(MetaRequestBase* meta) noexcept { m_meta = meta; }

            Result<bool> read(std::span<std::uint8_t> buffer,
                              std::size_t& written) override {
                written = 0;
                if (m_failure) return Result<bool>::err(*m_failure);
                if (!m_supplier) return Result<bool>::ok(false);
                if (m_meta) m_meta->advance(MetaRequestState::BodySending);

                bool more = false;
                try {
                    more = m_supplier->get_request_bytes(buffer, written);
                } catch (const std::exception& e) {
                    return fail(std::string("Request data supplier failed: ") +
                                e.what());
                } catch (...) {
                    return fail(
                        "Request data supplier failed with a non-standard "
                        "exception");
                }

                if (written > buffer.size()) {
                    return fail("Request data supplier reported " +
                                std::to_string(written) +
                                " bytes for a buffer of " +
                                std::to_string(buffer.size()));
                }
                return Result<bool>::ok(more);
            }

            bool reset() override {
                if (m_failure) return false;
                if (!m_supplier) return true;
                try {
                    return m_supplier->reset_position();
                } catch (const std::exception& e) {
                    SPDLOG_WARN("Request data supplier reset threw '{}'",
                                e.what());
                    return false;
                }
            }

            std::optional<std::uint64_t> length() const override {
                if (m_declared_length) return m_declared_length;
                if (!m_supplier) return 0;
                try {
                    return m_supplier->content_length();
                } catch (const std::exception& e) {
                    SPDLOG_WARN("Request data supplier length threw '{}'",
                                e.what());
                    return std::nullopt;
                }
            }

            const Error* failure() const noexcept {
                return m_failure ? &*m_failure : nullptr;
            }

           private:
            Result<bool> fail(std::string message) {
                SPDLOG_WARN("{}", message);
                m_failure = Error{Error::Code::SupplierFailed, std::move(message)};
                return Result<bool>::err(*m_failure);
            }

            std::shared_ptr<RequestDataSupplier> m_supplier;
            std::optional<std::uint64_t> m_declared_length;
            MetaRequestBase* m_meta{nullptr};
            std::optional<Error> m_failure;
        };

        /**
         * @brief Receives one attempt's response and builds the typed output.
         *
         * 2xx headers are mapped best-effort into the builder. Body chunks of
         * a 2xx response go to the body handler; those of any other status
         * are kept (bounded) to describe the error.
         */
        template <typename Output>
        class ResponseCollector final : public ExchangeHandler {
           public:
            using Mapper = Result<bool> (*)(typename Output::Builder&,
                                            const HttpHeader&);

            ResponseCollector(MetaRequestBase& meta, Mapper mapper,
                              ResponseHeadersHandler* headers_handler,
                              ResponseBodyHandler* body_handler,
                              std::size_t max_error_body)
                : m_meta(meta),
                  m_mapper(mapper),
                  m_headers_handler(headers_handler),
                  m_body_handler(body_handler),
                  m_max_error_body(max_error_body) {}

            Status on_response_headers(int status,
                                       const HeaderList& headers) override {
                m_status = status;
                m_headers_received = true;
                m_meta.advance(MetaRequestState::HeadersReceived);

                if (is_success_status(status)) {
                    for (const auto& header : headers) {
                        auto mapped = m_mapper(m_builder, header);
                        if (!mapped) {
                            SPDLOG_WARN("MetaRequest {}: {}", m_meta.id(),
                                        mapped.error().message);
                            m_meta.record_mapping_error(
                                std::move(mapped).error());
                        }
                    }
                }

                if (m_headers_handler) {
                    invoke_guarded(m_meta, "on_response_headers", [&] {
                        m_headers_handler->on_response_headers(status, headers);
                    });
                }
                return ok_status();
            }

            Status on_response_body(
                std::span<const std::uint8_t> chunk) override {
                if (!is_success_status(m_status)) {
                    const auto room = m_max_error_body - std::min(
                        m_max_error_body, m_error_body.size());
                    const auto n = std::min(room, chunk.size());
                    m_error_body.append(
                        reinterpret_cast<const char*>(chunk.data()), n);
                    return ok_status();
                }
                if (!m_body_handler) return ok_status();

                m_meta.advance(MetaRequestState::BodyStreaming);
                try {
                    m_body_handler->on_response_data(chunk);
                } catch (const std::exception& e) {
                    return Status::err(
                        Error::Code::ConsumerCallbackFailed,
                        std::string("Response data consumer failed: ") +
                            e.what());
                } catch (...) {
                    return Status::err(Error::Code::ConsumerCallbackFailed,
                                       "Response data consumer failed with a "
                                       "non-standard exception");
                }
                return ok_status();
            }

            bool headers_received() const noexcept { return m_headers_received; }

            /// @brief The attempt's outcome once the exchange succeeded.
            Result<Output> finish() const {
                if (is_success_status(m_status)) {
                    return Result<Output>::ok(m_builder.build());
                }
                return Result<Output>::err(
                    http_status_error(m_status, m_error_body));
            }

           private:
            MetaRequestBase& m_meta;
            Mapper m_mapper;
            ResponseHeadersHandler* m_headers_handler;
            ResponseBodyHandler* m_body_handler;
            std::size_t m_max_error_body;

            typename Output::Builder m_builder;
            int m_status{0};
            bool m_headers_received{false};
            std::string m_error_body;
        };

    }  // namespace engine_detail

    template <typename Output>
    struct MetaRequestEngine::Operation {
        MetaRequest<Output>& meta;
        typename engine_detail::ResponseCollector<Output>::Mapper mapper;
        ResponseHeadersHandler* headers_handler;
        ResponseBodyHandler* body_handler;
        CompletionHandler* completion;
        engine_detail::SupplierBodyStream* body;
    };

    MetaRequestEngine::MetaRequestEngine(
        std::shared_ptr<ConnectionPoolManager> pool,
        MetaRequestConfiguration config)
        : m_pool(std::move(pool)), m_config(std::move(config)) {
        if (!m_pool) {
            throw std::invalid_argument(
                "MetaRequestEngine requires a connection pool");
        }
        if (m_config.max_attempts == 0) {
            throw std::invalid_argument("max_attempts must be at least 1");
        }
    }

    WireRequest MetaRequestEngine::base_request(HttpMethod method,
                                                const std::string& bucket,
                                                const std::string& key) const {
        const Endpoint& ep = m_pool->endpoint();

        WireRequest req;
        req.method = method;

        std::string host = ep.host_header();
        std::string target = "/";
        if (m_config.path_style || bucket.empty()) {
            if (!bucket.empty()) {
                target += url_utils::url_encode(bucket) + "/";
            }
        } else {
            host = bucket + "." + host;
        }
        target += url_utils::url_encode(key, /*keep_slash=*/true);

        req.target = std::move(target);
        req.headers.push_back({"Host", std::move(host)});
        req.headers.push_back({"User-Agent", m_config.user_agent});
        return req;
    }

    WireRequest MetaRequestEngine::build_get_object_request(
        const GetObjectRequest& request) const {
        WireRequest req = base_request(HttpMethod::Get, request.bucket,
                                       request.key);
        if (request.part_number) {
            url_utils::append_query(req.target, "partNumber",
                                    std::to_string(*request.part_number));
        }
        if (request.version_id) {
            url_utils::append_query(req.target, "versionId",
                                    *request.version_id);
        }
        populate_get_object_request_headers(request, req.headers);
        return req;
    }

    WireRequest MetaRequestEngine::build_put_object_request(
        const PutObjectRequest& request,
        std::shared_ptr<RequestBodyStream> body) const {
        WireRequest req = base_request(HttpMethod::Put, request.bucket,
                                       request.key);
        populate_put_object_request_headers(request, req.headers);
        req.body = std::move(body);
        return req;
    }

    template <typename Output>
    boost::asio::awaitable<Result<Output>> MetaRequestEngine::execute(
        Operation<Output>& op) {
        auto& meta = op.meta;
        const auto max_attempts = m_config.max_attempts;

        auto give_back = [&](Lease&& lease) {
            if (auto released = m_pool->release(std::move(lease)); !released) {
                SPDLOG_ERROR("MetaRequest {}: {}", meta.id(),
                             released.error().message);
            }
        };

        Result<Output> result;
        try {
            for (std::uint32_t attempt = 1;; ++attempt) {
                WireRequest wire = meta.request();
                for (const auto& interceptor : m_config.interceptors) {
                    if (interceptor) interceptor->prepare(wire, m_pool->endpoint());
                }

                auto acquired = co_await m_pool->acquire();
                if (!acquired) {
                    result = Result<Output>::err(std::move(acquired).error());
                    if (is_retryable(result.error()) && attempt < max_attempts) {
                        SPDLOG_WARN(
                            "MetaRequest {}: acquire failed ({}), attempt "
                            "{}/{}; retrying",
                            meta.id(), result.error().message, attempt,
                            max_attempts);
                        continue;
                    }
                    break;
                }
                Lease lease = std::move(acquired).value();
                meta.advance(MetaRequestState::Sent);

                engine_detail::ResponseCollector<Output> collector(
                    meta, op.mapper, op.headers_handler, op.body_handler,
                    m_config.max_error_body_bytes);
                Status status;
                try {
                    status = co_await lease->exchange(wire, collector);
                } catch (...) {
                    // Protocol state unknown; never hand this one out again.
                    lease.mark_unusable();
                    give_back(std::move(lease));
                    throw;
                }

                if (status) {
                    if (!lease->is_open()) lease.mark_unusable();
                    give_back(std::move(lease));
                    result = collector.finish();
                    break;
                }

                lease.mark_unusable();
                give_back(std::move(lease));

                const Error* supplier_failure = op.body ? op.body->failure() : nullptr;
                result = Result<Output>::err(supplier_failure
                                                 ? *supplier_failure
                                                 : std::move(status).error());
                if (supplier_failure || collector.headers_received() ||
                    !is_retryable(result.error()) || attempt >= max_attempts) {
                    break;
                }
                if (op.body && !op.body->reset()) {
                    SPDLOG_WARN(
                        "MetaRequest {}: request body cannot be replayed; "
                        "not retrying after '{}'",
                        meta.id(), result.error().message);
                    break;
                }
                SPDLOG_WARN("MetaRequest {}: attempt {}/{} failed ({}); retrying",
                            meta.id(), attempt, max_attempts,
                            result.error().message);
            }
        } catch (const std::exception& e) {
            result = Result<Output>::err(
                Error::Code::Unknown,
                std::string("Unexpected failure: ") + e.what());
        } catch (...) {
            result = Result<Output>::err(
                Error::Code::Unknown,
                "Unexpected failure: non-standard exception");
        }

        if (result) {
            SPDLOG_DEBUG("MetaRequest {} ({}) succeeded", meta.id(),
                         to_string(meta.kind()));
            if (op.completion) {
                engine_detail::invoke_guarded(
                    meta, "on_finished", [&] { op.completion->on_finished(); });
            }
        } else {
            SPDLOG_DEBUG("MetaRequest {} ({}) failed: {}", meta.id(),
                         to_string(meta.kind()), result.error().message);
            if (op.completion) {
                engine_detail::invoke_guarded(meta, "on_exception", [&] {
                    op.completion->on_exception(result.error());
                });
            }
        }

        static_cast<void>(meta.finish(std::move(result)));
        co_return meta.take_result();
    }

    boost::asio::awaitable<Result<GetObjectOutput>>
    MetaRequestEngine::get_object(
        GetObjectRequest request,
        std::shared_ptr<ResponseDataConsumer> consumer) {
        MetaRequest<GetObjectOutput> meta(MetaRequestKind::GetObject,
                                          build_get_object_request(request));
        Operation<GetObjectOutput> op{meta,
                                      &populate_get_object_output_header,
                                      consumer.get(),
                                      consumer.get(),
                                      consumer.get(),
                                      nullptr};
        co_return co_await execute(op);
    }

    boost::asio::awaitable<Result<PutObjectOutput>>
    MetaRequestEngine::put_object(
        PutObjectRequest request,
        std::shared_ptr<RequestDataSupplier> supplier) {
        std::optional<std::uint64_t> declared_length;
        if (request.content_length && *request.content_length >= 0) {
            declared_length =
                static_cast<std::uint64_t>(*request.content_length);
        }

        auto body = std::make_shared<engine_detail::SupplierBodyStream>(
            supplier, declared_length);
        MetaRequest<PutObjectOutput> meta(
            MetaRequestKind::PutObject,
            build_put_object_request(request, body));
        body->attach(&meta);

        Operation<PutObjectOutput> op{meta,
                                      &populate_put_object_output_header,
                                      supplier.get(),
                                      nullptr,
                                      supplier.get(),
                                      body.get()};
        co_return co_await execute(op);
    }

}  // namespace s3_cpp
