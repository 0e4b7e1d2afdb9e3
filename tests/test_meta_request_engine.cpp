#include <gtest/gtest.h>

#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "fake_transport.hpp"
#include "s3_cpp/meta_request_engine.hpp"
#include "s3_cpp/middleware.hpp"
#include "s3_cpp/url.hpp"

using namespace s3_cpp;
using namespace s3_cpp::test;

namespace {

    class RecordingConsumer : public ResponseDataConsumer {
       public:
        void on_response_headers(int status, const HeaderList&) override {
            ++header_calls;
            last_status = status;
        }

        void on_response_data(std::span<const std::uint8_t> data) override {
            ++chunk_calls;
            if (throw_on_chunk && chunk_calls == *throw_on_chunk) {
                throw std::runtime_error("disk full");
            }
            body.append(reinterpret_cast<const char*>(data.data()), data.size());
        }

        void on_finished() override {
            ++finished;
            if (throw_on_finished) throw std::runtime_error("callback bug");
        }

        void on_exception(const Error& e) override {
            ++exceptions;
            last_error = e;
        }

        int header_calls{0};
        int last_status{0};
        int chunk_calls{0};
        int finished{0};
        int exceptions{0};
        std::string body;
        std::optional<Error> last_error;
        std::optional<int> throw_on_chunk;
        bool throw_on_finished{false};
    };

    class StringSupplier : public RequestDataSupplier {
       public:
        explicit StringSupplier(std::string data, bool resettable = false)
            : m_data(std::move(data)), m_resettable(resettable) {}

        bool get_request_bytes(std::span<std::uint8_t> buffer,
                               std::size_t& written) override {
            ++calls;
            if (throw_on_call && calls == *throw_on_call) {
                throw std::runtime_error("read error");
            }
            written = std::min(buffer.size(), m_data.size() - m_offset);
            std::memcpy(buffer.data(), m_data.data() + m_offset, written);
            m_offset += written;
            return m_offset < m_data.size();
        }

        bool reset_position() override {
            ++resets;
            if (!m_resettable) return false;
            m_offset = 0;
            return true;
        }

        std::optional<std::uint64_t> content_length() const override {
            return m_data.size();
        }

        void on_response_headers(int status, const HeaderList&) override {
            last_status = status;
        }

        void on_finished() override { ++finished; }

        void on_exception(const Error& e) override {
            ++exceptions;
            last_error = e;
        }

        int calls{0};
        int resets{0};
        int finished{0};
        int exceptions{0};
        int last_status{0};
        std::optional<int> throw_on_call;
        std::optional<Error> last_error;

       private:
        std::string m_data;
        bool m_resettable;
        std::size_t m_offset{0};
    };

    Error failure(Error::Code code) { return Error{code, "scripted failure"}; }

    class MetaRequestEngineTest : public ::testing::Test {
       protected:
        void SetUp() override { make_engine({}); }

        void make_engine(MetaRequestConfiguration cfg) {
            if (!pool) {
                ConnectionPoolConfiguration pc;
                pc.endpoint_uri = "http://s3.local:9000";
                pc.max_connections = 2;
                auto created =
                    ConnectionPoolManager::create(io.get_executor(), transport, pc);
                ASSERT_TRUE(created.has_value());
                pool = std::move(created).value();
            }
            engine = std::make_unique<MetaRequestEngine>(pool, std::move(cfg));
        }

        Result<GetObjectOutput> get(GetObjectRequest req,
                                    std::shared_ptr<ResponseDataConsumer> c) {
            auto slot = spawn(io, engine->get_object(std::move(req), c));
            drain(io);
            if (!slot->has_value()) {
                ADD_FAILURE() << "get_object did not complete";
                return Result<GetObjectOutput>::err(Error::Code::Unknown,
                                                    "pending");
            }
            return std::move(**slot);
        }

        Result<PutObjectOutput> put(PutObjectRequest req,
                                    std::shared_ptr<RequestDataSupplier> s) {
            auto slot = spawn(io, engine->put_object(std::move(req), s));
            drain(io);
            if (!slot->has_value()) {
                ADD_FAILURE() << "put_object did not complete";
                return Result<PutObjectOutput>::err(Error::Code::Unknown,
                                                    "pending");
            }
            return std::move(**slot);
        }

        static GetObjectRequest get_request() {
            GetObjectRequest req;
            req.bucket = "my-bucket";
            req.key = "photos/a b.jpg";
            return req;
        }

        static PutObjectRequest put_request() {
            PutObjectRequest req;
            req.bucket = "my-bucket";
            req.key = "upload.bin";
            return req;
        }

        FakeTransportState& wire() { return transport->state(); }

        void TearDown() override {
            engine.reset();
            if (pool) pool->shutdown();
            drain(io);
        }

        boost::asio::io_context io;
        std::shared_ptr<FakeTransport> transport =
            std::make_shared<FakeTransport>(io.get_executor());
        std::shared_ptr<ConnectionPoolManager> pool;
        std::unique_ptr<MetaRequestEngine> engine;
    };

    TEST_F(MetaRequestEngineTest, ConstructorRejectsBadArguments) {
        EXPECT_THROW(MetaRequestEngine(nullptr), std::invalid_argument);
        MetaRequestConfiguration cfg;
        cfg.max_attempts = 0;
        EXPECT_THROW(MetaRequestEngine(pool, cfg), std::invalid_argument);
    }

    TEST_F(MetaRequestEngineTest, GetObjectStreamsBodyAndMapsHeaders) {
        transport->respond({200,
                            {{"ETag", "\"e1\""},
                             {"Content-Length", "11"},
                             {"Content-Type", "text/plain"},
                             {"Last-Modified", "Sun, 06 Nov 1994 08:49:37 GMT"},
                             {"x-amz-meta-color", "blue"}},
                            {"hello ", "world"}});
        auto consumer = std::make_shared<RecordingConsumer>();

        auto out = get(get_request(), consumer);
        ASSERT_TRUE(out.has_value()) << out.error().message;
        EXPECT_EQ(out.value().e_tag, "\"e1\"");
        EXPECT_EQ(out.value().content_length, 11);
        EXPECT_EQ(out.value().content_type, "text/plain");
        EXPECT_TRUE(out.value().last_modified.has_value());
        EXPECT_EQ(out.value().metadata.at("color"), "blue");

        EXPECT_EQ(consumer->body, "hello world");
        EXPECT_EQ(consumer->chunk_calls, 2);
        EXPECT_EQ(consumer->header_calls, 1);
        EXPECT_EQ(consumer->last_status, 200);
        EXPECT_EQ(consumer->finished, 1);
        EXPECT_EQ(consumer->exceptions, 0);
    }

    TEST_F(MetaRequestEngineTest, GetObjectRequestLine) {
        auto req = get_request();
        req.range = "bytes=0-99";
        req.version_id = "v 1";
        req.part_number = 2;

        auto out = get(req, nullptr);
        ASSERT_TRUE(out.has_value());

        ASSERT_EQ(wire().requests.size(), 1u);
        const auto& sent = wire().requests[0];
        EXPECT_EQ(sent.method, HttpMethod::Get);
        EXPECT_EQ(sent.target, "/photos/a%20b.jpg?partNumber=2&versionId=v%201");
        EXPECT_EQ(sent.header("Host"), "my-bucket.s3.local:9000");
        EXPECT_EQ(sent.header("Range"), "bytes=0-99");
        EXPECT_EQ(sent.header("User-Agent"), "s3_cpp/1.0");
    }

    TEST_F(MetaRequestEngineTest, PathStyleAddressing) {
        MetaRequestConfiguration cfg;
        cfg.path_style = true;
        cfg.user_agent = "tests/2";
        make_engine(cfg);

        auto out = get(get_request(), nullptr);
        ASSERT_TRUE(out.has_value());
        const auto& sent = wire().requests.at(0);
        EXPECT_EQ(sent.target, "/my-bucket/photos/a%20b.jpg");
        EXPECT_EQ(sent.header("Host"), "s3.local:9000");
        EXPECT_EQ(sent.header("User-Agent"), "tests/2");
    }

    TEST_F(MetaRequestEngineTest, RegionComesFromPoolEndpoint) {
        engine.reset();
        pool->shutdown();
        drain(io);

        ConnectionPoolConfiguration pc;
        pc.endpoint_uri = default_endpoint_uri("eu-west-1");
        pc.tls = TlsConfiguration{};
        auto created =
            ConnectionPoolManager::create(io.get_executor(), transport, pc);
        ASSERT_TRUE(created.has_value()) << created.error().message;
        pool = std::move(created).value();
        make_engine({});

        auto out = get(get_request(), nullptr);
        ASSERT_TRUE(out.has_value()) << out.error().message;
        EXPECT_EQ(wire().requests.at(0).header("Host"),
                  "my-bucket.s3.eu-west-1.amazonaws.com");
    }

    TEST_F(MetaRequestEngineTest, UnknownStorageClassIsPreserved) {
        transport->respond({200, {{"x-amz-storage-class", "EXPRESS_ONEZONE"}}, {}});
        auto out = get(get_request(), nullptr);
        ASSERT_TRUE(out.has_value());
        ASSERT_TRUE(out.value().storage_class.has_value());
        EXPECT_FALSE(out.value().storage_class->is_known());
        EXPECT_EQ(out.value().storage_class->wire_value(), "EXPRESS_ONEZONE");
    }

    TEST_F(MetaRequestEngineTest, MalformedHeaderDoesNotFailTheRequest) {
        transport->respond(
            {200, {{"Content-Length", "eleven"}, {"ETag", "\"e2\""}}, {}});
        auto out = get(get_request(), nullptr);
        ASSERT_TRUE(out.has_value());
        EXPECT_FALSE(out.value().content_length.has_value());
        EXPECT_EQ(out.value().e_tag, "\"e2\"");
    }

    TEST_F(MetaRequestEngineTest, ErrorStatusBecomesHttpStatusError) {
        transport->respond(
            {404,
             {{"Content-Type", "application/xml"}, {"ETag", "\"ignored\""}},
             {"<Error><Code>NoSuchKey</Code>",
              "<Message>The specified key does not exist.</Message></Error>"}});
        auto consumer = std::make_shared<RecordingConsumer>();

        auto out = get(get_request(), consumer);
        ASSERT_TRUE(out.has_error());
        EXPECT_EQ(out.error().code, Error::Code::HttpStatus);
        EXPECT_EQ(out.error().http_status, 404);
        EXPECT_EQ(out.error().service_code, "NoSuchKey");
        EXPECT_NE(out.error().message.find("The specified key does not exist."),
                  std::string::npos);

        EXPECT_EQ(consumer->chunk_calls, 0);
        EXPECT_EQ(consumer->header_calls, 1);
        EXPECT_EQ(consumer->last_status, 404);
        EXPECT_EQ(consumer->finished, 0);
        ASSERT_EQ(consumer->exceptions, 1);
        EXPECT_EQ(consumer->last_error->code, Error::Code::HttpStatus);
        EXPECT_EQ(wire().exchanges, 1u);
    }

    TEST_F(MetaRequestEngineTest, ConsumerExceptionAbortsTransfer) {
        transport->respond({200, {}, {"one", "two", "three"}});
        auto consumer = std::make_shared<RecordingConsumer>();
        consumer->throw_on_chunk = 2;

        auto out = get(get_request(), consumer);
        ASSERT_TRUE(out.has_error());
        EXPECT_EQ(out.error().code, Error::Code::ConsumerCallbackFailed);
        EXPECT_EQ(consumer->chunk_calls, 2);
        EXPECT_EQ(consumer->body, "one");
        EXPECT_EQ(consumer->finished, 0);
        EXPECT_EQ(consumer->exceptions, 1);
        EXPECT_EQ(wire().exchanges, 1u);
        EXPECT_EQ(wire().channels.at(0)->closes, 1u);
    }

    TEST_F(MetaRequestEngineTest, FailureAfterPartialDeliveryIsNotRetried) {
        ScriptedResponse resp{200, {{"ETag", "\"e\""}}, {"abc"}};
        resp.fail_after_body = failure(Error::Code::ReceiveFailed);
        transport->respond(resp);
        transport->respond({200, {}, {"should not be read"}});
        auto consumer = std::make_shared<RecordingConsumer>();

        auto out = get(get_request(), consumer);
        ASSERT_TRUE(out.has_error());
        EXPECT_EQ(out.error().code, Error::Code::ReceiveFailed);
        EXPECT_EQ(consumer->body, "abc");
        EXPECT_EQ(consumer->finished, 0);
        EXPECT_EQ(consumer->exceptions, 1);
        EXPECT_EQ(wire().exchanges, 1u);
    }

    TEST_F(MetaRequestEngineTest, FailureBeforeHeadersIsRetried) {
        ScriptedResponse broken;
        broken.fail_before_headers = failure(Error::Code::ReceiveFailed);
        transport->respond(broken);
        transport->respond({200, {}, {"ok"}});
        auto consumer = std::make_shared<RecordingConsumer>();

        auto out = get(get_request(), consumer);
        ASSERT_TRUE(out.has_value()) << out.error().message;
        EXPECT_EQ(consumer->body, "ok");
        EXPECT_EQ(consumer->header_calls, 1);
        EXPECT_EQ(consumer->finished, 1);
        EXPECT_EQ(consumer->exceptions, 0);
        EXPECT_EQ(wire().exchanges, 2u);
        // The broken connection was not reused.
        EXPECT_EQ(wire().connect_calls, 2u);
    }

    TEST_F(MetaRequestEngineTest, ConnectFailuresAreRetried) {
        transport->fail_next_connect();
        transport->fail_next_connect(Error::Code::Timeout);
        auto consumer = std::make_shared<RecordingConsumer>();

        auto out = get(get_request(), consumer);
        ASSERT_TRUE(out.has_value()) << out.error().message;
        EXPECT_EQ(wire().connect_calls, 3u);
        EXPECT_EQ(consumer->finished, 1);
    }

    TEST_F(MetaRequestEngineTest, AttemptsAreBounded) {
        for (int i = 0; i < 5; ++i) transport->fail_next_connect();
        auto consumer = std::make_shared<RecordingConsumer>();

        auto out = get(get_request(), consumer);
        ASSERT_TRUE(out.has_error());
        EXPECT_EQ(out.error().code, Error::Code::ConnectionFailed);
        EXPECT_EQ(wire().connect_calls, 3u);
        EXPECT_EQ(consumer->exceptions, 1);
        EXPECT_EQ(consumer->finished, 0);
    }

    TEST_F(MetaRequestEngineTest, InterceptorsRunOnEveryAttempt) {
        MetaRequestConfiguration cfg;
        cfg.interceptors.push_back(std::make_shared<StaticHeaderInterceptor>(
            "x-amz-security-token", "tok"));
        make_engine(cfg);

        ScriptedResponse broken;
        broken.fail_before_headers = failure(Error::Code::SendFailed);
        transport->respond(broken);
        transport->respond({200, {}, {}});

        auto out = get(get_request(), nullptr);
        ASSERT_TRUE(out.has_value());
        ASSERT_EQ(wire().requests.size(), 2u);
        for (const auto& sent : wire().requests) {
            EXPECT_EQ(sent.header("x-amz-security-token"), "tok");
            EXPECT_EQ(std::count_if(sent.headers.begin(), sent.headers.end(),
                                    [](const HttpHeader& h) {
                                        return h.name == "x-amz-security-token";
                                    }),
                      1);
        }
    }

    TEST_F(MetaRequestEngineTest, CompletionCallbackExceptionIsContained) {
        auto consumer = std::make_shared<RecordingConsumer>();
        consumer->throw_on_finished = true;
        auto out = get(get_request(), consumer);
        EXPECT_TRUE(out.has_value());
        EXPECT_EQ(consumer->finished, 1);
        EXPECT_EQ(consumer->exceptions, 0);
    }

    TEST_F(MetaRequestEngineTest, ExchangeExceptionRetiresConnection) {
        ScriptedResponse boom;
        boom.throw_in_exchange = true;
        transport->respond(boom);
        auto consumer = std::make_shared<RecordingConsumer>();

        auto out = get(get_request(), consumer);
        ASSERT_TRUE(out.has_error());
        EXPECT_EQ(out.error().code, Error::Code::Unknown);
        EXPECT_EQ(consumer->exceptions, 1);
        ASSERT_EQ(wire().channels.size(), 1u);
        EXPECT_FALSE(wire().channels[0]->open);

        auto again = get(get_request(), nullptr);
        ASSERT_TRUE(again.has_value()) << again.error().message;
        EXPECT_EQ(wire().connect_calls, 2u);
    }

    TEST_F(MetaRequestEngineTest, ConnectionIsReusedAcrossRequests) {
        EXPECT_TRUE(get(get_request(), nullptr).has_value());
        EXPECT_TRUE(get(get_request(), nullptr).has_value());
        EXPECT_EQ(wire().connect_calls, 1u);
        EXPECT_EQ(wire().exchanges, 2u);
    }

    TEST_F(MetaRequestEngineTest, PutObjectSendsBodyAndMapsETag) {
        transport->respond({200,
                            {{"ETag", "\"put-1\""},
                             {"x-amz-version-id", "v7"},
                             {"x-amz-server-side-encryption", "AES256"}},
                            {}});
        auto supplier = std::make_shared<StringSupplier>("hello world!");

        auto req = put_request();
        req.content_type = "application/octet-stream";
        req.storage_class = StorageClass::Glacier;
        req.metadata["owner"] = "alice";

        auto out = put(req, supplier);
        ASSERT_TRUE(out.has_value()) << out.error().message;
        EXPECT_EQ(out.value().e_tag, "\"put-1\"");
        EXPECT_EQ(out.value().version_id, "v7");
        ASSERT_TRUE(out.value().server_side_encryption.has_value());
        EXPECT_EQ(*out.value().server_side_encryption,
                  ServerSideEncryption::Aes256);

        ASSERT_EQ(wire().requests.size(), 1u);
        const auto& sent = wire().requests[0];
        EXPECT_EQ(sent.method, HttpMethod::Put);
        EXPECT_EQ(sent.target, "/upload.bin");
        EXPECT_EQ(sent.body, "hello world!");
        EXPECT_EQ(sent.header("Content-Type"), "application/octet-stream");
        EXPECT_EQ(sent.header("x-amz-storage-class"), "GLACIER");
        EXPECT_EQ(sent.header("x-amz-meta-owner"), "alice");

        EXPECT_EQ(supplier->last_status, 200);
        EXPECT_EQ(supplier->finished, 1);
        EXPECT_EQ(supplier->exceptions, 0);
    }

    TEST_F(MetaRequestEngineTest, SupplierExceptionStopsTheUpload) {
        // The fake pulls four bytes at a time.
        auto supplier = std::make_shared<StringSupplier>("0123456789abcdef", true);
        supplier->throw_on_call = 3;

        auto out = put(put_request(), supplier);
        ASSERT_TRUE(out.has_error());
        EXPECT_EQ(out.error().code, Error::Code::SupplierFailed);
        EXPECT_NE(out.error().message.find("read error"), std::string::npos);

        EXPECT_EQ(supplier->calls, 3);
        EXPECT_EQ(supplier->resets, 0);
        EXPECT_EQ(supplier->exceptions, 1);
        EXPECT_EQ(supplier->finished, 0);
        EXPECT_EQ(wire().exchanges, 1u);
        EXPECT_TRUE(wire().requests.empty());
    }

    TEST_F(MetaRequestEngineTest, PutRetryReplaysBodyAfterReset) {
        ScriptedResponse broken;
        broken.fail_before_headers = failure(Error::Code::ReceiveFailed);
        transport->respond(broken);
        transport->respond({200, {{"ETag", "\"second\""}}, {}});
        auto supplier = std::make_shared<StringSupplier>("payload", true);

        auto out = put(put_request(), supplier);
        ASSERT_TRUE(out.has_value()) << out.error().message;
        EXPECT_EQ(out.value().e_tag, "\"second\"");
        EXPECT_EQ(supplier->resets, 1);
        ASSERT_EQ(wire().requests.size(), 2u);
        EXPECT_EQ(wire().requests[0].body, "payload");
        EXPECT_EQ(wire().requests[1].body, "payload");
        EXPECT_EQ(supplier->finished, 1);
    }

    TEST_F(MetaRequestEngineTest, PutNotRetriedWithoutReset) {
        ScriptedResponse broken;
        broken.fail_before_headers = failure(Error::Code::ReceiveFailed);
        transport->respond(broken);
        transport->respond({200, {}, {}});
        auto supplier = std::make_shared<StringSupplier>("payload", false);

        auto out = put(put_request(), supplier);
        ASSERT_TRUE(out.has_error());
        EXPECT_EQ(out.error().code, Error::Code::ReceiveFailed);
        EXPECT_EQ(supplier->resets, 1);
        EXPECT_EQ(wire().exchanges, 1u);
        EXPECT_EQ(supplier->exceptions, 1);
    }

    TEST_F(MetaRequestEngineTest, PutWithoutSupplierSendsEmptyBody) {
        auto out = put(put_request(), nullptr);
        ASSERT_TRUE(out.has_value());
        ASSERT_EQ(wire().requests.size(), 1u);
        EXPECT_TRUE(wire().requests[0].body.empty());
    }

    TEST_F(MetaRequestEngineTest, ShutdownPoolFailsOperations) {
        pool->shutdown();
        drain(io);
        auto consumer = std::make_shared<RecordingConsumer>();
        auto out = get(get_request(), consumer);
        ASSERT_TRUE(out.has_error());
        EXPECT_EQ(out.error().code, Error::Code::Shutdown);
        EXPECT_EQ(consumer->exceptions, 1);
        EXPECT_EQ(wire().connect_calls, 0u);
    }

}  // namespace
