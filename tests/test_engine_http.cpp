// tests/test_engine_http.cpp
//
// MetaRequestEngine + ConnectionPoolManager + BeastTransport against a
// cpp-httplib server standing in for S3 (path-style addressing).

#include <gtest/gtest.h>
#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "fake_transport.hpp"
#include "s3_cpp/connection/connection_pool_manager.hpp"
#include "s3_cpp/meta_request_engine.hpp"
#include "s3_cpp/transport/beast_transport.hpp"

using namespace s3_cpp;
using namespace std::chrono_literals;

namespace {

    /// Minimal object store: PUT keeps the body, GET returns it.
    struct ObjectStoreServer {
        ObjectStoreServer() {
            svr_.Put(".*", [this](const httplib::Request& req,
                                  httplib::Response& res) {
                ++request_count;
                {
                    std::lock_guard lk(mu_);
                    objects_[req.path] = req.body;
                    last_headers_ = req.headers;
                }
                res.set_header("ETag", "\"etag-" +
                                           std::to_string(req.body.size()) +
                                           "\"");
                res.set_header("x-amz-request-id", "REQ-PUT");
                res.status = 200;
            });
            svr_.Get(".*", [this](const httplib::Request& req,
                                  httplib::Response& res) {
                ++request_count;
                std::lock_guard lk(mu_);
                auto it = objects_.find(req.path);
                if (it == objects_.end()) {
                    res.status = 404;
                    res.set_content(
                        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
                        "<Error><Code>NoSuchKey</Code>"
                        "<Message>The specified key does not exist.</Message>"
                        "</Error>",
                        "application/xml");
                    return;
                }
                res.set_header("ETag", "\"etag-" +
                                           std::to_string(it->second.size()) +
                                           "\"");
                res.set_header("x-amz-storage-class", "STANDARD");
                res.set_content(it->second, "binary/octet-stream");
            });

            port_ = svr_.bind_to_any_port("127.0.0.1");
            thread_ = std::thread([this] { svr_.listen_after_bind(); });
        }

        ~ObjectStoreServer() {
            svr_.stop();
            if (thread_.joinable()) thread_.join();
        }

        std::uint16_t port() const noexcept {
            return static_cast<std::uint16_t>(port_);
        }

        std::string header(const std::string& name) {
            std::lock_guard lk(mu_);
            auto it = last_headers_.find(name);
            return it == last_headers_.end() ? std::string{} : it->second;
        }

        std::atomic<int> request_count{0};

       private:
        httplib::Server svr_;
        std::mutex mu_;
        std::map<std::string, std::string> objects_;
        httplib::Headers last_headers_;
        std::thread thread_;
        int port_{0};
    };

    class BufferConsumer : public ResponseDataConsumer {
       public:
        void on_response_data(std::span<const std::uint8_t> data) override {
            body.append(reinterpret_cast<const char*>(data.data()), data.size());
            ++chunks;
        }
        void on_finished() override { ++finished; }
        void on_exception(const Error&) override { ++exceptions; }

        std::string body;
        int chunks{0};
        int finished{0};
        int exceptions{0};
    };

    class BufferSupplier : public RequestDataSupplier {
       public:
        explicit BufferSupplier(std::string data) : m_data(std::move(data)) {}

        bool get_request_bytes(std::span<std::uint8_t> buffer,
                               std::size_t& written) override {
            written = std::min(buffer.size(), m_data.size() - m_offset);
            std::memcpy(buffer.data(), m_data.data() + m_offset, written);
            m_offset += written;
            return m_offset < m_data.size();
        }

        bool reset_position() override {
            m_offset = 0;
            return true;
        }

        std::optional<std::uint64_t> content_length() const override {
            return m_data.size();
        }

       private:
        std::string m_data;
        std::size_t m_offset{0};
    };

    template <class Pred>
    bool run_until(boost::asio::io_context& io, Pred done) {
        const auto deadline = std::chrono::steady_clock::now() + 10s;
        io.restart();
        while (!done()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            io.run_one_for(100ms);
        }
        return true;
    }

    class EngineHttpTest : public ::testing::Test {
       protected:
        void SetUp() override {
            ConnectionPoolConfiguration pc;
            pc.endpoint_uri = "http://127.0.0.1:" + std::to_string(server.port());
            pc.max_connections = 2;
            pc.window_size = 4096;
            pc.buffer_size = 16 * 1024;
            auto created = ConnectionPoolManager::create(
                io.get_executor(),
                std::make_shared<BeastTransport>(io.get_executor()), pc);
            ASSERT_TRUE(created.has_value()) << created.error().message;
            pool = std::move(created).value();

            MetaRequestConfiguration mc;
            mc.path_style = true;
            engine = std::make_unique<MetaRequestEngine>(pool, mc);
        }

        void TearDown() override {
            engine.reset();
            if (pool) pool->shutdown();
            s3_cpp::test::drain(io);
        }

        template <typename T>
        Result<T> wait(const std::shared_ptr<std::optional<Result<T>>>& slot) {
            EXPECT_TRUE(run_until(io, [&] { return slot->has_value(); }));
            if (!slot->has_value()) {
                return Result<T>::err(Error::Code::Unknown, "pending");
            }
            return std::move(**slot);
        }

        ObjectStoreServer server;
        boost::asio::io_context io;
        std::shared_ptr<ConnectionPoolManager> pool;
        std::unique_ptr<MetaRequestEngine> engine;
    };

    TEST_F(EngineHttpTest, PutThenGetRoundTripsBody) {
        const std::string payload(100000, 'q');

        PutObjectRequest put;
        put.bucket = "bucket";
        put.key = "dir/object.bin";
        put.content_type = "binary/octet-stream";
        put.metadata["owner"] = "tests";
        auto put_out = wait(s3_cpp::test::spawn(
            io, engine->put_object(put, std::make_shared<BufferSupplier>(payload))));
        ASSERT_TRUE(put_out.has_value()) << put_out.error().message;
        EXPECT_EQ(put_out.value().e_tag, "\"etag-100000\"");
        EXPECT_EQ(put_out.value().request_id, "REQ-PUT");
        EXPECT_EQ(server.header("x-amz-meta-owner"), "tests");
        EXPECT_EQ(server.header("Content-Length"), "100000");

        GetObjectRequest get;
        get.bucket = "bucket";
        get.key = "dir/object.bin";
        auto consumer = std::make_shared<BufferConsumer>();
        auto get_out = wait(s3_cpp::test::spawn(io, engine->get_object(get, consumer)));
        ASSERT_TRUE(get_out.has_value()) << get_out.error().message;
        EXPECT_EQ(consumer->body, payload);
        EXPECT_GT(consumer->chunks, 1);
        EXPECT_EQ(consumer->finished, 1);
        EXPECT_EQ(get_out.value().e_tag, "\"etag-100000\"");
        EXPECT_EQ(get_out.value().content_length, 100000);
        ASSERT_TRUE(get_out.value().storage_class.has_value());
        EXPECT_EQ(*get_out.value().storage_class, StorageClass::Standard);
    }

    TEST_F(EngineHttpTest, MissingKeyIsHttpStatusError) {
        GetObjectRequest get;
        get.bucket = "bucket";
        get.key = "absent";
        auto consumer = std::make_shared<BufferConsumer>();
        auto out = wait(s3_cpp::test::spawn(io, engine->get_object(get, consumer)));
        ASSERT_TRUE(out.has_error());
        EXPECT_EQ(out.error().code, Error::Code::HttpStatus);
        EXPECT_EQ(out.error().http_status, 404);
        EXPECT_EQ(out.error().service_code, "NoSuchKey");
        EXPECT_TRUE(consumer->body.empty());
        EXPECT_EQ(consumer->exceptions, 1);
    }

}  // namespace
