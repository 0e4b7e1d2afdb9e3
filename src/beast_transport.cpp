#include "s3_cpp/transport/beast_transport.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/optional.hpp>
#include <chrono>
#include <vector>

#include "s3_cpp/endpoint.hpp"
#include "s3_cpp/http_method.hpp"
#include "s3_cpp/response.hpp"

namespace s3_cpp {

    namespace {
        namespace beast = boost::beast;
        namespace ssl = boost::asio::ssl;
        using tcp = boost::asio::ip::tcp;
        using boost::asio::redirect_error;
        using boost::asio::use_awaitable;

        using PlainStream = beast::tcp_stream;
        using TlsStream = beast::ssl_stream<beast::tcp_stream>;
        // beast::ssl_stream does not expose lowest_layer(), so the hop to a
        // TLS proxy uses the asio stream and the tunnelled TLS wraps that.
        using ProxyTlsStream = ssl::stream<beast::tcp_stream>;
        using TunnelTlsStream = beast::ssl_stream<ProxyTlsStream>;

        using ContextList = std::vector<std::shared_ptr<ssl::context>>;

        Error transport_error(Error::Code code,
                              const boost::system::error_code& ec,
                              std::string_view what) {
            Error e{};
            e.code = (ec == beast::error::timeout) ? Error::Code::Timeout : code;
            e.message = std::string(what) + ": " + ec.message();
            e.native_code = ec.value();
            return e;
        }

        template <class Stream>
        void close_stream(Stream& stream) noexcept {
            boost::system::error_code ec;
            auto& socket = beast::get_lowest_layer(stream).socket();
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }

        template <class SslStream>
        boost::asio::awaitable<Status> tls_handshake(
            SslStream& stream, const TlsConfiguration& tls,
            const std::string& host, std::chrono::milliseconds timeout) {
            boost::system::error_code ec;
            const std::string& name = tls.server_name ? *tls.server_name : host;

            if (!set_sni(stream, name, ec)) {
                co_return Status::err(transport_error(
                    Error::Code::TlsHandshakeFailed, ec, "SNI for " + name));
            }
            if (tls.verify_peer) {
                stream.set_verify_callback(ssl::host_name_verification(name),
                                           ec);
                if (ec) {
                    co_return Status::err(transport_error(
                        Error::Code::TlsHandshakeFailed, ec,
                        "Host name verification for " + name));
                }
            }

            beast::get_lowest_layer(stream).expires_after(timeout);
            co_await stream.async_handshake(ssl::stream_base::client,
                                            redirect_error(use_awaitable, ec));
            if (ec) {
                co_return Status::err(transport_error(
                    Error::Code::TlsHandshakeFailed, ec,
                    "TLS handshake with " + name));
            }
            co_return ok_status();
        }

        /// @brief Open a CONNECT tunnel to the endpoint through the proxy
        /// `stream` is connected to.
        template <class Stream>
        boost::asio::awaitable<Status> proxy_tunnel(Stream& stream,
                                                    const ConnectOptions& o) {
            namespace http = beast::http;
            const auto& proxy = *o.proxy;
            boost::system::error_code ec;

            const std::string authority = o.endpoint.host + ":" + o.endpoint.port;
            http::request<http::empty_body> req{http::verb::connect, authority,
                                                11};
            req.set(http::field::host, authority);
            if (proxy.auth_type == ProxyConfiguration::AuthType::Basic) {
                req.set(http::field::proxy_authorization,
                        "Basic " +
                            base64_encode(proxy.username + ":" + proxy.password));
            }

            beast::get_lowest_layer(stream).expires_after(
                o.socket.connect_timeout);
            co_await http::async_write(stream, req,
                                       redirect_error(use_awaitable, ec));
            if (ec) {
                co_return Status::err(transport_error(
                    Error::Code::ProxyFailed, ec, "CONNECT to " + proxy.host));
            }

            // A successful CONNECT response has no body.
            beast::flat_buffer buffer;
            http::response_parser<http::empty_body> parser;
            parser.skip(true);
            co_await http::async_read(stream, buffer, parser,
                                      redirect_error(use_awaitable, ec));
            if (ec) {
                co_return Status::err(transport_error(
                    Error::Code::ProxyFailed, ec, "CONNECT to " + proxy.host));
            }

            const int status = static_cast<int>(parser.get().result_int());
            if (status != 200) {
                Error e{Error::Code::ProxyFailed,
                        "Proxy " + proxy.host + " refused CONNECT to " +
                            authority + " with status " +
                            std::to_string(status)};
                e.native_code = status;
                co_return Status::err(std::move(e));
            }
            SPDLOG_DEBUG("Tunnel to {} open through proxy {}:{}", authority,
                         proxy.host, proxy.port);
            co_return ok_status();
        }

        /**
         * @brief One established HTTP/1.1 connection over `Stream`.
         */
        template <class Stream>
        class BeastChannel final : public Channel {
           public:
            BeastChannel(Stream stream, ContextList contexts,
                         const ConnectOptions& o)
                : m_contexts(std::move(contexts)),
                  m_stream(std::move(stream)),
                  m_io_timeout(o.socket.io_timeout),
                  m_buffer_size(std::max<std::size_t>(o.buffer_size, 1)),
                  m_read_size(std::max<std::size_t>(
                      std::min(o.window_size, o.buffer_size), 1)) {}

            ~BeastChannel() override { close(); }

            boost::asio::awaitable<Status> exchange(
                const WireRequest& req, ExchangeHandler& handler) override {
                if (!is_open()) {
                    co_return Status::err(Error::Code::SendFailed,
                                          "Channel is closed");
                }
                auto sent = co_await send(req);
                if (!sent) {
                    close();
                    co_return sent;
                }
                auto received = co_await receive(req, handler);
                if (!received) close();
                co_return received;
            }

            bool is_open() const noexcept override {
                return m_open &&
                       beast::get_lowest_layer(m_stream).socket().is_open();
            }

            void close() noexcept override {
                if (!m_open) return;
                m_open = false;
                close_stream(m_stream);
            }

           private:
            void arm_timeout() {
                beast::get_lowest_layer(m_stream).expires_after(m_io_timeout);
            }

            boost::asio::awaitable<Status> send(const WireRequest& req) {
                namespace http = beast::http;
                boost::system::error_code ec;

                http::request<http::buffer_body> beast_req;
                beast_req.version(11);
                beast_req.method(to_boost_http_method(req.method));
                beast_req.target(req.target);
                apply_request_headers(req.headers, beast_req.base());
                beast_req.keep_alive(true);

                const bool has_body = static_cast<bool>(req.body);
                if (beast_req.find(http::field::content_length) ==
                    beast_req.end()) {
                    if (!has_body) {
                        if (req.method == HttpMethod::Put) {
                            beast_req.content_length(0);
                        }
                    } else if (auto len = req.body->length()) {
                        beast_req.content_length(*len);
                    } else {
                        beast_req.chunked(true);
                    }
                }
                beast_req.body().data = nullptr;
                beast_req.body().size = 0;
                beast_req.body().more = has_body;

                http::request_serializer<http::buffer_body> sr{beast_req};

                arm_timeout();
                if (!has_body) {
                    co_await http::async_write(m_stream, sr,
                                               redirect_error(use_awaitable, ec));
                    if (ec) {
                        co_return Status::err(transport_error(
                            Error::Code::SendFailed, ec, "Write request"));
                    }
                    co_return ok_status();
                }

                co_await http::async_write_header(
                    m_stream, sr, redirect_error(use_awaitable, ec));
                if (ec) {
                    co_return Status::err(transport_error(
                        Error::Code::SendFailed, ec, "Write request header"));
                }

                std::vector<std::uint8_t> buf(m_buffer_size);
                while (!sr.is_done()) {
                    std::size_t written = 0;
                    auto more = req.body->read(std::span<std::uint8_t>(buf),
                                               written);
                    if (!more) co_return Status::err(std::move(more).error());

                    beast_req.body().data = written ? buf.data() : nullptr;
                    beast_req.body().size = written;
                    beast_req.body().more = more.value();

                    arm_timeout();
                    co_await http::async_write(m_stream, sr,
                                               redirect_error(use_awaitable, ec));
                    if (ec == http::error::need_buffer) ec = {};
                    if (ec) {
                        co_return Status::err(transport_error(
                            Error::Code::SendFailed, ec, "Write request body"));
                    }
                }
                co_return ok_status();
            }

            boost::asio::awaitable<Status> receive(const WireRequest& req,
                                                   ExchangeHandler& handler) {
                namespace http = beast::http;
                boost::system::error_code ec;

                http::response_parser<http::buffer_body> parser;
                parser.body_limit(boost::none);
                if (req.method == HttpMethod::Head) parser.skip(true);

                arm_timeout();
                co_await http::async_read_header(
                    m_stream, m_buffer, parser, redirect_error(use_awaitable, ec));
                if (ec) {
                    co_return Status::err(transport_error(
                        Error::Code::ReceiveFailed, ec, "Read response header"));
                }

                HeaderList headers;
                copy_response_headers(parser.get().base(), headers);
                auto delivered = handler.on_response_headers(
                    static_cast<int>(parser.get().result_int()), headers);
                if (!delivered) co_return delivered;

                std::vector<std::uint8_t> chunk(m_read_size);
                while (!parser.is_done()) {
                    parser.get().body().data = chunk.data();
                    parser.get().body().size = chunk.size();

                    arm_timeout();
                    co_await http::async_read(m_stream, m_buffer, parser,
                                              redirect_error(use_awaitable, ec));
                    if (ec == http::error::need_buffer) ec = {};
                    if (ec) {
                        co_return Status::err(transport_error(
                            Error::Code::ReceiveFailed, ec,
                            "Read response body"));
                    }

                    const auto n = chunk.size() - parser.get().body().size;
                    if (n == 0) continue;
                    delivered = handler.on_response_body(
                        std::span<const std::uint8_t>(chunk.data(), n));
                    if (!delivered) co_return delivered;
                }

                if (!parser.get().keep_alive()) close();
                co_return ok_status();
            }

            ContextList m_contexts;
            Stream m_stream;
            beast::flat_buffer m_buffer;
            std::chrono::milliseconds m_io_timeout;
            std::size_t m_buffer_size;
            std::size_t m_read_size;
            bool m_open{true};
        };

        template <class Stream>
        std::unique_ptr<Channel> make_channel(Stream&& stream,
                                              ContextList contexts,
                                              const ConnectOptions& o) {
            return std::make_unique<BeastChannel<std::decay_t<Stream>>>(
                std::move(stream), std::move(contexts), o);
        }
    }  // namespace

    std::string base64_encode(std::string_view in) {
        // EVP_EncodeBlock writes a trailing NUL.
        std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
        const int n = EVP_EncodeBlock(
            reinterpret_cast<unsigned char*>(out.data()),
            reinterpret_cast<const unsigned char*>(in.data()),
            static_cast<int>(in.size()));
        out.resize(static_cast<std::size_t>(n));
        return out;
    }

    Result<std::shared_ptr<ssl::context>> make_tls_context(
        const TlsConfiguration& tls) {
        using R = Result<std::shared_ptr<ssl::context>>;
        auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
        boost::system::error_code ec;

        if (!tls.verify_peer) {
            ctx->set_verify_mode(ssl::verify_none, ec);
            if (ec) {
                return R::err(transport_error(Error::Code::InvalidConfig, ec,
                                              "Set verify mode"));
            }
            return R::ok(std::move(ctx));
        }

        ctx->set_default_verify_paths(ec);
        if (ec) {
            return R::err(transport_error(Error::Code::InvalidConfig, ec,
                                          "Load default verify paths"));
        }
        if (tls.ca_file) {
            ctx->load_verify_file(*tls.ca_file, ec);
            if (ec) {
                return R::err(transport_error(Error::Code::InvalidConfig, ec,
                                              "Load CA file " + *tls.ca_file));
            }
        }
        if (tls.ca_path) {
            ctx->add_verify_path(*tls.ca_path, ec);
            if (ec) {
                return R::err(transport_error(Error::Code::InvalidConfig, ec,
                                              "Add CA path " + *tls.ca_path));
            }
        }
        ctx->set_verify_mode(ssl::verify_peer, ec);
        if (ec) {
            return R::err(transport_error(Error::Code::InvalidConfig, ec,
                                          "Set verify mode"));
        }
        return R::ok(std::move(ctx));
    }

    boost::asio::awaitable<Result<std::unique_ptr<Channel>>>
    BeastTransport::connect(const ConnectOptions& o) {
        using R = Result<std::unique_ptr<Channel>>;
        boost::system::error_code ec;

        if (o.endpoint.https && !o.tls) {
            co_return R::err(Error::Code::InvalidConfig,
                             "TLS configuration must be set if https is used");
        }

        const bool via_proxy = o.proxy.has_value();
        const std::string dial_host = via_proxy ? o.proxy->host : o.endpoint.host;
        const std::string dial_port =
            via_proxy ? std::to_string(o.proxy->port) : o.endpoint.port;

        tcp::resolver resolver(m_ex);
        auto results = co_await resolver.async_resolve(
            dial_host, dial_port, redirect_error(use_awaitable, ec));
        if (ec) {
            co_return R::err(transport_error(Error::Code::ConnectionFailed, ec,
                                             "Resolve " + dial_host));
        }

        PlainStream tcp_stream(m_ex);
        tcp_stream.expires_after(o.socket.connect_timeout);
        co_await tcp_stream.async_connect(results,
                                          redirect_error(use_awaitable, ec));
        if (ec) {
            co_return R::err(transport_error(Error::Code::ConnectionFailed, ec,
                                             "Connect to " + dial_host + ":" +
                                                 dial_port));
        }
        tcp_stream.socket().set_option(
            tcp::socket::keep_alive(o.socket.keep_alive), ec);
        if (ec) SPDLOG_WARN("Could not set SO_KEEPALIVE: {}", ec.message());
        tcp_stream.socket().set_option(tcp::no_delay(true), ec);
        if (ec) SPDLOG_WARN("Could not set TCP_NODELAY: {}", ec.message());

        if (!via_proxy || !o.proxy->tls) {
            if (via_proxy) {
                auto tunnel = co_await proxy_tunnel(tcp_stream, o);
                if (!tunnel) co_return R::forward_error(tunnel);
            }
            if (!o.endpoint.https) {
                co_return R::ok(make_channel(std::move(tcp_stream), {}, o));
            }

            auto ctx = make_tls_context(*o.tls);
            if (!ctx) co_return R::forward_error(ctx);
            TlsStream tls(std::move(tcp_stream), *ctx.value());
            auto shaken = co_await tls_handshake(tls, *o.tls, o.endpoint.host,
                                                 o.socket.connect_timeout);
            if (!shaken) co_return R::forward_error(shaken);
            co_return R::ok(make_channel(std::move(tls), {ctx.value()}, o));
        }

        auto proxy_ctx = make_tls_context(*o.proxy->tls);
        if (!proxy_ctx) co_return R::forward_error(proxy_ctx);
        ProxyTlsStream proxy_stream(std::move(tcp_stream), *proxy_ctx.value());
        auto proxy_shaken =
            co_await tls_handshake(proxy_stream, *o.proxy->tls, o.proxy->host,
                                   o.socket.connect_timeout);
        if (!proxy_shaken) co_return R::forward_error(proxy_shaken);

        auto tunnel = co_await proxy_tunnel(proxy_stream, o);
        if (!tunnel) co_return R::forward_error(tunnel);

        if (!o.endpoint.https) {
            co_return R::ok(
                make_channel(std::move(proxy_stream), {proxy_ctx.value()}, o));
        }

        auto ctx = make_tls_context(*o.tls);
        if (!ctx) co_return R::forward_error(ctx);
        TunnelTlsStream tls(std::move(proxy_stream), *ctx.value());
        auto shaken = co_await tls_handshake(tls, *o.tls, o.endpoint.host,
                                             o.socket.connect_timeout);
        if (!shaken) co_return R::forward_error(shaken);
        co_return R::ok(make_channel(std::move(tls),
                                     {proxy_ctx.value(), ctx.value()}, o));
    }

}  // namespace s3_cpp
