#include "s3_cpp/connection/connection_pool_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <exception>

#include "s3_cpp/url.hpp"

namespace s3_cpp {

    using awaitable_lease = boost::asio::awaitable<Result<Lease>>;

    namespace {
        using PoolResult = Result<std::shared_ptr<ConnectionPoolManager>>;

        PoolResult config_error(std::string message) {
            return PoolResult::err(Error::Code::InvalidConfig,
                                   std::move(message));
        }
    }  // namespace

    PoolResult ConnectionPoolManager::create(
        executor_type ex, std::shared_ptr<Transport> transport,
        ConnectionPoolConfiguration config) {
        if (!transport) return config_error("Transport must not be null");

        auto ep = parse_endpoint_uri(config.endpoint_uri);
        if (!ep) return PoolResult::forward_error(ep);

        if (ep.value().https && !config.tls) {
            return config_error(
                "TLS configuration must be set if https is used");
        }
        if (config.window_size <= 0) {
            return config_error("Window size must be greater than zero");
        }
        if (config.buffer_size <= 0) {
            return config_error("Buffer size must be greater than zero");
        }
        if (config.max_connections <= 0) {
            return config_error("Max connections must be greater than zero");
        }
        if (config.proxy) {
            const auto& proxy = *config.proxy;
            if (proxy.host.empty()) {
                return config_error("Proxy host must not be empty");
            }
            if (proxy.port == 0) {
                return config_error("Proxy port must be greater than zero");
            }
            if (proxy.auth_type == ProxyConfiguration::AuthType::Basic &&
                proxy.username.empty()) {
                return config_error(
                    "Proxy basic authentication requires a username");
            }
        }

        ConnectOptions options;
        options.endpoint = std::move(ep).value();
        options.socket = config.socket;
        options.tls = config.tls;
        options.proxy = config.proxy;
        options.window_size = static_cast<std::size_t>(config.window_size);
        options.buffer_size = static_cast<std::size_t>(config.buffer_size);

        SPDLOG_DEBUG("Connection pool for {}://{}:{} (max {} connections)",
                     options.endpoint.scheme(), options.endpoint.host,
                     options.endpoint.port, config.max_connections);

        auto state = std::make_shared<State>(std::move(ex), std::move(transport),
                                             std::move(config),
                                             std::move(options));
        return PoolResult::ok(std::shared_ptr<ConnectionPoolManager>(
            new ConnectionPoolManager(std::move(state))));
    }

    ConnectionPoolManager::~ConnectionPoolManager() {
        if (m_state) shutdown();
    }

    awaitable_lease ConnectionPoolManager::acquire() {
        auto s = m_state;
        co_return co_await boost::asio::co_spawn(
            s->strand,
            [s]() -> awaitable_lease { co_return co_await acquire_impl(s); },
            boost::asio::use_awaitable);
    }

    Status ConnectionPoolManager::release(Lease&& lease) {
        auto s = m_state;
        if (!lease) {
            ++s->metrics.release_invalid;
            SPDLOG_ERROR("Release of an empty lease (already released?)");
            return Status::err(Error::Code::InvalidRelease,
                               "Lease holds no connection; it was already "
                               "released");
        }

        if (lease.m_state.lock() != s) {
            ++s->metrics.release_invalid;
            SPDLOG_ERROR("Release of connection {} not owned by this pool",
                         lease->id());
            return Status::err(Error::Code::InvalidRelease,
                               "Connection " + std::to_string(lease->id()) +
                                   " is not owned by this pool");
        }

        lease.reset();
        return ok_status();
    }

    void ConnectionPoolManager::shutdown() {
        auto s = m_state;
        boost::asio::dispatch(s->strand, [s] { shutdown_on_strand(*s); });
    }

    boost::asio::awaitable<ConnectionPoolManager::Stats>
    ConnectionPoolManager::stats() {
        auto s = m_state;
        co_return co_await boost::asio::co_spawn(
            s->strand,
            [s]() -> boost::asio::awaitable<Stats> {
                Stats out{};
                out.idle = s->idle.size();
                out.leased = s->leased.size();
                out.connecting = s->connecting;
                out.waiting = s->waiters.size();
                co_return out;
            },
            boost::asio::use_awaitable);
    }

    // -------------------------
    // acquire path (runs on the strand)
    // -------------------------

    awaitable_lease ConnectionPoolManager::acquire_impl(
        std::shared_ptr<State> s) {
        if (s->shutting_down) {
            ++s->metrics.acquire_shutdown;
            co_return Result<Lease>::err(Error::Code::Shutdown,
                                         "Connection pool is shut down");
        }

        prune_idle(*s, clock_type::now());

        if (!s->idle.empty()) {
            auto entry = std::move(s->idle.front());
            s->idle.pop_front();
            ++s->metrics.connection_reused;
            SPDLOG_DEBUG("Connection {} reused from idle set",
                         entry.conn->id());
            co_return Result<Lease>::ok(make_lease(s, std::move(entry.conn)));
        }

        if (s->live() < s->max_connections()) {
            ++s->connecting;
            co_return co_await create_connection(s);
        }

        auto waiter = std::make_shared<Waiter>(s->strand);
        if (s->config.acquire_timeout) {
            waiter->timer.expires_after(*s->config.acquire_timeout);
        } else {
            waiter->timer.expires_at(clock_type::time_point::max());
        }
        s->waiters.push_back(waiter);
        update_gauges(*s);

        // Every wake-up path sets `reason` before cancelling the timer; an
        // expiry that raced with a hand-off still sees the hand-off.
        boost::system::error_code ec;
        co_await waiter->timer.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        switch (waiter->reason) {
            case Waiter::WakeReason::Granted:
                ++s->metrics.connection_handed_off;
                co_return Result<Lease>::ok(
                    make_lease(s, std::move(waiter->granted)));
            case Waiter::WakeReason::Reserved:
                co_return co_await create_connection(s);
            case Waiter::WakeReason::Shutdown:
                ++s->metrics.acquire_shutdown;
                co_return Result<Lease>::err(Error::Code::Shutdown,
                                             "Connection pool is shut down");
            case Waiter::WakeReason::None:
                break;
        }

        s->waiters.remove(waiter);
        update_gauges(*s);
        ++s->metrics.acquire_timeout;
        co_return Result<Lease>::err(Error::Code::Timeout,
                                     "Timed out waiting for a connection");
    }

    awaitable_lease ConnectionPoolManager::create_connection(
        std::shared_ptr<State> s) {
        // The caller has already counted this creation in `connecting`.
        if (s->shutting_down) {
            --s->connecting;
            ++s->metrics.acquire_shutdown;
            co_return Result<Lease>::err(Error::Code::Shutdown,
                                         "Connection pool is shut down");
        }
        update_gauges(*s);

        Result<std::unique_ptr<Channel>> channel;
        try {
            channel = co_await s->transport->connect(s->connect_options);
        } catch (const std::exception& e) {
            channel = Result<std::unique_ptr<Channel>>::err(
                Error::Code::ConnectionFailed, e.what());
        }
        --s->connecting;

        if (!channel) {
            ++s->metrics.acquire_connect_failed;
            SPDLOG_WARN("Failed to connect to {}:{}: {} ({})",
                        s->connect_options.endpoint.host,
                        s->connect_options.endpoint.port,
                        channel.error().message,
                        to_string(channel.error().code));
            hand_slot_to_next_waiter(*s);
            update_gauges(*s);
            co_return Result<Lease>::err(std::move(channel).error());
        }

        auto conn = std::make_shared<Connection>(s->connect_options.endpoint,
                                                 std::move(channel).value());
        if (s->shutting_down) {
            close_connection(conn);
            update_gauges(*s);
            ++s->metrics.acquire_shutdown;
            co_return Result<Lease>::err(Error::Code::Shutdown,
                                         "Connection pool is shut down");
        }

        ++s->metrics.connection_created;
        SPDLOG_DEBUG("Connection {} created to {}:{}", conn->id(),
                     conn->endpoint().host, conn->endpoint().port);
        co_return Result<Lease>::ok(make_lease(s, std::move(conn)));
    }

    ConnectionPoolManager::Lease ConnectionPoolManager::make_lease(
        const std::shared_ptr<State>& s, connection_ptr conn) {
        conn->set_state(ConnectionState::Leased);
        s->leased.insert_or_assign(conn->id(), conn);
        ++s->metrics.acquire_success;
        update_gauges(*s);
        return Lease{std::weak_ptr<State>(s), std::move(conn)};
    }

    // -------------------------
    // return path
    // -------------------------

    void ConnectionPoolManager::Lease::reset() noexcept {
        if (!m_conn) return;

        auto st = m_state.lock();
        m_state.reset();
        if (!st) {
            // Pool already gone; nothing will ever reuse this connection.
            m_conn->close();
            m_conn.reset();
            return;
        }

        ConnectionPoolManager::return_to_pool(std::move(st), std::move(m_conn));
    }

    void ConnectionPoolManager::return_to_pool(std::shared_ptr<State> s,
                                               connection_ptr conn) noexcept {
        if (!s || !conn) return;

        // Copy the strand before `s` is moved into the handler.
        auto strand = s->strand;
        boost::asio::post(strand,
                          [s = std::move(s), conn = std::move(conn)]() mutable {
                              return_to_pool_on_strand(s, std::move(conn));
                          });
    }

    void ConnectionPoolManager::return_to_pool_on_strand(
        const std::shared_ptr<State>& s, connection_ptr conn) {
        auto it = s->leased.find(conn->id());
        if (it == s->leased.end() || it->second != conn) {
            ++s->metrics.release_invalid;
            SPDLOG_ERROR("Release of connection {} which is not leased",
                         conn->id());
            return;
        }

        const bool reusable = !s->shutting_down &&
                              conn->state() == ConnectionState::Leased &&
                              conn->is_open();

        if (!reusable) {
            s->leased.erase(it);
            SPDLOG_DEBUG("Connection {} closed on release ({})", conn->id(),
                         to_string(conn->state()));
            close_connection(conn);
            ++s->metrics.connection_closed;
            hand_slot_to_next_waiter(*s);
            update_gauges(*s);
            return;
        }

        if (!s->waiters.empty()) {
            // Stays Leased and stays in `leased`; only the owner changes.
            auto w = std::move(s->waiters.front());
            s->waiters.pop_front();
            SPDLOG_DEBUG("Connection {} handed off to waiting acquire",
                         conn->id());
            w->granted = std::move(conn);
            w->reason = Waiter::WakeReason::Granted;
            w->timer.cancel();
            update_gauges(*s);
            return;
        }

        s->leased.erase(it);
        conn->set_state(ConnectionState::Idle);
        s->idle.push_back(IdleEntry{std::move(conn), clock_type::now()});
        update_gauges(*s);
    }

    void ConnectionPoolManager::hand_slot_to_next_waiter(State& s) {
        if (s.shutting_down || s.waiters.empty() ||
            s.live() >= s.max_connections()) {
            return;
        }
        auto w = std::move(s.waiters.front());
        s.waiters.pop_front();
        ++s.connecting;
        w->reason = Waiter::WakeReason::Reserved;
        w->timer.cancel();
    }

    // -------------------------
    // utilities
    // -------------------------

    void ConnectionPoolManager::shutdown_on_strand(State& s) {
        if (s.shutting_down) return;
        s.shutting_down = true;

        for (auto& w : s.waiters) {
            w->reason = Waiter::WakeReason::Shutdown;
            w->timer.cancel();
        }
        s.waiters.clear();

        while (!s.idle.empty()) {
            auto entry = std::move(s.idle.front());
            s.idle.pop_front();
            close_connection(entry.conn);
        }

        for (auto& [id, conn] : s.leased) {
            (void)id;
            conn->set_state(ConnectionState::Closing);
        }

        update_gauges(s);
        SPDLOG_DEBUG("Connection pool for {} shut down ({} still leased)",
                     s.connect_options.endpoint.host, s.leased.size());
    }

    void ConnectionPoolManager::prune_idle(State& s,
                                           clock_type::time_point now) {
        const auto ttl = s.config.idle_timeout;
        auto stale = [&](const IdleEntry& e) {
            if (!e.conn->is_open()) return true;
            return ttl.count() > 0 && now - e.last_used > ttl;
        };

        for (auto it = s.idle.begin(); it != s.idle.end();) {
            if (stale(*it)) {
                SPDLOG_DEBUG("Connection {} pruned from idle set",
                             it->conn->id());
                close_connection(it->conn);
                ++s.metrics.connection_pruned;
                it = s.idle.erase(it);
            } else {
                ++it;
            }
        }
        update_gauges(s);
    }

    void ConnectionPoolManager::close_connection(connection_ptr& c) noexcept {
        if (!c) return;
        c->close();
        c.reset();
    }

    void ConnectionPoolManager::update_gauges(State& s) noexcept {
        s.metrics.total_idle.store(s.idle.size(), std::memory_order_relaxed);
        s.metrics.total_in_use.store(s.leased.size(), std::memory_order_relaxed);
        s.metrics.total_connecting.store(s.connecting,
                                         std::memory_order_relaxed);
        s.metrics.waiters_total.store(s.waiters.size(),
                                      std::memory_order_relaxed);
    }

}  // namespace s3_cpp
