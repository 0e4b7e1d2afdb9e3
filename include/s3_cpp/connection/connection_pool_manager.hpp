#pragma once

#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without it

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <list>
#include <memory>
#include <unordered_map>
#include <utility>

#include "connection.hpp"
#include "connection_pool_types.hpp"
#include "s3_cpp/config.hpp"
#include "s3_cpp/endpoint.hpp"
#include "s3_cpp/result.hpp"
#include "s3_cpp/transport/transport.hpp"

namespace s3_cpp {

    /**
     * @brief Bounded pool of connections to a single endpoint.
     *
     * All bookkeeping lives in a shared State mutated only on a strand, so
     * acquire() and release() may be called from any thread. Live
     * connections (idle + leased + being created) never exceed
     * max_connections.
     */
    class ConnectionPoolManager {
       public:
        using executor_type = boost::asio::any_io_executor;
        using clock_type = std::chrono::steady_clock;
        using connection_ptr = std::shared_ptr<Connection>;

       private:
        struct IdleEntry {
            connection_ptr conn;
            clock_type::time_point last_used{};
        };

        struct Waiter {
            /// Why the waiter was woken; None after a plain timer expiry.
            enum class WakeReason : std::uint8_t {
                None,
                Granted,   ///< `granted` holds a released connection
                Reserved,  ///< a creation slot was reserved for this waiter
                Shutdown,
            };

            boost::asio::steady_timer timer;
            WakeReason reason{WakeReason::None};
            connection_ptr granted;

            explicit Waiter(const boost::asio::strand<executor_type>& strand)
                : timer(strand) {}
        };

        struct State {
            executor_type ex;
            boost::asio::strand<executor_type> strand;
            std::shared_ptr<Transport> transport;
            ConnectionPoolConfiguration config;
            ConnectOptions connect_options;

            bool shutting_down = false;

            std::deque<IdleEntry> idle;
            std::unordered_map<Connection::id_type, connection_ptr> leased;
            std::size_t connecting = 0;
            std::list<std::shared_ptr<Waiter>> waiters;

            ConnectionPoolMetrics metrics;

            State(executor_type ex_, std::shared_ptr<Transport> transport_,
                  ConnectionPoolConfiguration config_, ConnectOptions options_)
                : ex(std::move(ex_)),
                  strand(boost::asio::make_strand(ex)),
                  transport(std::move(transport_)),
                  config(std::move(config_)),
                  connect_options(std::move(options_)) {}

            std::size_t live() const noexcept {
                return idle.size() + leased.size() + connecting;
            }

            std::size_t max_connections() const noexcept {
                return static_cast<std::size_t>(config.max_connections);
            }
        };

       public:
        /**
         * @brief Exclusive, temporary ownership of one Connection.
         *
         * Returned to its pool when destroyed unless it was released
         * explicitly first. Move-only.
         */
        class Lease {
           public:
            Lease() = default;

            ~Lease() { reset(); }

            Lease(const Lease&) = delete;
            Lease& operator=(const Lease&) = delete;

            Lease(Lease&& other) noexcept
                : m_state(std::exchange(other.m_state, {})),
                  m_conn(std::move(other.m_conn)) {}

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    m_state = std::exchange(other.m_state, {});
                    m_conn = std::move(other.m_conn);
                }
                return *this;
            }

            Connection* operator->() const noexcept { return m_conn.get(); }

            Connection& operator*() const noexcept { return *m_conn; }

            connection_ptr get() const noexcept { return m_conn; }

            explicit operator bool() const noexcept {
                return static_cast<bool>(m_conn);
            }

            /// @brief Report the connection broken; it is closed on return
            /// instead of being reused.
            void mark_unusable() noexcept {
                if (m_conn) m_conn->set_state(ConnectionState::Closing);
            }

            /// @brief Return the connection to its pool now.
            void reset() noexcept;

           private:
            friend class ConnectionPoolManager;

            Lease(std::weak_ptr<State> st, connection_ptr c) noexcept
                : m_state(std::move(st)), m_conn(std::move(c)) {}

            std::weak_ptr<State> m_state;
            connection_ptr m_conn{};
        };

        struct Stats {
            std::size_t idle = 0;
            std::size_t leased = 0;
            std::size_t connecting = 0;
            std::size_t waiting = 0;
        };

        /// @brief Validate `config` and build a pool. No I/O happens here.
        /// @return InvalidConfig on a malformed endpoint URI, https without
        /// TLS configuration, non-positive sizes or an incomplete proxy.
        static Result<std::shared_ptr<ConnectionPoolManager>> create(
            executor_type ex, std::shared_ptr<Transport> transport,
            ConnectionPoolConfiguration config);

        ConnectionPoolManager(const ConnectionPoolManager&) = delete;
        ConnectionPoolManager& operator=(const ConnectionPoolManager&) = delete;

        ~ConnectionPoolManager();

        executor_type get_executor() const noexcept { return m_state->ex; }

        const Endpoint& endpoint() const noexcept {
            return m_state->connect_options.endpoint;
        }

        const ConnectionPoolConfiguration& config() const noexcept {
            return m_state->config;
        }

        /// @brief Lease a connection: idle first, then a new one while under
        /// capacity, otherwise wait in FIFO order.
        /// @return Shutdown after shutdown(), Timeout once acquire_timeout
        /// elapses, or the transport error if creating the connection failed.
        boost::asio::awaitable<Result<Lease>> acquire();

        /// @brief Give a lease back, handing it to the oldest waiter if any.
        /// @return InvalidRelease for an empty lease or one from another pool.
        Status release(Lease&& lease);

        /// @brief Fail all waiters, close idle connections and refuse further
        /// acquires. Leased connections are closed when they come back.
        void shutdown();

        boost::asio::awaitable<Stats> stats();

        const ConnectionPoolMetrics& metrics() const noexcept {
            return m_state->metrics;
        }

       private:
        explicit ConnectionPoolManager(std::shared_ptr<State> state)
            : m_state(std::move(state)) {}

        static boost::asio::awaitable<Result<Lease>> acquire_impl(
            std::shared_ptr<State> s);

        static boost::asio::awaitable<Result<Lease>> create_connection(
            std::shared_ptr<State> s);

        static void return_to_pool(std::shared_ptr<State> s,
                                   connection_ptr conn) noexcept;
        static void return_to_pool_on_strand(const std::shared_ptr<State>& s,
                                             connection_ptr conn);

        static void hand_slot_to_next_waiter(State& s);
        static void shutdown_on_strand(State& s);
        static void prune_idle(State& s, clock_type::time_point now);
        static void close_connection(connection_ptr& c) noexcept;
        static void update_gauges(State& s) noexcept;

        static Lease make_lease(const std::shared_ptr<State>& s,
                                connection_ptr conn);

       private:
        std::shared_ptr<State> m_state;
    };

    using Lease = ConnectionPoolManager::Lease;

}  // namespace s3_cpp
