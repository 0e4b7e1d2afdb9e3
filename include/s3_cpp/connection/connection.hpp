#pragma once

#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without it

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <memory>

#include "s3_cpp/endpoint.hpp"
#include "s3_cpp/transport/transport.hpp"

namespace s3_cpp {

    enum class ConnectionState : std::uint8_t {
        Idle,     ///< In the pool, ready to be leased
        Leased,   ///< Exclusively owned by one caller
        Closing,  ///< Reported unusable or pool shutting down; closed on return
        Closed,   ///< Channel closed, never reused
    };

    inline const char* to_string(ConnectionState s) {
        switch (s) {
            case ConnectionState::Idle:
                return "Idle";
            case ConnectionState::Leased:
                return "Leased";
            case ConnectionState::Closing:
                return "Closing";
            case ConnectionState::Closed:
                return "Closed";
        }
        return "Unknown";
    }

    /**
     * @brief One established channel to the pool's endpoint.
     *
     * Owned by ConnectionPoolManager; a caller only reaches it through a
     * Lease. State transitions are made by the pool, except Closing which
     * the lessee may request through Lease::mark_unusable().
     */
    class Connection {
       public:
        using id_type = std::uint64_t;

        Connection(Endpoint endpoint, std::unique_ptr<Channel> channel)
            : m_id(next_id()),
              m_endpoint(std::move(endpoint)),
              m_channel(std::move(channel)) {}

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;

        ~Connection() { close(); }

        /// @brief Process-unique, never reused.
        id_type id() const noexcept { return m_id; }

        const Endpoint& endpoint() const noexcept { return m_endpoint; }

        ConnectionState state() const noexcept {
            return m_state.load(std::memory_order_acquire);
        }

        void set_state(ConnectionState s) noexcept {
            m_state.store(s, std::memory_order_release);
        }

        /// @brief Exchanges completed on this connection so far.
        std::uint64_t use_count() const noexcept {
            return m_uses.load(std::memory_order_relaxed);
        }

        /// @brief Run one request/response exchange over the channel.
        boost::asio::awaitable<Status> exchange(const WireRequest& req,
                                                ExchangeHandler& handler) {
            m_uses.fetch_add(1, std::memory_order_relaxed);
            co_return co_await m_channel->exchange(req, handler);
        }

        bool is_open() const noexcept {
            return m_channel && m_channel->is_open() &&
                   state() != ConnectionState::Closed;
        }

        void close() noexcept {
            if (m_channel) m_channel->close();
            set_state(ConnectionState::Closed);
        }

       private:
        static id_type next_id() noexcept {
            static std::atomic<id_type> counter{0};
            return counter.fetch_add(1, std::memory_order_relaxed) + 1;
        }

        id_type m_id;
        Endpoint m_endpoint;
        std::unique_ptr<Channel> m_channel;
        std::atomic<ConnectionState> m_state{ConnectionState::Leased};
        std::atomic<std::uint64_t> m_uses{0};
    };

}  // namespace s3_cpp
