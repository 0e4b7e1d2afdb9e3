#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "s3_cpp/request.hpp"
#include "s3_cpp/result.hpp"

namespace s3_cpp {

    enum class MetaRequestKind : std::uint8_t { GetObject, PutObject };

    /// @brief Lifecycle of one logical operation. A retrieval walks
    /// Created, Sent, HeadersReceived, BodyStreaming, Finished. A store
    /// produces its body before the response head arrives, so it moves
    /// from Sent to BodySending and then to Finished.
    enum class MetaRequestState : std::uint8_t {
        Created,
        Sent,
        HeadersReceived,
        BodyStreaming,
        BodySending,
        Finished,
    };

    inline const char* to_string(MetaRequestKind k) {
        return k == MetaRequestKind::GetObject ? "GetObject" : "PutObject";
    }

    inline const char* to_string(MetaRequestState s) {
        switch (s) {
            case MetaRequestState::Created:
                return "Created";
            case MetaRequestState::Sent:
                return "Sent";
            case MetaRequestState::HeadersReceived:
                return "HeadersReceived";
            case MetaRequestState::BodyStreaming:
                return "BodyStreaming";
            case MetaRequestState::BodySending:
                return "BodySending";
            case MetaRequestState::Finished:
                return "Finished";
        }
        return "Unknown";
    }

    /**
     * @brief State machine shared by all meta requests.
     *
     * Transitions only move forward. BodyStreaming and BodySending are
     * alternatives: once in one, the other is unreachable.
     */
    class MetaRequestBase {
       public:
        using id_type = std::uint64_t;

        MetaRequestBase(MetaRequestKind kind, WireRequest request)
            : m_id(next_id()), m_kind(kind), m_request(std::move(request)) {}

        MetaRequestBase(const MetaRequestBase&) = delete;
        MetaRequestBase& operator=(const MetaRequestBase&) = delete;

        id_type id() const noexcept { return m_id; }

        MetaRequestKind kind() const noexcept { return m_kind; }

        /// @brief The serialized request, before interceptors run.
        const WireRequest& request() const noexcept { return m_request; }

        MetaRequestState state() const {
            std::lock_guard lock(m_mutex);
            return m_state;
        }

        bool is_finished() const { return state() == MetaRequestState::Finished; }

        /// @brief Move to `next` if that is a forward step.
        /// @return false, leaving the state alone, for a backward or
        /// repeated step or for Finished (only finish() may end a request).
        bool advance(MetaRequestState next) {
            std::lock_guard lock(m_mutex);
            if (next == MetaRequestState::Finished ||
                rank(next) <= rank(m_state)) {
                return false;
            }
            m_state = next;
            return true;
        }

        /// @brief Keep a header mapping failure for diagnostics.
        void record_mapping_error(Error error) {
            std::lock_guard lock(m_mutex);
            m_mapping_errors.push_back(std::move(error));
        }

        std::vector<Error> mapping_errors() const {
            std::lock_guard lock(m_mutex);
            return m_mapping_errors;
        }

       protected:
        ~MetaRequestBase() = default;

        mutable std::mutex m_mutex;
        MetaRequestState m_state{MetaRequestState::Created};

       private:
        static int rank(MetaRequestState s) noexcept {
            switch (s) {
                case MetaRequestState::Created:
                    return 0;
                case MetaRequestState::Sent:
                    return 1;
                case MetaRequestState::HeadersReceived:
                    return 2;
                case MetaRequestState::BodyStreaming:
                case MetaRequestState::BodySending:
                    return 3;
                case MetaRequestState::Finished:
                    return 4;
            }
            return 4;
        }

        static id_type next_id() noexcept {
            static std::atomic<id_type> counter{0};
            return counter.fetch_add(1, std::memory_order_relaxed) + 1;
        }

        id_type m_id;
        MetaRequestKind m_kind;
        WireRequest m_request;
        std::vector<Error> m_mapping_errors;
    };

    /**
     * @brief One logical operation and its single result slot.
     * @tparam Output The typed output produced on success.
     */
    template <typename Output>
    class MetaRequest final : public MetaRequestBase {
       public:
        using MetaRequestBase::MetaRequestBase;

        /// @brief Resolve the result slot. First writer wins.
        /// @return false if the request was already finished; the second
        /// result is dropped and logged as an error.
        bool finish(Result<Output> result) {
            std::lock_guard lock(m_mutex);
            if (m_state == MetaRequestState::Finished) {
                SPDLOG_ERROR(
                    "MetaRequest {} ({}) already finished; dropping second "
                    "{} result",
                    id(), to_string(kind()),
                    result ? "success" : to_string(result.error().code));
                return false;
            }
            m_result.emplace(std::move(result));
            m_state = MetaRequestState::Finished;
            return true;
        }

        /// @brief Move the result out. Unknown error if not yet finished or
        /// already taken.
        Result<Output> take_result() {
            std::lock_guard lock(m_mutex);
            if (!m_result) {
                return Result<Output>::err(Error::Code::Unknown,
                                           "MetaRequest has no result");
            }
            Result<Output> out = std::move(*m_result);
            m_result.reset();
            return out;
        }

       private:
        std::optional<Result<Output>> m_result;
    };

}  // namespace s3_cpp
