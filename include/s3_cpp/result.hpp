#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace s3_cpp {

    /// @brief Result<T> holds either a value of type T or an Error.
    /// @tparam T The type of the successful value.
    /// @note Plays the role of std::expected<T, Error>. Every fallible call
    /// in the pool, the transport and the engine returns one of these; errors
    /// are never thrown across those boundaries.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        using value_type = T;

        /// @brief An unset Result holds Error::Code::Unknown. Asio completion
        /// handlers need a default-constructible result type.
        Result()
            : m_state(std::in_place_index<1>,
                      Error{Error::Code::Unknown, "result not set"}) {}

        /// @brief Build a successful Result, constructing T in place.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_index<0>, std::forward<Args>(args)...);
        }

        /// @brief Build a failed Result.
        static Result err(Error error) {
            return Result(std::in_place_index<1>, std::move(error));
        }

        /// @brief Build a failed Result from a code and a message.
        static Result err(Error::Code code, std::string message) {
            return err(Error{code, std::move(message)});
        }

        /// @brief Re-type the error of another Result.
        /// @note Only valid when `other` holds an error.
        template <typename U>
        static Result forward_error(const Result<U>& other) {
            return err(other.error());
        }

        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept { return m_state.index() == 0; }

        bool has_error() const noexcept { return m_state.index() == 1; }

        const T& value() const& {
            assert(has_value() &&
                   "Result::value() called but this Result holds an Error");
            return std::get<0>(m_state);
        }

        T& value() & {
            assert(has_value() &&
                   "Result::value() called but this Result holds an Error");
            return std::get<0>(m_state);
        }

        T&& value() && {
            assert(has_value() &&
                   "Result::value() called but this Result holds an Error");
            return std::get<0>(std::move(m_state));
        }

        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<0>(&m_state);
        }

        [[nodiscard]] T* value_ptr() noexcept { return std::get_if<0>(&m_state); }

        const Error& error() const& {
            assert(has_error() &&
                   "Result::error() called but this Result holds a value");
            return std::get<1>(m_state);
        }

        Error&& error() && {
            assert(has_error() &&
                   "Result::error() called but this Result holds a value");
            return std::get<1>(std::move(m_state));
        }

        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<1>(&m_state);
        }

        /// @brief Eager fallback: the stored value, or `fallback` on error.
        T value_or(T fallback) const& {
            return has_value() ? value() : std::move(fallback);
        }

        T value_or(T fallback) && {
            return has_value() ? std::move(*this).value() : std::move(fallback);
        }

       private:
        template <std::size_t I, typename... Args>
        explicit Result(std::in_place_index_t<I> idx, Args&&... args)
            : m_state(idx, std::forward<Args>(args)...) {}

        /// @brief Index 0 is the value, index 1 the error, so T == Error
        /// would still be unambiguous.
        std::variant<T, Error> m_state;
    };

    /// @brief Result of an operation that produces no value.
    using Status = Result<std::monostate>;

    /// @brief Shorthand for a successful Status.
    inline Status ok_status() { return Status::ok(); }

}  // namespace s3_cpp
