#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace s3_cpp {

    /// @brief A wire token this build does not know, kept verbatim.
    struct UnrecognizedValue {
        std::string value;

        friend bool operator==(const UnrecognizedValue&,
                               const UnrecognizedValue&) = default;
    };

    /// @brief Maps an enum to its wire tokens. Specialised per enum with a
    /// `static constexpr std::array<std::pair<E, std::string_view>, N> table`.
    template <typename E>
    struct EnumTraits;

    /// @brief Canonical wire token of a known value.
    template <typename E>
    constexpr std::string_view to_wire(E value) noexcept {
        for (const auto& [e, token] : EnumTraits<E>::table) {
            if (e == value) return token;
        }
        return {};
    }

    /**
     * @brief Forward-compatible enum: either a known value of E or the
     * unrecognized token the service sent.
     */
    template <typename E>
    class OpenEnum {
       public:
        OpenEnum(E value) : m_value(value) {}  // NOLINT(google-explicit-constructor)
        explicit OpenEnum(UnrecognizedValue value) : m_value(std::move(value)) {}

        bool is_known() const noexcept {
            return std::holds_alternative<E>(m_value);
        }

        /// @brief The known value, or nullopt for an unrecognized token.
        std::optional<E> known() const noexcept {
            if (auto p = std::get_if<E>(&m_value)) return *p;
            return std::nullopt;
        }

        /// @brief Non-null only for an unrecognized token.
        const UnrecognizedValue* unrecognized() const noexcept {
            return std::get_if<UnrecognizedValue>(&m_value);
        }

        /// @brief Token to send: canonical for known values, the original
        /// string otherwise.
        std::string wire_value() const {
            if (auto p = std::get_if<E>(&m_value)) {
                return std::string(to_wire(*p));
            }
            return std::get<UnrecognizedValue>(m_value).value;
        }

        friend bool operator==(const OpenEnum& a, const OpenEnum& b) = default;

        friend bool operator==(const OpenEnum& a, E b) noexcept {
            auto p = std::get_if<E>(&a.m_value);
            return p != nullptr && *p == b;
        }

       private:
        std::variant<E, UnrecognizedValue> m_value;
    };

    /// @brief Parse a wire token. Matching is exact; tokens outside the table
    /// yield the unrecognized variant carrying `token`.
    template <typename E>
    OpenEnum<E> from_wire(std::string_view token) {
        for (const auto& [e, t] : EnumTraits<E>::table) {
            if (t == token) return OpenEnum<E>(e);
        }
        return OpenEnum<E>(UnrecognizedValue{std::string(token)});
    }

}  // namespace s3_cpp
