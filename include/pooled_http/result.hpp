#pragma once

#include <cassert>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace pooled_http {

    /// @brief Result<T> holds either a successful value of type T or an Error.
    /// @tparam T The type of the successful value. May be move-only.
    /// @note Similar to std::expected<T, Error> in C++23. Transport, protocol
    /// and pool failures travel through Result; usage faults are thrown as
    /// UsageError instead.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        /// @brief Create a successful Result, constructing T in place.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Create an error Result with the given Error.
        static Result err(const Error& error) {
            return Result(std::in_place_type<Error>, error);
        }

        /// @brief Create an error Result with the given Error.
        static Result err(Error&& error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief Create an error Result from a code and a message.
        static Result err(Error::Code code, std::string message) {
            return Result(std::in_place_type<Error>,
                          Error{code, std::move(message)});
        }

        /// @brief Allow `if (result) { ... }` to mean "if success".
        explicit operator bool() const noexcept { return has_value(); }

        /// @brief True if this Result holds a value of type T.
        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        /// @brief True if this Result holds an Error.
        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        /// @brief Get the stored value (const lvalue overload).
        const T& value() const& {
            const T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        /// @brief Get the stored value (mutable lvalue overload).
        T& value() & {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        /// @brief Get the stored value (rvalue overload), for moving it out.
        T&& value() && {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return std::move(*p);
        }

        /// @brief Pointer access to the stored value, nullptr on error.
        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }

        /// @brief Pointer access to the stored value, nullptr on error.
        [[nodiscard]] T* value_ptr() noexcept {
            return std::get_if<T>(&m_state);
        }

        /// @brief Get the stored error (const lvalue overload).
        const Error& error() const& {
            const Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        /// @brief Get the stored error (rvalue overload).
        Error&& error() && {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        /// @brief Pointer access to the stored error, nullptr on success.
        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Pointer access to the stored error, nullptr on success.
        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Return the stored value if present, otherwise call a
        /// fallback function. The fallback only runs on error.
        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) && {
            return has_value() ? std::move(*this).value()
                               : std::forward<F>(make_fallback)();
        }

        /// @brief Eager fallback: return stored value if present, otherwise
        /// return fallback.
        T value_or(T fallback) const& {
            return has_value() ? value() : std::move(fallback);
        }

        /// @brief Convert an error Result of one type into another.
        /// @note Only valid when this Result holds an Error.
        template <typename U>
        Result<U> forward_error() const& {
            return Result<U>::err(error());
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<Error>, const Error& error)
            : m_state(std::in_place_type<Error>, error) {}

        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        /// @brief Exactly one of {T, Error} is active at any time.
        std::variant<T, Error> m_state;
    };

}  // namespace pooled_http
