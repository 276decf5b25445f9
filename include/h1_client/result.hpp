#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace h1_client {

    /// @brief Result<T> holds either a value of type T or an Error.
    /// @tparam T The type of the successful value.
    /// @note Modelled on std::expected<T, Error>; every fallible transport
    /// operation returns one instead of throwing.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        /// @brief Build a successful Result, constructing T in place.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Build a failed Result holding a copy of the error.
        static Result err(const Error& error) {
            return Result(std::in_place_type<Error>, error);
        }

        /// @brief Build a failed Result, taking ownership of the error.
        static Result err(Error&& error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief Build a failed Result from a code and a message.
        static Result err(Error::Code code, std::string message) {
            return Result(std::in_place_type<Error>,
                          Error{code, std::move(message)});
        }

        /// @brief `if (result)` means "if success".
        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        const T& value() const& {
            const T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        T& value() & {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        T&& value() && {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return std::move(*p);
        }

        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }

        [[nodiscard]] T* value_ptr() noexcept { return std::get_if<T>(&m_state); }

        const Error& error() const& {
            const Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error& error() & {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error&& error() && {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }

        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Stored value, or @p fallback when this Result holds an Error.
        T value_or(T fallback) const& {
            return has_value() ? value() : std::move(fallback);
        }

        T value_or(T fallback) && {
            return has_value() ? std::move(*this).value() : std::move(fallback);
        }

        /// @brief Stored error, or @p fallback when this Result holds a value.
        /// Handy on logging paths that want a reference without branching.
        const Error& error_or(const Error& fallback) const noexcept {
            return has_error() ? *error_ptr() : fallback;
        }

        /// @brief Re-wrap the error of a failed Result as a Result<U>.
        /// @pre has_error()
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

}  // namespace h1_client
