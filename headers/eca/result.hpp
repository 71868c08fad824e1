//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_RESULT_HPP
#define ERRORCLUSTERANALYZER_RESULT_HPP

/**
 * @file result.hpp
 * @brief Success-or-error return type.
 *
 * Operations that touch the environment (reading sources, loading
 * configuration, reading record batches) return a Result so the caller can
 * tell an I/O failure apart from an empty answer. A resolver that finds no
 * source file answers success(std::nullopt), not failure.
 *
 * @code
 *     auto resolved = resolver.resolve_by_class("com.example.OrderService", 23);
 *     if (resolved.is_err()) {
 *         ECA_LOG_ERROR("{}", resolved.error().to_string());
 *     } else if (resolved.value()) {
 *         use(*resolved.value());
 *     }
 * @endcode
 */

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace eca {

    template<typename T, typename E>
    class Result {
    public:
        using value_type = T;
        using error_type = E;

        static Result success(T value) {
            return Result(std::in_place_index<0>, std::move(value));
        }

        static Result failure(E error) {
            return Result(std::in_place_index<1>, std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
        [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

        explicit operator bool() const noexcept { return is_ok(); }

        /// @throws std::logic_error on an error result.
        T& value() & {
            check_ok();
            return std::get<0>(data_);
        }

        const T& value() const& {
            check_ok();
            return std::get<0>(data_);
        }

        T&& value() && {
            check_ok();
            return std::get<0>(std::move(data_));
        }

        /// @throws std::logic_error on a success result.
        E& error() & {
            check_err();
            return std::get<1>(data_);
        }

        const E& error() const& {
            check_err();
            return std::get<1>(data_);
        }

        /**
         * Feeds the success value to @p f, which returns another Result with
         * the same error type. An error short-circuits.
         */
        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            using Next = std::invoke_result_t<F, T&&>;
            if (is_err()) {
                return Next::failure(std::get<1>(std::move(data_)));
            }
            return std::forward<F>(f)(std::get<0>(std::move(data_)));
        }

        /**
         * Rewrites the error with @p f, typically to add context with
         * Error::with_context. A success value passes through.
         */
        template<typename F>
        Result map_error(F&& f) && {
            if (is_ok()) {
                return std::move(*this);
            }
            return failure(std::forward<F>(f)(std::get<1>(std::move(data_))));
        }

    private:
        template<std::size_t I, typename U>
        Result(std::in_place_index_t<I> index, U&& payload) : data_(index, std::forward<U>(payload)) {}

        void check_ok() const {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
        }

        void check_err() const {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
        }

        std::variant<T, E> data_;
    };

    /// Result of an operation that produces nothing on success.
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        static Result success() {
            return Result(std::nullopt);
        }

        static Result failure(E error) {
            return Result(std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
        [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

        explicit operator bool() const noexcept { return is_ok(); }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

    private:
        explicit Result(std::optional<E> error) : error_(std::move(error)) {}

        std::optional<E> error_;
    };

}  // namespace eca

#endif //ERRORCLUSTERANALYZER_RESULT_HPP
