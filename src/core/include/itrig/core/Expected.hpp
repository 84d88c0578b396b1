/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * ITRIG_TRY / ITRIG_TRY_VOID macros for early-return propagation.
 *
 * @author IntTrig contributors
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ITRIG_CORE_EXPECTED_HPP
    #define ITRIG_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace itrig::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace itrig::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type itrig::core::Expected<U>.
 */
#define ITRIG_TRY(expr)                                                   \
    ({                                                                     \
        auto &&_itrig_result = (expr);                                     \
        if (!_itrig_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_itrig_result.error()));       \
        std::move(_itrig_result.value());                                  \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type itrig::core::ExpectedVoid.
 */
#define ITRIG_TRY_VOID(expr)                                              \
    do {                                                                    \
        auto &&_itrig_result = (expr);                                     \
        if (!_itrig_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_itrig_result.error()));       \
    } while (false)

#endif // ITRIG_CORE_EXPECTED_HPP
