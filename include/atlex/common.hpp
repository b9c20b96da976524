#pragma once

/**
 * @file common.hpp
 * @brief Error and result types for lexicon compilation and setup
 */

#include <expected>
#include <string>
#include <utility>

namespace atlex {

/**
 * @brief Failure of an operation that cannot produce its result
 *
 * Lexicon authoring mistakes (build_graph, parse_document), bad options and
 * logging setup report through Error. Problems in record data never do; those
 * are collected as validation::Violations.
 */
struct Error
{
    std::string code;     ///< Stable identifier, e.g. "UnresolvedRef"
    std::string message;  ///< Detail, usually prefixed with the definition path

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }

    /// "<code>: <message>"
    [[nodiscard]] std::string describe() const { return code + ": " + message; }
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

}  // namespace atlex
