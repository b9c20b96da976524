#pragma once

/**
 * @file record.hpp
 * @brief Record validation and record key checks
 */

#include "atlex/options.hpp"
#include "atlex/schema.hpp"
#include "atlex/tid.hpp"
#include "atlex/violation.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace atlex::validation {

/// Why a record key was rejected; always a ViolationKind::kInvalidKey
struct KeyError
{
    std::string reason;
    std::optional<identifiers::FormatErrorKind> format_error;

    [[nodiscard]] Violation to_violation() const;
};

using KeyResult = std::expected<std::string, KeyError>;

/// Payload and key outcomes are reported separately
struct RecordValidation
{
    ValidationOutcome payload;
    KeyResult key;  ///< Canonical key on success

    [[nodiscard]] bool ok() const { return payload.has_value() && key.has_value(); }
};

/**
 * Validate a record instance against the `record` definition @p record_nsid.
 * A `$type` field, when present, must name the same definition as
 * @p record_nsid ("nsid" and "nsid#main" are equivalent). A mismatch is
 * reported at `$type` ahead of the payload's own violations.
 */
[[nodiscard]] ValidationOutcome validate_record(const schema::SchemaGraph& graph,
                                                std::string_view record_nsid,
                                                const nlohmann::json& instance,
                                                const ValidatorOptions& options = {});

/// Validate a record instance together with its storage key
[[nodiscard]] RecordValidation validate_record(const schema::SchemaGraph& graph,
                                               std::string_view record_nsid,
                                               const nlohmann::json& instance,
                                               std::string_view key,
                                               const ValidatorOptions& options = {});

/// Check a key against a key strategy and return its canonical form
[[nodiscard]] KeyResult validate_record_key(const schema::RecordKeyStrategy& strategy,
                                            std::string_view key);

/// Key strategy of a record definition, or nullopt if @p record_nsid names no record
[[nodiscard]] std::optional<schema::RecordKeyStrategy>
record_key_strategy(const schema::SchemaGraph& graph, std::string_view record_nsid);

/**
 * Produce a key for a new record: a fresh TID for `tid`, the literal for
 * `literal:<v>`. Strategies `any` and `nsid` need a caller-supplied key.
 */
[[nodiscard]] KeyResult derive_record_key(const schema::RecordKeyStrategy& strategy,
                                          identifiers::TidGenerator& generator);

}  // namespace atlex::validation
