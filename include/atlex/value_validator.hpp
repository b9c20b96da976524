#pragma once

/**
 * @file value_validator.hpp
 * @brief Checks instance values against nodes of a SchemaGraph
 *
 * Validation never stops at the first problem: every sibling property and
 * array element is checked and all violations are returned, ordered by path
 * (object properties lexicographically, required-field checks first, array
 * elements by index). On success the normalized value is returned, with
 * format-constrained strings in canonical form.
 */

#include "atlex/options.hpp"
#include "atlex/schema.hpp"
#include "atlex/violation.hpp"

#include <string_view>

#include <nlohmann/json.hpp>

namespace atlex::validation {

[[nodiscard]] ValidationOutcome validate_value(const schema::SchemaGraph& graph,
                                               schema::NodeId node,
                                               const nlohmann::json& value,
                                               const ValidatorOptions& options = {});

/// Query parameters of a `query` or `procedure` definition
[[nodiscard]] ValidationOutcome validate_parameters(const schema::SchemaGraph& graph,
                                                    std::string_view nsid,
                                                    const nlohmann::json& params,
                                                    const ValidatorOptions& options = {});

/// Input body of a `procedure` definition
[[nodiscard]] ValidationOutcome validate_input(const schema::SchemaGraph& graph,
                                               std::string_view nsid,
                                               const nlohmann::json& body,
                                               const ValidatorOptions& options = {});

/// Output body of a `query` or `procedure` definition
[[nodiscard]] ValidationOutcome validate_output(const schema::SchemaGraph& graph,
                                                std::string_view nsid,
                                                const nlohmann::json& body,
                                                const ValidatorOptions& options = {});

}  // namespace atlex::validation
