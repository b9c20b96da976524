#pragma once

/**
 * @file options.hpp
 * @brief Build and validation options, loadable from JSON configuration
 */

#include "atlex/common.hpp"

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace atlex {

struct BuildOptions
{
    /// Directory holding lexicon.v1.schema.json; empty disables the shape check
    std::string schema_dir;
};

struct ValidatorOptions
{
    /// Handles must contain at least one dot
    bool strict_handles = true;
    /// Treat every object as closed
    bool reject_unknown_fields = false;
    /// Accept plain base64 strings where a `bytes` value is expected
    bool bytes_as_base64_string = false;
    /// Maximum instance nesting depth (objects and arrays)
    std::size_t max_depth = 128;
};

/**
 * Load BuildOptions from a JSON object.
 * Unknown keys and wrongly typed values are rejected with InvalidOptions.
 */
[[nodiscard]] Result<BuildOptions> load_build_options(const nlohmann::json& j);

/**
 * Load ValidatorOptions from a JSON object; absent keys keep their defaults.
 */
[[nodiscard]] Result<ValidatorOptions> load_validator_options(const nlohmann::json& j);

[[nodiscard]] nlohmann::json to_json(const ValidatorOptions& options);

}  // namespace atlex
