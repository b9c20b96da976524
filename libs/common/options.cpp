/**
 * @file options.cpp
 * @brief JSON loading for BuildOptions and ValidatorOptions
 */

#include "atlex/options.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <string_view>
#include <utility>

namespace atlex {

namespace {

[[nodiscard]] VoidResult check_known_keys(const nlohmann::json& j,
                                          std::span<const std::string_view> known,
                                          std::string_view what)
{
    if (!j.is_object()) {
        return std::unexpected(
            Error::make("InvalidOptions", std::string(what) + " must be a JSON object"));
    }
    for (const auto& [key, _] : j.items()) {
        if (std::ranges::find(known, std::string_view(key)) == known.end()) {
            return std::unexpected(Error::make(
                "InvalidOptions", "Unknown key in " + std::string(what) + ": '" + key + "'"));
        }
    }
    return {};
}

[[nodiscard]] VoidResult read_bool(const nlohmann::json& j, const char* key, bool& out)
{
    if (!j.contains(key)) {
        return {};
    }
    if (!j.at(key).is_boolean()) {
        return std::unexpected(
            Error::make("InvalidOptions", std::string("'") + key + "' must be a boolean"));
    }
    out = j.at(key).get<bool>();
    return {};
}

}  // namespace

Result<BuildOptions> load_build_options(const nlohmann::json& j)
{
    constexpr std::array<std::string_view, 1> kKeys = {"schema_dir"};
    if (auto known = check_known_keys(j, kKeys, "build options"); !known) {
        return std::unexpected(known.error());
    }

    BuildOptions options;
    if (j.contains("schema_dir")) {
        if (!j.at("schema_dir").is_string()) {
            return std::unexpected(
                Error::make("InvalidOptions", "'schema_dir' must be a string"));
        }
        options.schema_dir = j.at("schema_dir").get<std::string>();
    }
    return options;
}

Result<ValidatorOptions> load_validator_options(const nlohmann::json& j)
{
    constexpr std::array<std::string_view, 4> kKeys = {
        "strict_handles", "reject_unknown_fields", "bytes_as_base64_string", "max_depth"};
    if (auto known = check_known_keys(j, kKeys, "validator options"); !known) {
        return std::unexpected(known.error());
    }

    ValidatorOptions options;
    for (auto [key, field] : {
             std::pair{"strict_handles", &options.strict_handles},
             std::pair{"reject_unknown_fields", &options.reject_unknown_fields},
             std::pair{"bytes_as_base64_string", &options.bytes_as_base64_string},
         }) {
        if (auto result = read_bool(j, key, *field); !result) {
            return std::unexpected(result.error());
        }
    }
    if (j.contains("max_depth")) {
        const auto& depth = j.at("max_depth");
        if (!depth.is_number_unsigned() || depth.get<std::size_t>() == 0) {
            return std::unexpected(
                Error::make("InvalidOptions", "'max_depth' must be a positive integer"));
        }
        options.max_depth = depth.get<std::size_t>();
    }
    return options;
}

nlohmann::json to_json(const ValidatorOptions& options)
{
    return nlohmann::json{
        {        "strict_handles",         options.strict_handles},
        { "reject_unknown_fields",  options.reject_unknown_fields},
        {"bytes_as_base64_string", options.bytes_as_base64_string},
        {             "max_depth",              options.max_depth}
    };
}

}  // namespace atlex
