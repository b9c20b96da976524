/**
 * @file schema_validate.cpp
 * @brief Compiled JSON-Schema checks on top of valijson
 */

#include "atlex/schema_validate.hpp"

#include <exception>
#include <fstream>
#include <string_view>
#include <utility>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace atlex::common {

namespace {

constexpr std::string_view kDefsRefPrefix = "#/$defs/";

/// Rewrite 2019-09 `$defs` into the draft-7 `definitions` valijson reads
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& item : schema) {
            rewrite_defs(item);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }

    if (auto defs = schema.find("$defs"); defs != schema.end() && !schema.contains("definitions")) {
        schema["definitions"] = *defs;
    }
    for (auto& [key, value] : schema.items()) {
        if (key != "$ref") {
            rewrite_defs(value);
            continue;
        }
        if (value.is_string()) {
            const auto& ref = value.get_ref<const std::string&>();
            if (ref.starts_with(kDefsRefPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsRefPrefix.size());
            }
        }
    }
}

[[nodiscard]] std::string describe_failures(valijson::ValidationResults& results)
{
    std::vector<std::string> lines;
    valijson::ValidationResults::Error failure;
    while (results.popError(failure)) {
        std::string where;
        for (const auto& part : failure.context) {
            where += part;
        }
        lines.push_back((where.empty() ? std::string("<root>") : where) + ": " + failure.description);
    }

    std::string out;
    for (const auto& line : lines) {
        if (!out.empty()) {
            out += '\n';
        }
        out += line;
    }
    return out.empty() ? std::string("document does not match the schema") : out;
}

}  // namespace

ShapeChecker::ShapeChecker(std::unique_ptr<valijson::Schema> schema)
    : m_schema(std::move(schema))
{}

ShapeChecker::ShapeChecker(ShapeChecker&&) noexcept = default;
ShapeChecker& ShapeChecker::operator=(ShapeChecker&&) noexcept = default;
ShapeChecker::~ShapeChecker() = default;

Result<ShapeChecker> ShapeChecker::from_schema(const nlohmann::json& schema)
{
    nlohmann::json rewritten = schema;
    rewrite_defs(rewritten);

    auto compiled = std::make_unique<valijson::Schema>();
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter adapter(rewritten);
        parser.populateSchema(adapter, *compiled);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("cannot compile schema: ") + ex.what()));
    }
    return ShapeChecker(std::move(compiled));
}

Result<ShapeChecker> ShapeChecker::from_file(const std::string& schema_path)
{
    std::ifstream in(schema_path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "cannot open schema file " + schema_path));
    }
    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("SchemaParseFailed", schema_path + " is not valid JSON: " + ex.what()));
    }
    return from_schema(schema);
}

VoidResult ShapeChecker::check(const nlohmann::json& document) const
{
    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(document);
    if (validator.validate(*m_schema, target, &results)) {
        return {};
    }
    return std::unexpected(Error::make("SchemaValidationFailed", describe_failures(results)));
}

VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto checker = ShapeChecker::from_file(schema_path);
    if (!checker) {
        return std::unexpected(checker.error());
    }
    return checker->check(j);
}

VoidResult validate_json_with_schema(const nlohmann::json& j, const nlohmann::json& schema)
{
    auto checker = ShapeChecker::from_schema(schema);
    if (!checker) {
        return std::unexpected(checker.error());
    }
    return checker->check(j);
}

}  // namespace atlex::common
