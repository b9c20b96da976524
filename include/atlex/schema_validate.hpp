#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON-Schema shape checks for lexicon documents (valijson)
 *
 * build_graph compiles schemas/lexicon.v1.schema.json once per call and checks
 * every input document against it before any definition is compiled.
 */

#include "atlex/common.hpp"

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace valijson {
class Schema;
}  // namespace valijson

namespace atlex::common {

/**
 * @brief A compiled JSON Schema
 *
 * `$defs` references are rewritten to draft-7 `definitions` before compiling.
 * Failure messages list one "<location>: <reason>" line per problem, the
 * location in valijson's "<root>[field][index]" notation.
 */
class ShapeChecker
{
public:
    /// Error codes: SchemaFileOpenFailed, SchemaParseFailed, SchemaBuildFailed
    [[nodiscard]] static Result<ShapeChecker> from_file(const std::string& schema_path);
    [[nodiscard]] static Result<ShapeChecker> from_schema(const nlohmann::json& schema);

    ShapeChecker(ShapeChecker&&) noexcept;
    ShapeChecker& operator=(ShapeChecker&&) noexcept;
    ~ShapeChecker();

    /// @return SchemaValidationFailed listing every problem found
    [[nodiscard]] VoidResult check(const nlohmann::json& document) const;

private:
    explicit ShapeChecker(std::unique_ptr<valijson::Schema> schema);

    std::unique_ptr<valijson::Schema> m_schema;
};

/// One-shot check against a schema file
[[nodiscard]] VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path);

/// One-shot check against an in-memory schema
[[nodiscard]] VoidResult validate_json_with_schema(const nlohmann::json& j,
                                                  const nlohmann::json& schema);

}  // namespace atlex::common
