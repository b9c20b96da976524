#pragma once

/**
 * @file graph_builder.hpp
 * @brief Compiles lexicon documents into a cycle-checked SchemaGraph
 */

#include "atlex/common.hpp"
#include "atlex/format_registry.hpp"
#include "atlex/options.hpp"
#include "atlex/schema.hpp"

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace atlex::schema {

/// Error codes reported by parse_document and build_graph
namespace build_error {
inline constexpr std::string_view kBadLexiconVersion = "BadLexiconVersion";
inline constexpr std::string_view kInvalidDocumentId = "InvalidDocumentId";
inline constexpr std::string_view kDuplicateDefinition = "DuplicateDefinition";
inline constexpr std::string_view kInvalidDefinition = "InvalidDefinition";
inline constexpr std::string_view kUnknownFormat = "UnknownFormat";
inline constexpr std::string_view kUnresolvedRef = "UnresolvedRef";
inline constexpr std::string_view kUnconditionalCycle = "UnconditionalCycle";
inline constexpr std::string_view kDocumentShapeInvalid = "DocumentShapeInvalid";
inline constexpr std::string_view kParseError = "ParseError";
}  // namespace build_error

/**
 * Parse lexicon document text.
 * Repeated names inside `defs` are reported as DuplicateDefinition instead of
 * silently keeping the last one.
 */
[[nodiscard]] Result<nlohmann::json> parse_document(std::string_view text);

/**
 * Compile a set of lexicon documents.
 *
 * References between documents of the set resolve directly; references to
 * any other document go through @p resolver. The result does not depend on
 * the order of @p documents.
 *
 * @param registry Format validators available to `string` definitions
 */
[[nodiscard]] Result<SchemaGraph> build_graph(const std::vector<nlohmann::json>& documents,
                                              DocumentResolver resolver = {},
                                              const BuildOptions& options = {},
                                              const FormatRegistry& registry =
                                                  FormatRegistry::standard());

}  // namespace atlex::schema
