#pragma once

/**
 * @file version.hpp
 * @brief Library and lexicon language versions
 */

namespace atlex {

constexpr const char* kVersion = "0.1.0";

/// Value of the `lexicon` field in every document build_graph accepts
constexpr int kLexiconVersion = 1;

/// Meta-schema for lexicon documents, looked up in BuildOptions::schema_dir
constexpr const char* kLexiconSchemaFile = "lexicon.v1.schema.json";

}  // namespace atlex
