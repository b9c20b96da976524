/**
 * @file schema.cpp
 * @brief SchemaGraph lookups and reference helpers
 */

#include "atlex/schema.hpp"

#include "atlex/identifiers.hpp"

#include <type_traits>

namespace atlex::schema {

namespace {

constexpr std::string_view kMainDefinition = "main";
constexpr std::string_view kLiteralKeyPrefix = "literal:";

[[nodiscard]] std::string definition_key(std::string_view document_id, std::string_view def_name)
{
    std::string key(document_id);
    key += '#';
    key += def_name;
    return key;
}

}  // namespace

std::optional<RecordKeyStrategy> RecordKeyStrategy::parse(std::string_view text)
{
    if (text == "tid") {
        return RecordKeyStrategy{.kind = Kind::kTid};
    }
    if (text == "any") {
        return RecordKeyStrategy{.kind = Kind::kAny};
    }
    if (text == "nsid") {
        return RecordKeyStrategy{.kind = Kind::kNsid};
    }
    if (text.starts_with(kLiteralKeyPrefix) && text.size() > kLiteralKeyPrefix.size()) {
        return RecordKeyStrategy{.kind = Kind::kLiteral,
                                 .literal = std::string(text.substr(kLiteralKeyPrefix.size()))};
    }
    return std::nullopt;
}

std::string RecordKeyStrategy::to_string() const
{
    switch (kind) {
        case Kind::kTid:
            return "tid";
        case Kind::kAny:
            return "any";
        case Kind::kNsid:
            return "nsid";
        case Kind::kLiteral:
            return std::string(kLiteralKeyPrefix) + literal;
    }
    return {};
}

std::string_view kind_name(const NodeKind& kind) noexcept
{
    return std::visit(
        [](const auto& node) -> std::string_view {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, NullNode>) {
                return "null";
            } else if constexpr (std::is_same_v<T, BooleanNode>) {
                return "boolean";
            } else if constexpr (std::is_same_v<T, IntegerNode>) {
                return "integer";
            } else if constexpr (std::is_same_v<T, StringNode>) {
                return "string";
            } else if constexpr (std::is_same_v<T, BytesNode>) {
                return "bytes";
            } else if constexpr (std::is_same_v<T, BlobNode>) {
                return "blob";
            } else if constexpr (std::is_same_v<T, CidLinkNode>) {
                return "cid-link";
            } else if constexpr (std::is_same_v<T, ArrayNode>) {
                return "array";
            } else if constexpr (std::is_same_v<T, ObjectNode>) {
                return "object";
            } else if constexpr (std::is_same_v<T, ParamsNode>) {
                return "params";
            } else if constexpr (std::is_same_v<T, RefNode>) {
                return "ref";
            } else if constexpr (std::is_same_v<T, UnionNode>) {
                return "union";
            } else if constexpr (std::is_same_v<T, UnknownNode>) {
                return "unknown";
            } else if constexpr (std::is_same_v<T, TokenNode>) {
                return "token";
            } else if constexpr (std::is_same_v<T, RecordNode>) {
                return "record";
            } else if constexpr (std::is_same_v<T, QueryNode>) {
                return "query";
            } else {
                static_assert(std::is_same_v<T, ProcedureNode>);
                return "procedure";
            }
        },
        kind);
}

std::optional<ExternalRef> split_reference(std::string_view reference,
                                           std::string_view base_document)
{
    std::string_view document = reference;
    std::string_view name = kMainDefinition;
    if (auto hash = reference.find('#'); hash != std::string_view::npos) {
        document = reference.substr(0, hash);
        name = reference.substr(hash + 1);
    }
    if (name.empty()) {
        return std::nullopt;
    }
    if (document.empty()) {
        if (base_document.empty()) {
            return std::nullopt;
        }
        document = base_document;
    }
    auto nsid = identifiers::parse_nsid(document);
    if (!nsid) {
        return std::nullopt;
    }
    return ExternalRef{.document_id = nsid->to_string(), .def_name = std::string(name)};
}

std::string type_tag(std::string_view document_id, std::string_view def_name)
{
    if (def_name == kMainDefinition) {
        return std::string(document_id);
    }
    return definition_key(document_id, def_name);
}

std::optional<NodeId> SchemaGraph::find(std::string_view document_id,
                                        std::string_view def_name) const
{
    auto it = m_definitions.find(definition_key(document_id, def_name));
    if (it == m_definitions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<NodeId> SchemaGraph::find(std::string_view reference) const
{
    auto ref = split_reference(reference);
    if (!ref) {
        return std::nullopt;
    }
    return find(ref->document_id, ref->def_name);
}

std::vector<std::string> SchemaGraph::documents() const
{
    std::vector<std::string> out;
    for (const auto& [key, id] : m_definitions) {
        std::string document = key.substr(0, key.find('#'));
        if (out.empty() || out.back() != document) {
            out.push_back(std::move(document));
        }
    }
    return out;
}

std::vector<std::string> SchemaGraph::definitions() const
{
    std::vector<std::string> out;
    out.reserve(m_definitions.size());
    for (const auto& [key, id] : m_definitions) {
        out.push_back(key);
    }
    return out;
}

std::optional<NodeRef> SchemaGraph::resolve(const RefTarget& target) const
{
    if (const auto* local = std::get_if<NodeId>(&target)) {
        return NodeRef{.graph = this, .id = *local};
    }
    const auto& external = std::get<ExternalRef>(target);
    if (auto local = find(external.document_id, external.def_name)) {
        return NodeRef{.graph = this, .id = *local};
    }
    if (!m_resolver) {
        return std::nullopt;
    }
    return m_resolver(external.document_id, external.def_name);
}

}  // namespace atlex::schema
