#pragma once

/**
 * @file schema.hpp
 * @brief Compiled lexicon definitions (schema graph)
 *
 * A SchemaGraph stores every node in a flat arena. Top-level definitions and
 * their inline sub-definitions (properties, items, bodies) are addressed by
 * NodeId. The graph is immutable once build_graph returns it.
 */

#include "atlex/format_registry.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace atlex::schema {

using NodeId = std::uint32_t;

/// Reference into a document outside the graph, re-resolved on use
struct ExternalRef
{
    std::string document_id;
    std::string def_name;

    bool operator==(const ExternalRef&) const = default;
};

using RefTarget = std::variant<NodeId, ExternalRef>;

struct RecordKeyStrategy
{
    enum class Kind {
        kTid,
        kAny,
        kNsid,
        kLiteral
    };

    Kind kind = Kind::kTid;
    std::string literal;  ///< Only for kLiteral

    /// Parse "tid", "any", "nsid" or "literal:<value>"
    [[nodiscard]] static std::optional<RecordKeyStrategy> parse(std::string_view text);
    [[nodiscard]] std::string to_string() const;

    bool operator==(const RecordKeyStrategy&) const = default;
};

// ============================================================================
// Node kinds
// ============================================================================

struct NullNode
{};

struct BooleanNode
{
    std::optional<bool> default_value;
    std::optional<bool> const_value;
};

struct IntegerNode
{
    std::optional<std::int64_t> minimum;
    std::optional<std::int64_t> maximum;
    std::optional<std::vector<std::int64_t>> enum_values;
    std::optional<std::int64_t> const_value;
    std::optional<std::int64_t> default_value;
};

struct StringNode
{
    std::optional<std::size_t> min_length;  ///< UTF-8 bytes
    std::optional<std::size_t> max_length;
    std::optional<std::size_t> min_graphemes;
    std::optional<std::size_t> max_graphemes;
    std::optional<std::string> format;
    FormatValidator format_validator;  ///< Set iff format is set
    std::optional<std::vector<std::string>> enum_values;
    std::optional<std::string> const_value;
    std::optional<std::string> default_value;
    std::vector<std::string> known_values;  ///< Informational only
};

struct BytesNode
{
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
};

struct BlobNode
{
    std::vector<std::string> accept;  ///< MIME patterns; empty accepts everything
    std::optional<std::uint64_t> max_size;
};

struct CidLinkNode
{};

struct ArrayNode
{
    NodeId items = 0;
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
};

struct ObjectNode
{
    std::map<std::string, NodeId, std::less<>> properties;
    std::set<std::string, std::less<>> required;
    std::set<std::string, std::less<>> nullable;
    bool closed = false;
};

struct ParamsNode
{
    std::map<std::string, NodeId, std::less<>> properties;
    std::set<std::string, std::less<>> required;
};

struct RefNode
{
    std::string reference;  ///< As written in the document
    RefTarget target;
};

struct UnionMember
{
    std::string tag;  ///< Canonical type tag: "nsid" for main, "nsid#name" otherwise
    RefTarget target;
};

struct UnionNode
{
    std::vector<UnionMember> members;
    bool open = false;  ///< Unlisted or missing tags pass through
};

struct UnknownNode
{};

struct TokenNode
{
    std::string value;  ///< "nsid#name"
};

struct RecordNode
{
    RecordKeyStrategy key;
    NodeId payload = 0;
};

struct Body
{
    std::string encoding;
    std::optional<NodeId> schema;
};

struct QueryNode
{
    std::optional<NodeId> parameters;
    std::optional<Body> output;
};

struct ProcedureNode
{
    std::optional<NodeId> parameters;
    std::optional<Body> input;
    std::optional<Body> output;
};

using NodeKind = std::variant<NullNode,
                              BooleanNode,
                              IntegerNode,
                              StringNode,
                              BytesNode,
                              BlobNode,
                              CidLinkNode,
                              ArrayNode,
                              ObjectNode,
                              ParamsNode,
                              RefNode,
                              UnionNode,
                              UnknownNode,
                              TokenNode,
                              RecordNode,
                              QueryNode,
                              ProcedureNode>;

struct Node
{
    std::string path;  ///< e.g. "dev.atprose.test.post#main.record.properties.body"
    std::string description;
    NodeKind kind;
};

/// Lexicon type name of a node ("object", "cid-link", ...)
[[nodiscard]] std::string_view kind_name(const NodeKind& kind) noexcept;

class SchemaGraph;

/// A node handle together with the graph that owns it
struct NodeRef
{
    const SchemaGraph* graph = nullptr;
    NodeId id = 0;

    [[nodiscard]] const Node& node() const;
};

/**
 * Resolves a definition of a document outside the build set.
 * @param document_id Canonical NSID of the document
 * @param def_name Definition name ("main" when the reference has no fragment)
 */
using DocumentResolver =
    std::function<std::optional<NodeRef>(std::string_view document_id, std::string_view def_name)>;

/**
 * Split a reference ("nsid#name", "#name" or "nsid") into document id and
 * definition name; @p base_document fills in a bare "#name".
 * @return std::nullopt if the NSID part is invalid or the name is empty
 */
[[nodiscard]] std::optional<ExternalRef> split_reference(std::string_view reference,
                                                         std::string_view base_document = {});

/// Canonical type tag of a definition: "nsid" for main, "nsid#name" otherwise
[[nodiscard]] std::string type_tag(std::string_view document_id, std::string_view def_name);

namespace detail {
class GraphBuilder;
}  // namespace detail

class SchemaGraph
{
public:
    SchemaGraph(const SchemaGraph&) = delete;
    SchemaGraph& operator=(const SchemaGraph&) = delete;
    SchemaGraph(SchemaGraph&&) noexcept = default;
    SchemaGraph& operator=(SchemaGraph&&) noexcept = default;
    ~SchemaGraph() = default;

    [[nodiscard]] const Node& node(NodeId id) const { return m_nodes.at(id); }
    [[nodiscard]] std::size_t size() const noexcept { return m_nodes.size(); }

    /// Top-level definition of a document in this graph
    [[nodiscard]] std::optional<NodeId> find(std::string_view document_id,
                                             std::string_view def_name) const;

    /// Top-level definition by reference string ("nsid", "nsid#name")
    [[nodiscard]] std::optional<NodeId> find(std::string_view reference) const;

    /// Document ids compiled into this graph, sorted
    [[nodiscard]] std::vector<std::string> documents() const;

    /// Keys "nsid#name" of every top-level definition, sorted
    [[nodiscard]] std::vector<std::string> definitions() const;

    /// Local targets resolve to this graph; external ones go through the resolver
    [[nodiscard]] std::optional<NodeRef> resolve(const RefTarget& target) const;

private:
    friend class detail::GraphBuilder;

    SchemaGraph() = default;

    std::vector<Node> m_nodes;
    std::map<std::string, NodeId, std::less<>> m_definitions;  ///< "nsid#name" -> node
    DocumentResolver m_resolver;
};

inline const Node& NodeRef::node() const
{
    return graph->node(id);
}

}  // namespace atlex::schema
