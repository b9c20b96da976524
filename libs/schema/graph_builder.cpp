/**
 * @file graph_builder.cpp
 * @brief Lexicon document compilation, reference resolution and cycle checks
 */

#include "atlex/graph_builder.hpp"

#include "atlex/identifiers.hpp"
#include "atlex/schema_validate.hpp"
#include "atlex/version.hpp"

#define LEATHERMAN_LOGGING_NAMESPACE "atlex.schema"
#include <leatherman/logging/logging.hpp>

#include <algorithm>
#include <filesystem>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>

namespace atlex::schema {

namespace {

using nlohmann::json;

[[nodiscard]] Error make_error(std::string_view code, std::string message)
{
    return Error::make(std::string(code), std::move(message));
}

[[nodiscard]] Error invalid_definition(const std::string& path, const std::string& message)
{
    return make_error(build_error::kInvalidDefinition, path + ": " + message);
}

/// Where a definition appears; restricts which kinds are allowed
enum class Position {
    kTopLevel,
    kProperty,
    kArrayItems,
    kRecordPayload,
    kParameters,
    kParamsProperty,
    kBodySchema
};

[[nodiscard]] bool kind_allowed(std::string_view type, Position position)
{
    static const std::set<std::string_view> kFieldKinds = {
        "null",  "boolean", "integer", "string", "bytes", "blob",
        "cid-link", "array", "object", "ref",    "union", "unknown",
    };
    static const std::set<std::string_view> kParamsPropertyKinds = {
        "boolean", "integer", "string", "unknown", "array",
    };

    switch (position) {
        case Position::kTopLevel:
            return kFieldKinds.contains(type) || type == "token" || type == "record"
                   || type == "query" || type == "procedure";
        case Position::kProperty:
        case Position::kArrayItems:
            return kFieldKinds.contains(type);
        case Position::kRecordPayload:
            return type == "object";
        case Position::kParameters:
            return type == "params";
        case Position::kParamsProperty:
            return kParamsPropertyKinds.contains(type);
        case Position::kBodySchema:
            return type == "object" || type == "ref" || type == "union";
    }
    return false;
}

/// Union members name objects (records and tokens included); `unknown` opens the union
[[nodiscard]] bool is_union_member_kind(const NodeKind& kind)
{
    return std::holds_alternative<ObjectNode>(kind) || std::holds_alternative<RecordNode>(kind)
           || std::holds_alternative<TokenNode>(kind) || std::holds_alternative<UnknownNode>(kind);
}

[[nodiscard]] bool is_definition_name(std::string_view name)
{
    return !name.empty()
           && std::ranges::all_of(name, [](char c) {
                  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
              })
           && !(name.front() >= '0' && name.front() <= '9');
}

/**
 * @brief Reads typed constraint fields of one definition
 *
 * Absent fields read as std::nullopt. The first wrongly typed field is kept
 * as the error and later reads are still safe to perform.
 */
class FieldReader
{
public:
    FieldReader(const json& def, const std::string& path)
        : m_def(def)
        , m_path(path)
    {}

    [[nodiscard]] std::optional<std::size_t> size(const char* key)
    {
        const json* value = find(key);
        if (value == nullptr) {
            return std::nullopt;
        }
        auto parsed = as_int64(*value);
        if (!parsed || *parsed < 0) {
            fail(std::string(key) + " must be a non-negative integer");
            return std::nullopt;
        }
        return static_cast<std::size_t>(*parsed);
    }

    [[nodiscard]] std::optional<std::int64_t> integer(const char* key)
    {
        const json* value = find(key);
        if (value == nullptr) {
            return std::nullopt;
        }
        auto parsed = as_int64(*value);
        if (!parsed) {
            fail(std::string(key) + " must be a 64-bit integer");
        }
        return parsed;
    }

    [[nodiscard]] std::optional<bool> boolean(const char* key)
    {
        const json* value = find(key);
        if (value == nullptr) {
            return std::nullopt;
        }
        if (!value->is_boolean()) {
            fail(std::string(key) + " must be a boolean");
            return std::nullopt;
        }
        return value->get<bool>();
    }

    [[nodiscard]] std::optional<std::string> string(const char* key)
    {
        const json* value = find(key);
        if (value == nullptr) {
            return std::nullopt;
        }
        if (!value->is_string()) {
            fail(std::string(key) + " must be a string");
            return std::nullopt;
        }
        return value->get<std::string>();
    }

    [[nodiscard]] std::optional<std::vector<std::string>> strings(const char* key)
    {
        const json* value = find(key);
        if (value == nullptr) {
            return std::nullopt;
        }
        if (!value->is_array()
            || !std::ranges::all_of(*value, [](const json& item) { return item.is_string(); })) {
            fail(std::string(key) + " must be an array of strings");
            return std::nullopt;
        }
        return value->get<std::vector<std::string>>();
    }

    [[nodiscard]] std::optional<std::vector<std::int64_t>> integers(const char* key)
    {
        const json* value = find(key);
        if (value == nullptr) {
            return std::nullopt;
        }
        if (!value->is_array()) {
            fail(std::string(key) + " must be an array of integers");
            return std::nullopt;
        }
        std::vector<std::int64_t> out;
        for (const auto& item : *value) {
            auto parsed = as_int64(item);
            if (!parsed) {
                fail(std::string(key) + " must be an array of integers");
                return std::nullopt;
            }
            out.push_back(*parsed);
        }
        return out;
    }

    /// @return nullptr if absent; records an error if present but not an object
    [[nodiscard]] const json* object(const char* key)
    {
        const json* value = find(key);
        if (value != nullptr && !value->is_object()) {
            fail(std::string(key) + " must be an object");
            return nullptr;
        }
        return value;
    }

    void fail(const std::string& message)
    {
        if (!m_error) {
            m_error = invalid_definition(m_path, message);
        }
    }

    template <typename T>
    void check_bounds(const std::optional<T>& min,
                      const std::optional<T>& max,
                      const char* min_key,
                      const char* max_key)
    {
        if (min && max && *min > *max) {
            fail(std::string(min_key) + " is greater than " + max_key);
        }
    }

    template <typename T>
    void check_const_in_enum(const std::optional<T>& const_value,
                             const std::optional<std::vector<T>>& enum_values)
    {
        if (const_value && enum_values
            && std::ranges::find(*enum_values, *const_value) == enum_values->end()) {
            fail("const is not one of the enum values");
        }
    }

    [[nodiscard]] const std::optional<Error>& error() const { return m_error; }

private:
    [[nodiscard]] const json* find(const char* key) const
    {
        auto it = m_def.find(key);
        return it == m_def.end() ? nullptr : &*it;
    }

    [[nodiscard]] static std::optional<std::int64_t> as_int64(const json& value)
    {
        if (value.is_number_unsigned()) {
            auto raw = value.get<std::uint64_t>();
            if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return std::nullopt;
            }
            return static_cast<std::int64_t>(raw);
        }
        if (value.is_number_integer()) {
            return value.get<std::int64_t>();
        }
        return std::nullopt;
    }

    const json& m_def;
    const std::string& m_path;
    std::optional<Error> m_error;
};

}  // namespace

namespace detail {

class GraphBuilder
{
public:
    GraphBuilder(DocumentResolver resolver, const FormatRegistry& registry)
        : m_registry(registry)
    {
        m_graph.m_resolver = std::move(resolver);
    }

    [[nodiscard]] Result<SchemaGraph> build(const std::vector<json>& documents,
                                            const BuildOptions& options)
    {
        if (auto loaded = load_documents(documents, options); !loaded) {
            return std::unexpected(loaded.error());
        }
        reserve_definitions();
        for (const auto& [document_id, defs] : m_documents) {
            LOG_DEBUG("compiling lexicon {1} ({2} definitions)", document_id, defs->size());
            for (const auto& [name, def] : defs->items()) {
                const NodeId id = *m_graph.find(document_id, name);
                if (auto parsed = parse_into(id, def, document_id, Position::kTopLevel); !parsed) {
                    return std::unexpected(parsed.error());
                }
            }
        }
        if (auto checked = check_local_targets(); !checked) {
            return std::unexpected(checked.error());
        }
        if (auto acyclic = check_cycles(); !acyclic) {
            return std::unexpected(acyclic.error());
        }
        return std::move(m_graph);
    }

private:
    struct Resolved
    {
        RefTarget target;
        bool unknown = false;  ///< External target is an `unknown` definition
    };

    struct PendingTarget
    {
        NodeId target;
        std::string path;
        std::optional<NodeId> union_node;
    };

    enum class Mark : std::uint8_t {
        kUnvisited,
        kActive,
        kDone
    };

    [[nodiscard]] VoidResult load_documents(const std::vector<json>& documents,
                                            const BuildOptions& options)
    {
        std::optional<common::ShapeChecker> shape_checker;
        if (!options.schema_dir.empty()) {
            auto checker = common::ShapeChecker::from_file(
                (std::filesystem::path(options.schema_dir) / kLexiconSchemaFile).string());
            if (!checker) {
                return std::unexpected(
                    make_error(build_error::kDocumentShapeInvalid, checker.error().describe()));
            }
            shape_checker.emplace(std::move(*checker));
        }

        for (const auto& document : documents) {
            if (!document.is_object()) {
                return std::unexpected(
                    make_error(build_error::kDocumentShapeInvalid, "lexicon document is not an object"));
            }
            if (shape_checker) {
                if (auto shape = shape_checker->check(document); !shape) {
                    return std::unexpected(make_error(build_error::kDocumentShapeInvalid,
                                                      shape.error().message));
                }
            }

            auto version = document.find("lexicon");
            if (version == document.end() || !version->is_number_integer()
                || version->get<std::int64_t>() != kLexiconVersion) {
                return std::unexpected(
                    make_error(build_error::kBadLexiconVersion,
                               "lexicon version must be " + std::to_string(kLexiconVersion)));
            }

            auto id_field = document.find("id");
            if (id_field == document.end() || !id_field->is_string()) {
                return std::unexpected(
                    make_error(build_error::kInvalidDocumentId, "lexicon id must be a string"));
            }
            auto nsid = identifiers::parse_nsid(id_field->get<std::string>());
            if (!nsid) {
                return std::unexpected(make_error(
                    build_error::kInvalidDocumentId,
                    "invalid lexicon id '" + id_field->get<std::string>() + "': " + nsid.error().message));
            }

            auto defs = document.find("defs");
            if (defs == document.end() || !defs->is_object()) {
                return std::unexpected(invalid_definition(nsid->to_string(), "defs must be an object"));
            }
            for (const auto& [name, def] : defs->items()) {
                if (!is_definition_name(name)) {
                    return std::unexpected(
                        invalid_definition(nsid->to_string(), "invalid definition name '" + name + "'"));
                }
            }

            auto [it, inserted] = m_documents.emplace(nsid->to_string(), &*defs);
            if (!inserted) {
                return std::unexpected(make_error(build_error::kDuplicateDefinition,
                                                  "lexicon " + it->first + " appears more than once"));
            }
        }
        return {};
    }

    /// Give every top-level definition its node id before any reference is resolved
    void reserve_definitions()
    {
        for (const auto& [document_id, defs] : m_documents) {
            for (const auto& [name, def] : defs->items()) {
                const NodeId id = add_node(document_id + "#" + name);
                m_graph.m_definitions.emplace(document_id + "#" + name, id);
            }
        }
    }

    [[nodiscard]] NodeId add_node(std::string path)
    {
        const auto id = static_cast<NodeId>(m_graph.m_nodes.size());
        m_graph.m_nodes.push_back(Node{.path = std::move(path), .description = {}, .kind = NullNode{}});
        return id;
    }

    [[nodiscard]] Result<NodeId> parse_inline(const json& def,
                                              std::string path,
                                              const std::string& document_id,
                                              Position position)
    {
        const NodeId id = add_node(std::move(path));
        if (auto parsed = parse_into(id, def, document_id, position); !parsed) {
            return std::unexpected(parsed.error());
        }
        return id;
    }

    /// Parse @p def into the already allocated node @p id
    [[nodiscard]] VoidResult parse_into(NodeId id,
                                        const json& def,
                                        const std::string& document_id,
                                        Position position)
    {
        // Copy: parsing may grow the node arena
        const std::string path = m_graph.m_nodes[id].path;
        if (!def.is_object()) {
            return std::unexpected(invalid_definition(path, "definition must be an object"));
        }
        auto type_field = def.find("type");
        if (type_field == def.end() || !type_field->is_string()) {
            return std::unexpected(invalid_definition(path, "definition has no type"));
        }
        const auto type = type_field->get<std::string>();
        if (!kind_allowed(type, position)) {
            return std::unexpected(
                invalid_definition(path, "type '" + type + "' is not allowed here"));
        }

        auto kind = parse_kind(id, type, def, path, document_id);
        if (!kind) {
            return std::unexpected(kind.error());
        }
        Node& node = m_graph.m_nodes[id];
        node.kind = std::move(*kind);
        if (auto description = def.find("description");
            description != def.end() && description->is_string()) {
            node.description = description->get<std::string>();
        }
        return {};
    }

    [[nodiscard]] Result<NodeKind> parse_kind(NodeId id,
                                              const std::string& type,
                                              const json& def,
                                              const std::string& path,
                                              const std::string& document_id)
    {
        FieldReader reader(def, path);
        NodeKind kind;

        if (type == "null") {
            kind = NullNode{};
        } else if (type == "boolean") {
            kind = BooleanNode{.default_value = reader.boolean("default"),
                               .const_value = reader.boolean("const")};
        } else if (type == "integer") {
            IntegerNode node{.minimum = reader.integer("minimum"),
                             .maximum = reader.integer("maximum"),
                             .enum_values = reader.integers("enum"),
                             .const_value = reader.integer("const"),
                             .default_value = reader.integer("default")};
            reader.check_bounds(node.minimum, node.maximum, "minimum", "maximum");
            reader.check_const_in_enum(node.const_value, node.enum_values);
            kind = std::move(node);
        } else if (type == "string") {
            auto node = parse_string(reader, path);
            if (!node) {
                return std::unexpected(node.error());
            }
            kind = std::move(*node);
        } else if (type == "bytes") {
            BytesNode node{.min_length = reader.size("minLength"),
                           .max_length = reader.size("maxLength")};
            reader.check_bounds(node.min_length, node.max_length, "minLength", "maxLength");
            kind = node;
        } else if (type == "blob") {
            BlobNode node;
            node.accept = reader.strings("accept").value_or(std::vector<std::string>{});
            if (auto max_size = reader.size("maxSize")) {
                node.max_size = static_cast<std::uint64_t>(*max_size);
            }
            kind = std::move(node);
        } else if (type == "cid-link") {
            kind = CidLinkNode{};
        } else if (type == "unknown") {
            kind = UnknownNode{};
        } else if (type == "token") {
            const auto name = path.substr(path.find('#') + 1);
            kind = TokenNode{.value = type_tag(document_id, name)};
        } else if (type == "array") {
            auto node = parse_array(reader, def, path, document_id);
            if (!node) {
                return std::unexpected(node.error());
            }
            kind = *node;
        } else if (type == "object") {
            auto node = parse_object(reader, path, document_id);
            if (!node) {
                return std::unexpected(node.error());
            }
            kind = std::move(*node);
        } else if (type == "params") {
            auto node = parse_params(reader, path, document_id);
            if (!node) {
                return std::unexpected(node.error());
            }
            kind = std::move(*node);
        } else if (type == "ref") {
            auto reference = reader.string("ref");
            if (reader.error()) {
                return std::unexpected(*reader.error());
            }
            if (!reference) {
                return std::unexpected(invalid_definition(path, "ref definition has no ref"));
            }
            auto resolved = resolve_target(*reference, document_id, path, std::nullopt);
            if (!resolved) {
                return std::unexpected(resolved.error());
            }
            kind = RefNode{.reference = *reference, .target = std::move(resolved->target)};
        } else if (type == "union") {
            auto node = parse_union(id, reader, path, document_id);
            if (!node) {
                return std::unexpected(node.error());
            }
            kind = std::move(*node);
        } else if (type == "record") {
            auto node = parse_record(reader, def, path, document_id);
            if (!node) {
                return std::unexpected(node.error());
            }
            kind = std::move(*node);
        } else if (type == "query" || type == "procedure") {
            auto node = parse_rpc(type, reader, def, path, document_id);
            if (!node) {
                return std::unexpected(node.error());
            }
            kind = std::move(*node);
        } else {
            return std::unexpected(invalid_definition(path, "unknown type '" + type + "'"));
        }

        if (reader.error()) {
            return std::unexpected(*reader.error());
        }
        return kind;
    }

    [[nodiscard]] Result<StringNode> parse_string(FieldReader& reader, const std::string& path)
    {
        StringNode node{.min_length = reader.size("minLength"),
                        .max_length = reader.size("maxLength"),
                        .min_graphemes = reader.size("minGraphemes"),
                        .max_graphemes = reader.size("maxGraphemes"),
                        .format = reader.string("format"),
                        .format_validator = {},
                        .enum_values = reader.strings("enum"),
                        .const_value = reader.string("const"),
                        .default_value = reader.string("default"),
                        .known_values = reader.strings("knownValues").value_or(std::vector<std::string>{})};
        reader.check_bounds(node.min_length, node.max_length, "minLength", "maxLength");
        reader.check_bounds(node.min_graphemes, node.max_graphemes, "minGraphemes", "maxGraphemes");
        reader.check_const_in_enum(node.const_value, node.enum_values);

        if (node.format) {
            const FormatValidator* validator = m_registry.find(*node.format);
            if (validator == nullptr) {
                return std::unexpected(make_error(build_error::kUnknownFormat,
                                                  path + ": unknown format '" + *node.format + "'"));
            }
            node.format_validator = *validator;
        }
        return node;
    }

    [[nodiscard]] Result<ArrayNode> parse_array(FieldReader& reader,
                                                const json& def,
                                                const std::string& path,
                                                const std::string& document_id)
    {
        ArrayNode node{.items = 0,
                       .min_length = reader.size("minLength"),
                       .max_length = reader.size("maxLength")};
        reader.check_bounds(node.min_length, node.max_length, "minLength", "maxLength");

        auto items = def.find("items");
        if (items == def.end()) {
            return std::unexpected(invalid_definition(path, "array definition has no items"));
        }
        auto item_id = parse_inline(*items, path + ".items", document_id, Position::kArrayItems);
        if (!item_id) {
            return std::unexpected(item_id.error());
        }
        node.items = *item_id;
        return node;
    }

    [[nodiscard]] Result<std::map<std::string, NodeId, std::less<>>>
    parse_properties(FieldReader& reader,
                     const std::string& path,
                     const std::string& document_id,
                     Position position)
    {
        std::map<std::string, NodeId, std::less<>> properties;
        const json* declared = reader.object("properties");
        if (declared == nullptr) {
            return properties;
        }
        for (const auto& [name, property] : declared->items()) {
            auto property_id =
                parse_inline(property, path + ".properties." + name, document_id, position);
            if (!property_id) {
                return std::unexpected(property_id.error());
            }
            properties.emplace(name, *property_id);
        }
        return properties;
    }

    [[nodiscard]] static VoidResult
    check_declared(const std::map<std::string, NodeId, std::less<>>& properties,
                   const std::vector<std::string>& names,
                   const char* field,
                   const std::string& path)
    {
        for (const auto& name : names) {
            if (!properties.contains(name)) {
                return std::unexpected(invalid_definition(
                    path, std::string(field) + " names undeclared property '" + name + "'"));
            }
        }
        return {};
    }

    [[nodiscard]] Result<ObjectNode> parse_object(FieldReader& reader,
                                                  const std::string& path,
                                                  const std::string& document_id)
    {
        ObjectNode node;
        auto properties = parse_properties(reader, path, document_id, Position::kProperty);
        if (!properties) {
            return std::unexpected(properties.error());
        }
        node.properties = std::move(*properties);

        const auto required = reader.strings("required").value_or(std::vector<std::string>{});
        const auto nullable = reader.strings("nullable").value_or(std::vector<std::string>{});
        node.closed = reader.boolean("closed").value_or(false);
        if (auto declared = check_declared(node.properties, required, "required", path); !declared) {
            return std::unexpected(declared.error());
        }
        if (auto declared = check_declared(node.properties, nullable, "nullable", path); !declared) {
            return std::unexpected(declared.error());
        }
        node.required.insert(required.begin(), required.end());
        node.nullable.insert(nullable.begin(), nullable.end());
        return node;
    }

    [[nodiscard]] Result<ParamsNode> parse_params(FieldReader& reader,
                                                  const std::string& path,
                                                  const std::string& document_id)
    {
        ParamsNode node;
        auto properties = parse_properties(reader, path, document_id, Position::kParamsProperty);
        if (!properties) {
            return std::unexpected(properties.error());
        }
        node.properties = std::move(*properties);

        const auto required = reader.strings("required").value_or(std::vector<std::string>{});
        if (auto declared = check_declared(node.properties, required, "required", path); !declared) {
            return std::unexpected(declared.error());
        }
        node.required.insert(required.begin(), required.end());
        return node;
    }

    [[nodiscard]] Result<UnionNode> parse_union(NodeId id,
                                                FieldReader& reader,
                                                const std::string& path,
                                                const std::string& document_id)
    {
        auto refs = reader.strings("refs");
        const auto closed = reader.boolean("closed");
        if (reader.error()) {
            return std::unexpected(*reader.error());
        }
        if (!refs) {
            return std::unexpected(invalid_definition(path, "union definition has no refs"));
        }

        UnionNode node;
        node.open = closed.has_value() && !*closed;
        for (const auto& reference : *refs) {
            auto resolved = resolve_target(reference, document_id, path, id);
            if (!resolved) {
                return std::unexpected(resolved.error());
            }
            auto split = split_reference(reference, document_id);
            std::string tag = type_tag(split->document_id, split->def_name);
            const bool duplicate = std::ranges::any_of(
                node.members, [&tag](const UnionMember& member) { return member.tag == tag; });
            if (duplicate) {
                return std::unexpected(
                    invalid_definition(path, "union lists '" + tag + "' more than once"));
            }
            node.open = node.open || resolved->unknown;
            node.members.push_back(UnionMember{.tag = std::move(tag), .target = std::move(resolved->target)});
        }
        return node;
    }

    [[nodiscard]] Result<RecordNode> parse_record(FieldReader& reader,
                                                  const json& def,
                                                  const std::string& path,
                                                  const std::string& document_id)
    {
        auto key = reader.string("key");
        if (reader.error()) {
            return std::unexpected(*reader.error());
        }
        if (!key) {
            return std::unexpected(invalid_definition(path, "record definition has no key"));
        }
        auto strategy = RecordKeyStrategy::parse(*key);
        if (!strategy) {
            return std::unexpected(invalid_definition(path, "unknown record key strategy '" + *key + "'"));
        }

        auto payload = def.find("record");
        if (payload == def.end()) {
            return std::unexpected(invalid_definition(path, "record definition has no record"));
        }
        auto payload_id = parse_inline(*payload, path + ".record", document_id, Position::kRecordPayload);
        if (!payload_id) {
            return std::unexpected(payload_id.error());
        }
        return RecordNode{.key = std::move(*strategy), .payload = *payload_id};
    }

    [[nodiscard]] Result<std::optional<Body>> parse_body(const json& def,
                                                         const char* field,
                                                         const std::string& path,
                                                         const std::string& document_id)
    {
        auto body = def.find(field);
        if (body == def.end()) {
            return std::optional<Body>{};
        }
        const std::string body_path = path + "." + field;
        if (!body->is_object()) {
            return std::unexpected(invalid_definition(body_path, "body must be an object"));
        }
        auto encoding = body->find("encoding");
        if (encoding == body->end() || !encoding->is_string()) {
            return std::unexpected(invalid_definition(body_path, "body has no encoding"));
        }

        Body out{.encoding = encoding->get<std::string>(), .schema = std::nullopt};
        if (auto schema = body->find("schema"); schema != body->end()) {
            auto schema_id = parse_inline(*schema, body_path + ".schema", document_id, Position::kBodySchema);
            if (!schema_id) {
                return std::unexpected(schema_id.error());
            }
            out.schema = *schema_id;
        }
        return std::optional<Body>{std::move(out)};
    }

    [[nodiscard]] Result<NodeKind> parse_rpc(const std::string& type,
                                             FieldReader& reader,
                                             const json& def,
                                             const std::string& path,
                                             const std::string& document_id)
    {
        std::optional<NodeId> parameters;
        if (const json* params = reader.object("parameters"); params != nullptr) {
            auto params_id = parse_inline(*params, path + ".parameters", document_id, Position::kParameters);
            if (!params_id) {
                return std::unexpected(params_id.error());
            }
            parameters = *params_id;
        }
        if (reader.error()) {
            return std::unexpected(*reader.error());
        }

        auto output = parse_body(def, "output", path, document_id);
        if (!output) {
            return std::unexpected(output.error());
        }
        if (type == "query") {
            if (def.contains("input")) {
                return std::unexpected(invalid_definition(path, "query definitions take no input"));
            }
            return QueryNode{.parameters = parameters, .output = std::move(*output)};
        }

        auto input = parse_body(def, "input", path, document_id);
        if (!input) {
            return std::unexpected(input.error());
        }
        return ProcedureNode{.parameters = parameters,
                             .input = std::move(*input),
                             .output = std::move(*output)};
    }

    /**
     * Resolve a ref or union member. Targets inside the document set become
     * node ids (checked once every node is parsed); others go to the resolver.
     */
    [[nodiscard]] Result<Resolved> resolve_target(const std::string& reference,
                                                  const std::string& document_id,
                                                  const std::string& path,
                                                  std::optional<NodeId> union_node)
    {
        auto split = split_reference(reference, document_id);
        if (!split) {
            return std::unexpected(
                invalid_definition(path, "malformed reference '" + reference + "'"));
        }

        if (m_documents.contains(split->document_id)) {
            auto target = m_graph.find(split->document_id, split->def_name);
            if (!target) {
                return std::unexpected(make_error(build_error::kUnresolvedRef,
                                                  path + ": reference '" + reference
                                                      + "' names no definition"));
            }
            m_pending.push_back(PendingTarget{.target = *target, .path = path, .union_node = union_node});
            return Resolved{.target = *target, .unknown = false};
        }

        std::optional<NodeRef> external;
        if (m_graph.m_resolver) {
            external = m_graph.m_resolver(split->document_id, split->def_name);
        }
        if (!external || external->graph == nullptr) {
            return std::unexpected(make_error(
                build_error::kUnresolvedRef,
                path + ": could not resolve '" + reference + "' in lexicon " + split->document_id));
        }
        const NodeKind& target_kind = external->node().kind;
        if (std::holds_alternative<QueryNode>(target_kind)
            || std::holds_alternative<ProcedureNode>(target_kind)) {
            return std::unexpected(
                invalid_definition(path, "reference '" + reference + "' names an RPC definition"));
        }
        if (union_node && !is_union_member_kind(target_kind)) {
            return std::unexpected(invalid_definition(
                path, "union member '" + reference + "' is a " + std::string(kind_name(target_kind))
                          + ", not an object, record or token"));
        }
        LOG_DEBUG("{1}: external reference {2} resolved", path, reference);
        return Resolved{.target = ExternalRef{split->document_id, split->def_name},
                        .unknown = std::holds_alternative<UnknownNode>(target_kind)};
    }

    [[nodiscard]] VoidResult check_local_targets()
    {
        for (const auto& pending : m_pending) {
            const NodeKind& target_kind = m_graph.m_nodes[pending.target].kind;
            if (std::holds_alternative<QueryNode>(target_kind)
                || std::holds_alternative<ProcedureNode>(target_kind)) {
                return std::unexpected(invalid_definition(
                    pending.path,
                    "reference to RPC definition " + m_graph.m_nodes[pending.target].path));
            }
            if (pending.union_node && !is_union_member_kind(target_kind)) {
                return std::unexpected(invalid_definition(
                    pending.path, "union member " + m_graph.m_nodes[pending.target].path + " is a "
                                      + std::string(kind_name(target_kind))
                                      + ", not an object, record or token"));
            }
            if (pending.union_node && std::holds_alternative<UnknownNode>(target_kind)) {
                std::get<UnionNode>(m_graph.m_nodes[*pending.union_node].kind).open = true;
            }
        }
        return {};
    }

    /// Edges a finite instance cannot avoid following
    [[nodiscard]] std::vector<NodeId> unmediated_edges(NodeId id) const
    {
        std::vector<NodeId> edges;
        const auto required_edges = [&edges](const auto& node) {
            for (const auto& name : node.required) {
                if constexpr (std::is_same_v<std::decay_t<decltype(node)>, ObjectNode>) {
                    if (node.nullable.contains(name)) {
                        continue;
                    }
                }
                edges.push_back(node.properties.find(name)->second);
            }
        };

        std::visit(
            [&](const auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, ObjectNode> || std::is_same_v<T, ParamsNode>) {
                    required_edges(node);
                } else if constexpr (std::is_same_v<T, RefNode>) {
                    if (const auto* target = std::get_if<NodeId>(&node.target)) {
                        edges.push_back(*target);
                    }
                } else if constexpr (std::is_same_v<T, UnionNode>) {
                    if (node.members.size() == 1 && !node.open) {
                        if (const auto* target = std::get_if<NodeId>(&node.members.front().target)) {
                            edges.push_back(*target);
                        }
                    }
                } else if constexpr (std::is_same_v<T, RecordNode>) {
                    edges.push_back(node.payload);
                }
            },
            m_graph.m_nodes[id].kind);
        return edges;
    }

    [[nodiscard]] VoidResult visit(NodeId id, std::vector<Mark>& marks, std::vector<NodeId>& stack) const
    {
        if (marks[id] == Mark::kDone) {
            return {};
        }
        if (marks[id] == Mark::kActive) {
            auto start = std::ranges::find(stack, id);
            std::string cycle;
            for (auto it = start; it != stack.end(); ++it) {
                cycle += m_graph.m_nodes[*it].path + " -> ";
            }
            cycle += m_graph.m_nodes[id].path;
            return std::unexpected(
                make_error(build_error::kUnconditionalCycle, "unconditional reference cycle: " + cycle));
        }

        marks[id] = Mark::kActive;
        stack.push_back(id);
        for (NodeId next : unmediated_edges(id)) {
            if (auto result = visit(next, marks, stack); !result) {
                return result;
            }
        }
        stack.pop_back();
        marks[id] = Mark::kDone;
        return {};
    }

    [[nodiscard]] VoidResult check_cycles() const
    {
        std::vector<Mark> marks(m_graph.m_nodes.size(), Mark::kUnvisited);
        std::vector<NodeId> stack;
        for (const auto& [key, id] : m_graph.m_definitions) {
            if (auto result = visit(id, marks, stack); !result) {
                return result;
            }
        }
        return {};
    }

    const FormatRegistry& m_registry;
    SchemaGraph m_graph;
    std::map<std::string, const json*, std::less<>> m_documents;  ///< id -> defs
    std::vector<PendingTarget> m_pending;
};

}  // namespace detail

Result<json> parse_document(std::string_view text)
{
    // Track the top-level key being parsed so repeated names inside `defs` are caught
    std::string top_level_key;
    std::set<std::string> def_names;
    std::optional<std::string> duplicate;
    const json::parser_callback_t callback =
        [&](int depth, json::parse_event_t event, json& parsed) {
            if (event == json::parse_event_t::key) {
                if (depth == 1) {
                    top_level_key = parsed.get<std::string>();
                } else if (depth == 2 && top_level_key == "defs") {
                    auto name = parsed.get<std::string>();
                    if (!def_names.insert(name).second && !duplicate) {
                        duplicate = std::move(name);
                    }
                }
            } else if (event == json::parse_event_t::object_start && depth == 1
                       && top_level_key == "defs") {
                def_names.clear();
            }
            return true;
        };

    json document;
    try {
        document = json::parse(text.begin(), text.end(), callback);
    } catch (const json::exception& ex) {
        return std::unexpected(make_error(build_error::kParseError, ex.what()));
    }
    if (duplicate) {
        return std::unexpected(make_error(build_error::kDuplicateDefinition,
                                          "definition '" + *duplicate + "' is declared twice"));
    }
    return document;
}

Result<SchemaGraph> build_graph(const std::vector<json>& documents,
                                DocumentResolver resolver,
                                const BuildOptions& options,
                                const FormatRegistry& registry)
{
    detail::GraphBuilder builder(std::move(resolver), registry);
    auto graph = builder.build(documents, options);
    if (!graph) {
        LOG_WARNING("lexicon set rejected: {1}", graph.error().describe());
        return graph;
    }
    LOG_DEBUG("schema graph built: {1} nodes, {2} definitions",
              graph->size(),
              graph->definitions().size());
    return graph;
}

}  // namespace atlex::schema
