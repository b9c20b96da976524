/**
 * @file value_validator.cpp
 * @brief Recursive instance validation over a SchemaGraph
 */

#include "atlex/value_validator.hpp"

#include "atlex/cid.hpp"
#include "atlex/encoding.hpp"
#include "atlex/unicode.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>

namespace atlex::validation {

namespace {

using nlohmann::json;
using schema::NodeRef;

constexpr const char* kTypeField = "$type";
constexpr std::string_view kMainSuffix = "#main";

// Ref and union hops that stay on the same value; a longer chain can only be a loop
constexpr std::size_t kMaxReferenceHops = 64;

[[nodiscard]] std::optional<std::int64_t> as_integer(const json& value)
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
    if (value.is_number_float()) {
        // Integral floats such as 2.0 are accepted
        const double raw = value.get<double>();
        constexpr double kLimit = 9223372036854775808.0;  // 2^63
        if (std::isfinite(raw) && std::trunc(raw) == raw && raw >= -kLimit && raw < kLimit) {
            return static_cast<std::int64_t>(raw);
        }
    }
    return std::nullopt;
}

[[nodiscard]] bool mime_accepted(std::string_view mime, const std::vector<std::string>& accept)
{
    if (accept.empty()) {
        return true;
    }
    return std::ranges::any_of(accept, [mime](std::string_view pattern) {
        if (pattern == "*/*" || pattern == "*") {
            return true;
        }
        if (pattern.ends_with("/*")) {
            return mime.starts_with(pattern.substr(0, pattern.size() - 1));
        }
        return mime == pattern;
    });
}

/// Union tag with a trailing "#main" removed
[[nodiscard]] std::string_view canonical_tag(std::string_view tag)
{
    if (tag.ends_with(kMainSuffix)) {
        tag.remove_suffix(kMainSuffix.size());
    }
    return tag;
}

class Validator
{
public:
    explicit Validator(const ValidatorOptions& options)
        : m_options(options)
        , m_format_options{.strict_handles = options.strict_handles}
    {}

    [[nodiscard]] json check(NodeRef ref,
                             const json& value,
                             std::size_t depth,
                             std::size_t hops = 0)
    {
        return std::visit(
            [&](const auto& node) -> json {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, schema::NullNode>) {
                    if (!value.is_null()) {
                        unexpected_type("null", value);
                    }
                    return value;
                } else if constexpr (std::is_same_v<T, schema::BooleanNode>) {
                    return check_boolean(node, value);
                } else if constexpr (std::is_same_v<T, schema::IntegerNode>) {
                    return check_integer(node, value);
                } else if constexpr (std::is_same_v<T, schema::StringNode>) {
                    return check_string(node, value);
                } else if constexpr (std::is_same_v<T, schema::BytesNode>) {
                    return check_bytes(node, value);
                } else if constexpr (std::is_same_v<T, schema::BlobNode>) {
                    return check_blob(node, value);
                } else if constexpr (std::is_same_v<T, schema::CidLinkNode>) {
                    return check_cid_link(value);
                } else if constexpr (std::is_same_v<T, schema::ArrayNode>) {
                    return check_array(ref, node, value, depth);
                } else if constexpr (std::is_same_v<T, schema::ObjectNode>) {
                    return check_properties(ref, node.properties, node.required, &node.nullable,
                                            node.closed || m_options.reject_unknown_fields, value,
                                            depth);
                } else if constexpr (std::is_same_v<T, schema::ParamsNode>) {
                    return check_properties(ref, node.properties, node.required, nullptr,
                                            m_options.reject_unknown_fields, value, depth);
                } else if constexpr (std::is_same_v<T, schema::RefNode>) {
                    if (!follow_reference(hops)) {
                        return value;
                    }
                    auto target = ref.graph->resolve(node.target);
                    if (!target) {
                        report(ViolationKind::kUnresolvedReference,
                               "cannot resolve reference '" + node.reference + "'");
                        return value;
                    }
                    return check(*target, value, depth, hops + 1);
                } else if constexpr (std::is_same_v<T, schema::UnionNode>) {
                    return check_union(ref, node, value, depth, hops);
                } else if constexpr (std::is_same_v<T, schema::UnknownNode>) {
                    return value;
                } else if constexpr (std::is_same_v<T, schema::TokenNode>) {
                    if (!value.is_string()) {
                        unexpected_type("string", value);
                    } else if (value.get<std::string>() != node.value) {
                        report(ViolationKind::kConstMismatch, "expected token '" + node.value + "'");
                    }
                    return value;
                } else if constexpr (std::is_same_v<T, schema::RecordNode>) {
                    if (!follow_reference(hops)) {
                        return value;
                    }
                    const NodeRef payload{.graph = ref.graph, .id = node.payload};
                    return check(payload, value, depth, hops + 1);
                } else {
                    static_assert(std::is_same_v<T, schema::QueryNode>
                                  || std::is_same_v<T, schema::ProcedureNode>);
                    report(ViolationKind::kUnexpectedType,
                           ref.node().path + " is an RPC definition, not a value schema");
                    return value;
                }
            },
            ref.node().kind);
    }

    [[nodiscard]] Violations take_violations() { return std::move(m_violations); }

private:
    /// Appends a segment to the current path for the lifetime of the guard
    class PathGuard
    {
    public:
        PathGuard(Path& path, PathSegment segment)
            : m_path(path)
        {
            m_path.push_back(std::move(segment));
        }
        ~PathGuard() { m_path.pop_back(); }

        PathGuard(const PathGuard&) = delete;
        PathGuard& operator=(const PathGuard&) = delete;

    private:
        Path& m_path;
    };

    void report(ViolationKind kind,
                std::string detail,
                std::optional<identifiers::FormatErrorKind> format_error = std::nullopt)
    {
        m_violations.push_back(Violation{.path = m_path,
                                         .kind = kind,
                                         .detail = std::move(detail),
                                         .format_error = format_error});
    }

    void unexpected_type(std::string_view expected, const json& value)
    {
        report(ViolationKind::kUnexpectedType,
               "expected " + std::string(expected) + ", got " + value.type_name());
    }

    [[nodiscard]] bool enter_container(std::size_t depth)
    {
        if (depth >= m_options.max_depth) {
            report(ViolationKind::kNestingTooDeep,
                   "nesting exceeds " + std::to_string(m_options.max_depth) + " levels");
            return false;
        }
        return true;
    }

    [[nodiscard]] bool follow_reference(std::size_t hops)
    {
        if (hops >= kMaxReferenceHops) {
            report(ViolationKind::kNestingTooDeep,
                   "reference chain exceeds " + std::to_string(kMaxReferenceHops) + " hops");
            return false;
        }
        return true;
    }

    [[nodiscard]] json check_boolean(const schema::BooleanNode& node, const json& value)
    {
        if (!value.is_boolean()) {
            unexpected_type("boolean", value);
            return value;
        }
        if (node.const_value && value.get<bool>() != *node.const_value) {
            report(ViolationKind::kConstMismatch,
                   std::string("expected constant ") + (*node.const_value ? "true" : "false"));
        }
        return value;
    }

    [[nodiscard]] json check_integer(const schema::IntegerNode& node, const json& value)
    {
        auto integer = as_integer(value);
        if (!integer) {
            if (value.is_number()) {
                report(ViolationKind::kUnexpectedType,
                       "expected integer, got non-integral or out-of-range number");
            } else {
                unexpected_type("integer", value);
            }
            return value;
        }
        if (node.const_value && *integer != *node.const_value) {
            report(ViolationKind::kConstMismatch,
                   "expected constant " + std::to_string(*node.const_value));
        }
        if (node.enum_values
            && std::ranges::find(*node.enum_values, *integer) == node.enum_values->end()) {
            report(ViolationKind::kEnumMismatch,
                   std::to_string(*integer) + " is not one of the allowed values");
        }
        if ((node.minimum && *integer < *node.minimum)
            || (node.maximum && *integer > *node.maximum)) {
            std::string bounds = "[" + (node.minimum ? std::to_string(*node.minimum) : "")
                                 + ", " + (node.maximum ? std::to_string(*node.maximum) : "") + "]";
            report(ViolationKind::kOutOfRange,
                   std::to_string(*integer) + " is outside " + bounds);
        }
        return *integer;
    }

    [[nodiscard]] json check_string(const schema::StringNode& node, const json& value)
    {
        if (!value.is_string()) {
            unexpected_type("string", value);
            return value;
        }
        const auto& text = value.get_ref<const std::string&>();
        if (!unicode::is_valid_utf8(text)) {
            report(ViolationKind::kUnexpectedType, "string is not valid UTF-8");
            return value;
        }

        if (node.max_length && text.size() > *node.max_length) {
            report(ViolationKind::kStringTooLong,
                   std::to_string(text.size()) + " bytes exceeds maxLength "
                       + std::to_string(*node.max_length));
        }
        if (node.min_length && text.size() < *node.min_length) {
            report(ViolationKind::kStringTooShort,
                   std::to_string(text.size()) + " bytes is below minLength "
                       + std::to_string(*node.min_length));
        }

        // Every grapheme is at least one byte, so short strings cannot exceed maxGraphemes
        const bool need_graphemes =
            node.min_graphemes || (node.max_graphemes && text.size() > *node.max_graphemes);
        if (need_graphemes) {
            auto graphemes = unicode::grapheme_count(text);
            if (!graphemes) {
                report(ViolationKind::kUnexpectedType, graphemes.error().message);
                return value;
            }
            if (node.max_graphemes && *graphemes > *node.max_graphemes) {
                report(ViolationKind::kStringTooManyGraphemes,
                       std::to_string(*graphemes) + " graphemes exceeds maxGraphemes "
                           + std::to_string(*node.max_graphemes));
            }
            if (node.min_graphemes && *graphemes < *node.min_graphemes) {
                report(ViolationKind::kStringTooFewGraphemes,
                       std::to_string(*graphemes) + " graphemes is below minGraphemes "
                           + std::to_string(*node.min_graphemes));
            }
        }

        json normalized = value;
        if (node.format) {
            auto canonical = node.format_validator(text, m_format_options);
            if (!canonical) {
                report(ViolationKind::kFormatMismatch,
                       "invalid " + *node.format + ": " + canonical.error().message,
                       canonical.error().kind);
            } else {
                normalized = std::move(*canonical);
            }
        }
        if (node.enum_values
            && std::ranges::find(*node.enum_values, text) == node.enum_values->end()) {
            report(ViolationKind::kEnumMismatch, "'" + text + "' is not one of the allowed values");
        }
        if (node.const_value && text != *node.const_value) {
            report(ViolationKind::kConstMismatch, "expected constant '" + *node.const_value + "'");
        }
        return normalized;
    }

    [[nodiscard]] json check_bytes(const schema::BytesNode& node, const json& value)
    {
        std::optional<encoding::Bytes> bytes;
        if (value.is_binary()) {
            const auto& binary = value.get_binary();
            bytes = encoding::Bytes(binary.begin(), binary.end());
        } else if (value.is_object() && value.size() == 1 && value.contains("$bytes")
                   && value["$bytes"].is_string()) {
            bytes = encoding::decode_base64(value["$bytes"].get<std::string>());
        } else if (value.is_string() && m_options.bytes_as_base64_string) {
            bytes = encoding::decode_base64(value.get<std::string>());
        } else {
            unexpected_type("bytes", value);
            return value;
        }
        if (!bytes) {
            report(ViolationKind::kUnexpectedType, "bytes are not valid base64");
            return value;
        }

        if ((node.max_length && bytes->size() > *node.max_length)
            || (node.min_length && bytes->size() < *node.min_length)) {
            report(ViolationKind::kBytesLengthOutOfBounds,
                   std::to_string(bytes->size()) + " bytes is outside ["
                       + std::to_string(node.min_length.value_or(0)) + ", "
                       + (node.max_length ? std::to_string(*node.max_length) : "") + "]");
        }
        return json{
            {"$bytes", encoding::encode_base64(*bytes)}
        };
    }

    /// Canonical CID text, or nullopt after reporting a FormatMismatch
    [[nodiscard]] std::optional<std::string> check_cid(const std::string& text)
    {
        auto cid = identifiers::parse_cid(text);
        if (!cid) {
            report(ViolationKind::kFormatMismatch, "invalid cid: " + cid.error().message,
                   cid.error().kind);
            return std::nullopt;
        }
        return cid->to_string();
    }

    [[nodiscard]] json check_cid_link(const json& value)
    {
        if (!value.is_object() || value.size() != 1 || !value.contains("$link")
            || !value["$link"].is_string()) {
            unexpected_type("cid-link {\"$link\": <cid>}", value);
            return value;
        }
        PathGuard guard(m_path, std::string("$link"));
        auto canonical = check_cid(value["$link"].get<std::string>());
        if (!canonical) {
            return value;
        }
        return json{
            {"$link", *canonical}
        };
    }

    [[nodiscard]] json check_blob(const schema::BlobNode& node, const json& value)
    {
        if (!value.is_object()) {
            unexpected_type("blob", value);
            return value;
        }

        json out = value;
        std::string mime;
        std::optional<std::uint64_t> size;
        if (value.contains(kTypeField)) {
            const auto& ref = value.contains("ref") ? value["ref"] : json();
            const bool shape_ok = value[kTypeField] == "blob" && ref.is_object()
                                  && ref.contains("$link") && ref["$link"].is_string()
                                  && value.contains("mimeType") && value["mimeType"].is_string()
                                  && value.contains("size")
                                  && as_integer(value["size"]).value_or(-1) >= 0;
            if (!shape_ok) {
                report(ViolationKind::kUnexpectedType,
                       "blob must be {\"$type\":\"blob\",\"ref\":{\"$link\":...},\"mimeType\":...,"
                       "\"size\":...}");
                return value;
            }
            PathGuard ref_guard(m_path, std::string("ref"));
            PathGuard link_guard(m_path, std::string("$link"));
            auto canonical = check_cid(ref["$link"].get<std::string>());
            if (canonical) {
                out["ref"]["$link"] = *canonical;
            }
            size = static_cast<std::uint64_t>(*as_integer(value["size"]));
        } else {
            const bool legacy_ok = value.contains("cid") && value["cid"].is_string()
                                   && value.contains("mimeType") && value["mimeType"].is_string();
            if (!legacy_ok) {
                unexpected_type("blob", value);
                return value;
            }
            PathGuard guard(m_path, std::string("cid"));
            auto canonical = check_cid(value["cid"].get<std::string>());
            if (canonical) {
                out["cid"] = *canonical;
            }
        }
        mime = value["mimeType"].get<std::string>();

        if (!mime_accepted(mime, node.accept)) {
            report(ViolationKind::kBlobConstraint, "MIME type '" + mime + "' is not accepted");
        }
        if (node.max_size && size && *size > *node.max_size) {
            report(ViolationKind::kBlobConstraint,
                   "blob size " + std::to_string(*size) + " exceeds maxSize "
                       + std::to_string(*node.max_size));
        }
        return out;
    }

    [[nodiscard]] json check_array(NodeRef ref,
                                   const schema::ArrayNode& node,
                                   const json& value,
                                   std::size_t depth)
    {
        if (!value.is_array()) {
            unexpected_type("array", value);
            return value;
        }
        if (!enter_container(depth)) {
            return value;
        }
        if ((node.max_length && value.size() > *node.max_length)
            || (node.min_length && value.size() < *node.min_length)) {
            report(ViolationKind::kArrayLengthOutOfBounds,
                   std::to_string(value.size()) + " items is outside ["
                       + std::to_string(node.min_length.value_or(0)) + ", "
                       + (node.max_length ? std::to_string(*node.max_length) : "") + "]");
        }

        json out = json::array();
        const NodeRef items{.graph = ref.graph, .id = node.items};
        for (std::size_t i = 0; i < value.size(); ++i) {
            PathGuard guard(m_path, i);
            out.push_back(check(items, value[i], depth + 1));
        }
        return out;
    }

    using PropertyMap = std::map<std::string, schema::NodeId, std::less<>>;
    using NameSet = std::set<std::string, std::less<>>;

    [[nodiscard]] json check_properties(NodeRef ref,
                                        const PropertyMap& properties,
                                        const NameSet& required,
                                        const NameSet* nullable,
                                        bool closed,
                                        const json& value,
                                        std::size_t depth)
    {
        if (!value.is_object()) {
            unexpected_type("object", value);
            return value;
        }
        if (!enter_container(depth)) {
            return value;
        }
        const auto is_nullable = [nullable](const std::string& name) {
            return nullable != nullptr && nullable->contains(name);
        };

        for (const auto& name : required) {
            auto it = value.find(name);
            if (it == value.end()) {
                PathGuard guard(m_path, name);
                report(ViolationKind::kMissingRequiredField, "required field is missing");
            } else if (it->is_null() && !is_nullable(name)) {
                PathGuard guard(m_path, name);
                report(ViolationKind::kMissingRequiredField, "required field is null");
            }
        }

        // nlohmann::json keeps object keys sorted, so this visits properties lexicographically
        json out = json::object();
        for (const auto& [name, property_value] : value.items()) {
            auto declared = properties.find(name);
            if (declared == properties.end()) {
                if (closed && !name.starts_with('$')) {
                    PathGuard guard(m_path, name);
                    report(ViolationKind::kUnknownField, "field is not declared by the schema");
                }
                out[name] = property_value;
                continue;
            }
            if (property_value.is_null() && (is_nullable(name) || required.contains(name))) {
                out[name] = property_value;
                continue;
            }
            PathGuard guard(m_path, name);
            const NodeRef property{.graph = ref.graph, .id = declared->second};
            out[name] = check(property, property_value, depth + 1);
        }
        return out;
    }

    [[nodiscard]] json check_union(NodeRef ref,
                                   const schema::UnionNode& node,
                                   const json& value,
                                   std::size_t depth,
                                   std::size_t hops)
    {
        if (!value.is_object()) {
            unexpected_type("object", value);
            return value;
        }
        auto type_field = value.find(kTypeField);
        if (type_field == value.end() || !type_field->is_string()) {
            if (!node.open) {
                report(ViolationKind::kUnknownUnionTag, "union member has no $type");
            }
            return value;
        }

        const std::string_view tag = canonical_tag(type_field->get_ref<const std::string&>());
        auto member = std::ranges::find_if(
            node.members, [tag](const schema::UnionMember& m) { return m.tag == tag; });
        if (member == node.members.end()) {
            if (!node.open) {
                report(ViolationKind::kUnknownUnionTag,
                       "$type '" + std::string(tag) + "' is not a member of the union");
            }
            return value;
        }

        if (!follow_reference(hops)) {
            return value;
        }
        auto target = ref.graph->resolve(member->target);
        if (!target) {
            report(ViolationKind::kUnresolvedReference,
                   "cannot resolve union member '" + member->tag + "'");
            return value;
        }
        return check(*target, value, depth, hops + 1);
    }

    const ValidatorOptions& m_options;
    identifiers::FormatOptions m_format_options;
    Path m_path;
    Violations m_violations;
};

[[nodiscard]] ValidationOutcome root_violation(ViolationKind kind, std::string detail)
{
    return std::unexpected(Violations{
        Violation{.path = {}, .kind = kind, .detail = std::move(detail), .format_error = std::nullopt}
    });
}

enum class RpcPart {
    kParameters,
    kInput,
    kOutput
};

[[nodiscard]] std::string_view part_name(RpcPart part)
{
    switch (part) {
        case RpcPart::kParameters:
            return "parameters";
        case RpcPart::kInput:
            return "input";
        case RpcPart::kOutput:
            return "output";
    }
    return "";
}

/**
 * Locate the schema of one part of an RPC definition.
 * @return the schema node (std::nullopt for a body without schema) or a root violation
 */
[[nodiscard]] std::expected<std::optional<schema::NodeId>, Violations>
find_rpc_schema(const schema::SchemaGraph& graph, std::string_view nsid, RpcPart part)
{
    const auto fail = [](std::string detail) {
        return std::unexpected(Violations{Violation{.path = {},
                                                    .kind = ViolationKind::kUnexpectedType,
                                                    .detail = std::move(detail),
                                                    .format_error = std::nullopt}});
    };

    auto id = graph.find(nsid);
    if (!id) {
        return fail("no definition named '" + std::string(nsid) + "'");
    }

    std::optional<schema::NodeId> parameters;
    const std::optional<schema::Body>* body = nullptr;
    const auto& kind = graph.node(*id).kind;
    if (const auto* query = std::get_if<schema::QueryNode>(&kind)) {
        parameters = query->parameters;
        body = part == RpcPart::kOutput ? &query->output : nullptr;
    } else if (const auto* procedure = std::get_if<schema::ProcedureNode>(&kind)) {
        parameters = procedure->parameters;
        body = part == RpcPart::kInput ? &procedure->input : &procedure->output;
    } else {
        return fail(std::string(nsid) + " is not a query or procedure definition");
    }

    if (part == RpcPart::kParameters) {
        if (!parameters) {
            return fail(std::string(nsid) + " declares no parameters");
        }
        return std::optional<schema::NodeId>{*parameters};
    }
    if (body == nullptr || !body->has_value()) {
        return fail(std::string(nsid) + " declares no " + std::string(part_name(part)));
    }
    return (*body)->schema;
}

[[nodiscard]] ValidationOutcome validate_rpc_part(const schema::SchemaGraph& graph,
                                                  std::string_view nsid,
                                                  RpcPart part,
                                                  const json& value,
                                                  const ValidatorOptions& options)
{
    auto schema_node = find_rpc_schema(graph, nsid, part);
    if (!schema_node) {
        return std::unexpected(std::move(schema_node.error()));
    }
    if (!schema_node->has_value()) {
        return value;
    }
    return validate_value(graph, **schema_node, value, options);
}

}  // namespace

ValidationOutcome validate_value(const schema::SchemaGraph& graph,
                                 schema::NodeId node,
                                 const json& value,
                                 const ValidatorOptions& options)
{
    if (node >= graph.size()) {
        return root_violation(ViolationKind::kUnresolvedReference,
                              "node " + std::to_string(node) + " is not part of the graph");
    }
    Validator validator(options);
    json normalized = validator.check(NodeRef{.graph = &graph, .id = node}, value, 0);
    Violations violations = validator.take_violations();
    if (!violations.empty()) {
        return std::unexpected(std::move(violations));
    }
    return normalized;
}

ValidationOutcome validate_parameters(const schema::SchemaGraph& graph,
                                      std::string_view nsid,
                                      const json& params,
                                      const ValidatorOptions& options)
{
    return validate_rpc_part(graph, nsid, RpcPart::kParameters, params, options);
}

ValidationOutcome validate_input(const schema::SchemaGraph& graph,
                                 std::string_view nsid,
                                 const json& body,
                                 const ValidatorOptions& options)
{
    return validate_rpc_part(graph, nsid, RpcPart::kInput, body, options);
}

ValidationOutcome validate_output(const schema::SchemaGraph& graph,
                                  std::string_view nsid,
                                  const json& body,
                                  const ValidatorOptions& options)
{
    return validate_rpc_part(graph, nsid, RpcPart::kOutput, body, options);
}

}  // namespace atlex::validation
