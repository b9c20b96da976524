/**
 * @file record.cpp
 * @brief Record entry point: `$type` check, payload validation, key strategies
 */

#include "atlex/record.hpp"

#include "atlex/value_validator.hpp"

#define LEATHERMAN_LOGGING_NAMESPACE "atlex.validation"
#include <leatherman/logging/logging.hpp>

namespace atlex::validation {

namespace {

using nlohmann::json;
using schema::RecordKeyStrategy;

[[nodiscard]] Violation root_violation(ViolationKind kind, std::string detail, Path path = {})
{
    return Violation{.path = std::move(path),
                     .kind = kind,
                     .detail = std::move(detail),
                     .format_error = std::nullopt};
}

[[nodiscard]] KeyError key_error(std::string reason,
                                 std::optional<identifiers::FormatErrorKind> format_error = std::nullopt)
{
    return KeyError{.reason = std::move(reason), .format_error = format_error};
}

[[nodiscard]] const schema::RecordNode* find_record(const schema::SchemaGraph& graph,
                                                    std::string_view record_nsid)
{
    auto id = graph.find(record_nsid);
    if (!id) {
        return nullptr;
    }
    return std::get_if<schema::RecordNode>(&graph.node(*id).kind);
}

}  // namespace

Violation KeyError::to_violation() const
{
    return Violation{.path = {},
                     .kind = ViolationKind::kInvalidKey,
                     .detail = reason,
                     .format_error = format_error};
}

ValidationOutcome validate_record(const schema::SchemaGraph& graph,
                                  std::string_view record_nsid,
                                  const json& instance,
                                  const ValidatorOptions& options)
{
    const schema::RecordNode* record = find_record(graph, record_nsid);
    if (record == nullptr) {
        return std::unexpected(Violations{root_violation(
            ViolationKind::kUnexpectedType,
            "'" + std::string(record_nsid) + "' is not a record definition")});
    }

    // "nsid" and "nsid#main" name the same record
    const auto record_ref = schema::split_reference(record_nsid);
    const std::string expected_tag = schema::type_tag(record_ref->document_id, record_ref->def_name);

    std::optional<Violation> type_violation;
    if (instance.is_object()) {
        auto type_field = instance.find("$type");
        if (type_field != instance.end()) {
            const auto declared = type_field->is_string()
                                      ? schema::split_reference(type_field->get<std::string>())
                                      : std::nullopt;
            if (!declared
                || schema::type_tag(declared->document_id, declared->def_name) != expected_tag) {
                type_violation = root_violation(
                    ViolationKind::kUnexpectedType,
                    "$type does not match record type '" + expected_tag + "'",
                    Path{std::string("$type")});
            }
        }
    }

    auto outcome = validate_value(graph, record->payload, instance, options);
    if (type_violation) {
        Violations violations = outcome ? Violations{} : std::move(outcome.error());
        violations.insert(violations.begin(), std::move(*type_violation));
        outcome = std::unexpected(std::move(violations));
    }
    if (!outcome) {
        LOG_DEBUG("record {1} rejected with {2} violation(s)", record_nsid, outcome.error().size());
    }
    return outcome;
}

RecordValidation validate_record(const schema::SchemaGraph& graph,
                                 std::string_view record_nsid,
                                 const json& instance,
                                 std::string_view key,
                                 const ValidatorOptions& options)
{
    RecordValidation result{.payload = validate_record(graph, record_nsid, instance, options),
                            .key = KeyResult{}};
    auto strategy = record_key_strategy(graph, record_nsid);
    if (!strategy) {
        result.key = std::unexpected(
            key_error("'" + std::string(record_nsid) + "' is not a record definition"));
        return result;
    }
    result.key = validate_record_key(*strategy, key);
    return result;
}

KeyResult validate_record_key(const RecordKeyStrategy& strategy, std::string_view key)
{
    auto record_key = identifiers::validate_record_key(key);
    if (!record_key) {
        return std::unexpected(
            key_error("invalid record key: " + record_key.error().message, record_key.error().kind));
    }

    switch (strategy.kind) {
        case RecordKeyStrategy::Kind::kTid: {
            auto tid = identifiers::parse_tid(key);
            if (!tid) {
                return std::unexpected(
                    key_error("record key must be a TID: " + tid.error().message, tid.error().kind));
            }
            return tid->to_string();
        }
        case RecordKeyStrategy::Kind::kNsid: {
            auto nsid = identifiers::parse_nsid(key);
            if (!nsid) {
                return std::unexpected(
                    key_error("record key must be an NSID: " + nsid.error().message, nsid.error().kind));
            }
            return nsid->to_string();
        }
        case RecordKeyStrategy::Kind::kLiteral:
            if (key != strategy.literal) {
                return std::unexpected(key_error("record key must be '" + strategy.literal + "'"));
            }
            return std::string(key);
        case RecordKeyStrategy::Kind::kAny:
            return std::move(*record_key);
    }
    return std::unexpected(key_error("unknown key strategy"));
}

std::optional<RecordKeyStrategy> record_key_strategy(const schema::SchemaGraph& graph,
                                                     std::string_view record_nsid)
{
    const schema::RecordNode* record = find_record(graph, record_nsid);
    if (record == nullptr) {
        return std::nullopt;
    }
    return record->key;
}

KeyResult derive_record_key(const RecordKeyStrategy& strategy, identifiers::TidGenerator& generator)
{
    switch (strategy.kind) {
        case RecordKeyStrategy::Kind::kTid:
            return generator.next().to_string();
        case RecordKeyStrategy::Kind::kLiteral:
            return strategy.literal;
        case RecordKeyStrategy::Kind::kAny:
        case RecordKeyStrategy::Kind::kNsid:
            break;
    }
    return std::unexpected(
        key_error("key strategy '" + strategy.to_string() + "' needs a caller-supplied key"));
}

}  // namespace atlex::validation
