#pragma once

/**
 * @file format_registry.hpp
 * @brief Maps schema `format` names to identifier validators
 */

#include "atlex/common.hpp"
#include "atlex/identifiers.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace atlex {

/// Returns the canonical form of a valid value
using FormatValidator = std::function<identifiers::FormatResult<std::string>(
    std::string_view, const identifiers::FormatOptions&)>;

class FormatRegistry
{
public:
    FormatRegistry() = default;

    /// Registry holding every protocol format (datetime, did, handle, ...)
    [[nodiscard]] static const FormatRegistry& standard();

    /// Register a format; fails with DuplicateFormat if the name is taken
    [[nodiscard]] VoidResult add(std::string name, FormatValidator validator);

    /// @return nullptr if the name is not registered
    [[nodiscard]] const FormatValidator* find(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    /// Registered names in lexicographic order
    [[nodiscard]] std::vector<std::string> names() const;

private:
    std::map<std::string, FormatValidator, std::less<>> m_validators;
};

}  // namespace atlex
