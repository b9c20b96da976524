#include "atlex/format_registry.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace atlex::test {

using identifiers::FormatErrorKind;
using identifiers::FormatOptions;
using identifiers::FormatResult;

TEST(FormatRegistryTest, StandardRegistryHasEveryProtocolFormat)
{
    const auto& registry = FormatRegistry::standard();
    const std::vector<std::string> expected = {"at-identifier", "at-uri", "cid",  "datetime",
                                               "did",           "handle", "language", "nsid",
                                               "record-key",    "tid",    "uri"};
    EXPECT_EQ(registry.names(), expected);
    EXPECT_TRUE(registry.contains("handle"));
    EXPECT_FALSE(registry.contains("email"));
    EXPECT_EQ(registry.find("email"), nullptr);
}

TEST(FormatRegistryTest, ValidatorsReturnCanonicalForms)
{
    const auto& registry = FormatRegistry::standard();
    const FormatOptions options;

    struct Case
    {
        std::string format;
        std::string input;
        std::string canonical;
    };
    const std::vector<Case> cases = {
        {     "datetime", "1985-04-12t23:20:50z", "1985-04-12T23:20:50Z"},
        {     "language", "EN-us", "en-US"},
        {       "handle", "Alice.Example.COM", "alice.example.com"},
        {"at-identifier", "did:plc:z72i7hdynmk6r22z27h6tvur", "did:plc:z72i7hdynmk6r22z27h6tvur"},
        {       "at-uri", "at://Alice.Example.com/", "at://alice.example.com"},
        {          "cid", "zdpuAsDo7UZTXQtgvtq6uKnJCYMkEvf8XAgPxn8rtopYnpTDh",
         "bafyreidfayvfuwqa7qlnopdjiqrxzs6blmoeu4rujcjtnci5beludirz2a"},
        {         "nsid", "Dev.Atprose.Test.post", "dev.atprose.test.post"},
        {          "tid", "3kqcaxrhm7q22", "3kqcaxrhm7q22"},
        {   "record-key", "self", "self"},
        {          "uri", "https://example.com", "https://example.com"},
    };
    for (const auto& c : cases) {
        const auto* validator = registry.find(c.format);
        ASSERT_NE(validator, nullptr) << c.format;
        auto result = (*validator)(c.input, options);
        ASSERT_TRUE(result) << c.format << ": " << result.error().message;
        EXPECT_EQ(*result, c.canonical) << c.format;

        auto again = (*validator)(*result, options);
        ASSERT_TRUE(again) << c.format;
        EXPECT_EQ(*again, *result) << c.format;
    }
}

TEST(FormatRegistryTest, HandleOptionsReachValidators)
{
    const auto* handle = FormatRegistry::standard().find("handle");
    ASSERT_NE(handle, nullptr);

    auto strict = (*handle)("localhost", FormatOptions{});
    ASSERT_FALSE(strict);
    EXPECT_EQ(strict.error().kind, FormatErrorKind::kMissingDot);

    auto lenient = (*handle)("localhost", FormatOptions{.strict_handles = false});
    ASSERT_TRUE(lenient);
    EXPECT_EQ(*lenient, "localhost");
}

TEST(FormatRegistryTest, CustomRegistryRejectsDuplicates)
{
    FormatRegistry registry;
    EXPECT_TRUE(registry.names().empty());

    auto upper_only = [](std::string_view v, const FormatOptions&) -> FormatResult<std::string> {
        for (char c : v) {
            if (c < 'A' || c > 'Z') {
                return std::unexpected(identifiers::FormatError::make(
                    FormatErrorKind::kBadCharacter, "expected uppercase letters"));
            }
        }
        return std::string(v);
    };
    ASSERT_TRUE(registry.add("upper", upper_only));

    auto duplicate = registry.add("upper", upper_only);
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, "DuplicateFormat");

    const auto* validator = registry.find("upper");
    ASSERT_NE(validator, nullptr);
    EXPECT_TRUE((*validator)("ABC", FormatOptions{}));
    EXPECT_FALSE((*validator)("abc", FormatOptions{}));
    EXPECT_FALSE(registry.contains("datetime"));
}

}  // namespace atlex::test
