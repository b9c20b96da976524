#include "atlex/identifiers.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace atlex::identifiers::test {

TEST(AtUriTest, ParsesRecordUri)
{
    auto uri = parse_at_uri(
        "at://did:plc:z72i7hdynmk6r22z27h6tvur/dev.atprose.test.post/3jui7kd54zh2y");
    ASSERT_TRUE(uri) << uri.error().message;
    EXPECT_EQ(uri->authority, "did:plc:z72i7hdynmk6r22z27h6tvur");
    ASSERT_TRUE(uri->collection);
    EXPECT_EQ(uri->collection->to_string(), "dev.atprose.test.post");
    ASSERT_TRUE(uri->record_key);
    EXPECT_EQ(*uri->record_key, "3jui7kd54zh2y");
}

TEST(AtUriTest, CanonicalizesAuthorityAndTrailingSlash)
{
    auto uri = parse_at_uri("at://Alice.Example.com/Dev.Atprose.Test.post/self/");
    ASSERT_TRUE(uri) << uri.error().message;
    EXPECT_EQ(uri->to_string(), "at://alice.example.com/dev.atprose.test.post/self");

    auto again = parse_at_uri(uri->to_string());
    ASSERT_TRUE(again);
    EXPECT_EQ(again->to_string(), uri->to_string());

    auto authority_only = parse_at_uri("at://alice.example.com");
    ASSERT_TRUE(authority_only);
    EXPECT_FALSE(authority_only->collection);
    EXPECT_EQ(authority_only->to_string(), "at://alice.example.com");
}

TEST(AtUriTest, ReportsSpecificRule)
{
    struct Case
    {
        std::string input;
        FormatErrorKind kind;
    };
    const std::vector<Case> cases = {
        {                          "https://alice.example.com", FormatErrorKind::kBadScheme},
        {                       "at://alice.example.com?x=1", FormatErrorKind::kUnexpectedQuery},
        {                      "at://alice.example.com#frag", FormatErrorKind::kUnexpectedFragment},
        {                       "at://user@alice.example.com", FormatErrorKind::kUnexpectedCredentials},
        {                                             "at://", FormatErrorKind::kBadAuthority},
        {                           "at://bad_handle.com/a.b.c", FormatErrorKind::kBadAuthority},
        {                        "at://alice.example.com/post", FormatErrorKind::kBadPath},
        {              "at://alice.example.com/dev.a.post/..", FormatErrorKind::kBadPath},
        {"at://alice.example.com/dev.a.post/self/extra", FormatErrorKind::kBadPath},
    };
    for (const auto& c : cases) {
        auto result = parse_at_uri(c.input);
        ASSERT_FALSE(result) << c.input;
        EXPECT_EQ(result.error().kind, c.kind) << c.input << ": " << result.error().message;
    }
}

TEST(AtUriTest, LenientModeAllowsReservedTlds)
{
    EXPECT_FALSE(parse_at_uri("at://alice.test.localhost/dev.atprose.test.post"));
    EXPECT_TRUE(parse_at_uri("at://alice.test.localhost/dev.atprose.test.post", false));
}

TEST(UriTest, AcceptsAbsoluteUris)
{
    for (const char* input : {"https://example.com/path?q=1#top", "mailto:alice@example.com",
                              "at://alice.example.com", "did:plc:z72i7hdynmk6r22z27h6tvur",
                              "urn:isbn:0451450523", "git+ssh://host/repo.git"}) {
        auto result = validate_uri(input);
        ASSERT_TRUE(result) << input;
        EXPECT_EQ(*result, input);
    }
}

TEST(UriTest, RejectsRelativeAndMalformedUris)
{
    struct Case
    {
        std::string input;
        FormatErrorKind kind;
    };
    const std::vector<Case> cases = {
        {                      "", FormatErrorKind::kEmpty},
        {             "/relative", FormatErrorKind::kBadScheme},
        {          "://no-scheme", FormatErrorKind::kBadScheme},
        {        "1http://x.com", FormatErrorKind::kBadScheme},
        {                "https:", FormatErrorKind::kBadPath},
        {"https://exa mple.com", FormatErrorKind::kBadCharacter},
    };
    for (const auto& c : cases) {
        auto result = validate_uri(c.input);
        ASSERT_FALSE(result) << c.input;
        EXPECT_EQ(result.error().kind, c.kind) << c.input;
    }

    auto too_long = validate_uri("https://example.com/" + std::string(kMaxUriLength, 'a'));
    ASSERT_FALSE(too_long);
    EXPECT_EQ(too_long.error().kind, FormatErrorKind::kTooLong);
}

}  // namespace atlex::identifiers::test
