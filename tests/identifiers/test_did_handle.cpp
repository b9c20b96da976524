#include "atlex/identifiers.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace atlex::identifiers::test {

TEST(DidTest, ParsesPlcAndWebDids)
{
    auto plc = parse_did("did:plc:z72i7hdynmk6r22z27h6tvur");
    ASSERT_TRUE(plc);
    EXPECT_EQ(plc->method, "plc");
    EXPECT_EQ(plc->identifier, "z72i7hdynmk6r22z27h6tvur");
    EXPECT_EQ(plc->to_string(), "did:plc:z72i7hdynmk6r22z27h6tvur");

    auto web = parse_did("did:web:example.com");
    ASSERT_TRUE(web);
    EXPECT_EQ(web->method, "web");

    auto web_port = parse_did("did:web:localhost%3A8080");
    ASSERT_TRUE(web_port);
    EXPECT_EQ(web_port->identifier, "localhost%3A8080");

    // Unknown methods only need the generic syntax
    EXPECT_TRUE(parse_did("did:key:zQ3shokFTS3brHcDQrn82RUDfCZESWL1ZdCEJwekUDPQiYBme"));
}

TEST(DidTest, ReportsSpecificRule)
{
    struct Case
    {
        std::string input;
        FormatErrorKind kind;
    };
    const std::vector<Case> cases = {
        {                             "", FormatErrorKind::kEmpty},
        {                "plc:abc", FormatErrorKind::kMissingDidPrefix},
        {               "did:plc:", FormatErrorKind::kTrailingColon},
        {            "did:plc:abc:", FormatErrorKind::kTrailingColon},
        {               "did::abc", FormatErrorKind::kBadDidMethod},
        {               "did:PLC:abc", FormatErrorKind::kBadDidMethod},
        {           "did:method:a b", FormatErrorKind::kBadCharacter},
        {        "did:method:bad%zz", FormatErrorKind::kBadPercentEncoding},
        {        "did:method:bad%2", FormatErrorKind::kBadPercentEncoding},
        {             "did:plc:short", FormatErrorKind::kBadPlcIdentifier},
        {"did:plc:Z72I7HDYNMK6R22Z27H6TVUR", FormatErrorKind::kBadPlcIdentifier},
        {        "did:web:-bad.com", FormatErrorKind::kBadWebHost},
        {   "did:web:example.com%3Ax", FormatErrorKind::kBadWebHost},
    };
    for (const auto& c : cases) {
        auto result = parse_did(c.input);
        ASSERT_FALSE(result) << c.input;
        EXPECT_EQ(result.error().kind, c.kind) << c.input << ": " << result.error().message;
    }

    auto too_long = parse_did("did:method:" + std::string(kMaxDidLength, 'a'));
    ASSERT_FALSE(too_long);
    EXPECT_EQ(too_long.error().kind, FormatErrorKind::kTooLong);
}

TEST(HandleTest, NormalizesToLowercase)
{
    auto handle = normalize_handle("Alice.Example.COM");
    ASSERT_TRUE(handle);
    EXPECT_EQ(*handle, "alice.example.com");

    auto again = normalize_handle(*handle);
    ASSERT_TRUE(again);
    EXPECT_EQ(*again, *handle);

    EXPECT_TRUE(normalize_handle("xn--ls8h.test"));
    EXPECT_TRUE(normalize_handle("a.b-c.d9.co"));
}

TEST(HandleTest, StrictModeRequiresDotAndPublicTld)
{
    auto bare = normalize_handle("localhost");
    ASSERT_FALSE(bare);
    EXPECT_EQ(bare.error().kind, FormatErrorKind::kMissingDot);
    EXPECT_TRUE(normalize_handle("localhost", false));

    auto reserved = normalize_handle("service.local");
    ASSERT_FALSE(reserved);
    EXPECT_EQ(reserved.error().kind, FormatErrorKind::kDisallowedTld);
    EXPECT_TRUE(normalize_handle("service.local", false));
}

TEST(HandleTest, ReportsLabelRules)
{
    struct Case
    {
        std::string input;
        FormatErrorKind kind;
    };
    const std::vector<Case> cases = {
        {                             "", FormatErrorKind::kEmpty},
        {                  "alice..com", FormatErrorKind::kLabelEmpty},
        {                   "alice.com.", FormatErrorKind::kLabelEmpty},
        {std::string(64, 'a') + ".com", FormatErrorKind::kLabelTooLong},
        {                 "-alice.com", FormatErrorKind::kLabelHyphen},
        {                 "alice-.com", FormatErrorKind::kLabelHyphen},
        {                "alice_b.com", FormatErrorKind::kBadCharacter},
        {                  "alice.1com", FormatErrorKind::kNumericTld},
    };
    for (const auto& c : cases) {
        auto result = normalize_handle(c.input);
        ASSERT_FALSE(result) << c.input;
        EXPECT_EQ(result.error().kind, c.kind) << c.input;
    }

    std::string long_handle;
    for (int i = 0; i < 5; ++i) {
        long_handle += std::string(60, 'a') + ".";
    }
    long_handle += "com";
    auto too_long = normalize_handle(long_handle);
    ASSERT_FALSE(too_long);
    EXPECT_EQ(too_long.error().kind, FormatErrorKind::kTooLong);
}

TEST(AtIdentifierTest, DispatchesOnDidPrefix)
{
    auto did = normalize_at_identifier("did:plc:z72i7hdynmk6r22z27h6tvur");
    ASSERT_TRUE(did);
    EXPECT_EQ(*did, "did:plc:z72i7hdynmk6r22z27h6tvur");

    auto handle = normalize_at_identifier("Bob.Example.org");
    ASSERT_TRUE(handle);
    EXPECT_EQ(*handle, "bob.example.org");

    EXPECT_FALSE(normalize_at_identifier("did:plc:"));
    EXPECT_FALSE(normalize_at_identifier("bob"));
    EXPECT_TRUE(normalize_at_identifier("bob", false));
}

}  // namespace atlex::identifiers::test
