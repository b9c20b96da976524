#include "atlex/identifiers.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace atlex::identifiers::test {

TEST(NsidTest, SplitsAuthorityAndName)
{
    auto nsid = parse_nsid("dev.atprose.test.post");
    ASSERT_TRUE(nsid);
    EXPECT_EQ(nsid->authority, "dev.atprose.test");
    EXPECT_EQ(nsid->name, "post");
    EXPECT_EQ(nsid->to_string(), "dev.atprose.test.post");
}

TEST(NsidTest, LowercasesAuthorityOnly)
{
    auto nsid = parse_nsid("Dev.ATProse.Test.getPostThread");
    ASSERT_TRUE(nsid);
    EXPECT_EQ(nsid->to_string(), "dev.atprose.test.getPostThread");

    auto again = parse_nsid(nsid->to_string());
    ASSERT_TRUE(again);
    EXPECT_EQ(*again, *nsid);
}

TEST(NsidTest, ReportsSegmentRules)
{
    struct Case
    {
        std::string input;
        FormatErrorKind kind;
    };
    const std::vector<Case> cases = {
        {                    "", FormatErrorKind::kEmpty},
        {           "com.example", FormatErrorKind::kTooFewSegments},
        {     "1com.example.post", FormatErrorKind::kNumericTld},
        {      "com.example.3foo", FormatErrorKind::kBadNameSegment},
        {   "com.example.foo-bar", FormatErrorKind::kBadNameSegment},
        {         "com.example.", FormatErrorKind::kBadNameSegment},
        {              "com..foo", FormatErrorKind::kLabelEmpty},
        {     "com.exa_mple.post", FormatErrorKind::kBadCharacter},
        {        "com.-ex.post", FormatErrorKind::kLabelHyphen},
    };
    for (const auto& c : cases) {
        auto result = parse_nsid(c.input);
        ASSERT_FALSE(result) << c.input;
        EXPECT_EQ(result.error().kind, c.kind) << c.input << ": " << result.error().message;
    }
}

TEST(NsidTest, EnforcesLengthLimits)
{
    auto long_name = parse_nsid("com.example." + std::string(64, 'a'));
    ASSERT_FALSE(long_name);
    EXPECT_EQ(long_name.error().kind, FormatErrorKind::kBadNameSegment);

    auto long_label = parse_nsid("com." + std::string(64, 'a') + ".post");
    ASSERT_FALSE(long_label);
    EXPECT_EQ(long_label.error().kind, FormatErrorKind::kLabelTooLong);

    std::string too_long = "com";
    while (too_long.size() <= kMaxNsidLength) {
        too_long += "." + std::string(40, 'b');
    }
    too_long += ".post";
    auto result = parse_nsid(too_long);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, FormatErrorKind::kTooLong);
}

TEST(RecordKeyTest, AcceptsCommonKeys)
{
    for (const char* key : {"self", "3jui7kd54zh2y", "dev.atprose.test.post", "a:b~c_d-e", "..."}) {
        auto result = validate_record_key(key);
        ASSERT_TRUE(result) << key;
        EXPECT_EQ(*result, key);
    }
}

TEST(RecordKeyTest, RejectsReservedAndInvalidKeys)
{
    auto empty = validate_record_key("");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().kind, FormatErrorKind::kEmpty);

    for (const char* key : {".", ".."}) {
        auto result = validate_record_key(key);
        ASSERT_FALSE(result) << key;
        EXPECT_EQ(result.error().kind, FormatErrorKind::kReservedRecordKey);
    }

    for (const char* key : {"a/b", "a b", "tab\there"}) {
        auto result = validate_record_key(key);
        ASSERT_FALSE(result) << key;
        EXPECT_EQ(result.error().kind, FormatErrorKind::kBadCharacter);
    }

    auto too_long = validate_record_key(std::string(kMaxRecordKeyLength + 1, 'k'));
    ASSERT_FALSE(too_long);
    EXPECT_EQ(too_long.error().kind, FormatErrorKind::kTooLong);
    EXPECT_TRUE(validate_record_key(std::string(kMaxRecordKeyLength, 'k')));
}

}  // namespace atlex::identifiers::test
