#include "atlex/identifiers.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace atlex::identifiers::test {

TEST(DatetimeTest, AcceptsRfc3339Forms)
{
    for (const char* input : {"1985-04-12T23:20:50.123Z", "1985-04-12T23:20:50Z",
                              "1985-04-12T23:20:50.123456789+05:30", "1996-12-19T16:39:57-08:00",
                              "2000-02-29T00:00:00Z", "1990-12-31T23:59:60Z"}) {
        auto result = normalize_datetime(input);
        ASSERT_TRUE(result) << input << ": " << result.error().message;
        EXPECT_EQ(*result, input);
    }
}

TEST(DatetimeTest, UppercasesSeparatorAndZulu)
{
    auto result = normalize_datetime("1985-04-12t23:20:50.123z");
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "1985-04-12T23:20:50.123Z");

    auto again = normalize_datetime(*result);
    ASSERT_TRUE(again);
    EXPECT_EQ(*again, *result);
}

TEST(DatetimeTest, ReportsSpecificRule)
{
    struct Case
    {
        std::string input;
        FormatErrorKind kind;
    };
    const std::vector<Case> cases = {
        {                             "", FormatErrorKind::kEmpty},
        {                   "1985-04-12", FormatErrorKind::kBadDatetimeSyntax},
        {         "1985-04-12 23:20:50Z", FormatErrorKind::kBadDatetimeSyntax},
        {        "1985-04-12T23:20:50.Z", FormatErrorKind::kBadDatetimeSyntax},
        {    "1985-04-12T23:20:50+0100", FormatErrorKind::kBadDatetimeSyntax},
        {       "1985-04-12T23:20:50Zx", FormatErrorKind::kBadDatetimeSyntax},
        {          "1985-04-12T23:20:50", FormatErrorKind::kMissingTimezone},
        {     "1985-04-12T23:20:50.123", FormatErrorKind::kMissingTimezone},
        {     "1985-04-12T23:20:50.5X", FormatErrorKind::kMissingTimezone},
        {   "1985-04-12T23:20:50-00:00", FormatErrorKind::kUnknownLocalOffset},
        {         "1985-02-29T00:00:00Z", FormatErrorKind::kBadDate},
        {         "1900-02-29T00:00:00Z", FormatErrorKind::kBadDate},
        {         "1985-13-01T00:00:00Z", FormatErrorKind::kBadDate},
        {         "1985-04-31T00:00:00Z", FormatErrorKind::kBadDate},
        {         "1985-04-12T24:00:00Z", FormatErrorKind::kBadTime},
        {         "1985-04-12T23:60:00Z", FormatErrorKind::kBadTime},
        {   "1985-04-12T23:20:50+24:00", FormatErrorKind::kBadTime},
    };
    for (const auto& c : cases) {
        auto result = normalize_datetime(c.input);
        ASSERT_FALSE(result) << c.input;
        EXPECT_EQ(result.error().kind, c.kind) << c.input << ": " << result.error().message;
    }
}

}  // namespace atlex::identifiers::test
