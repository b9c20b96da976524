#include "atlex/options.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace atlex::test {

TEST(OptionsTest, EmptyObjectKeepsDefaults)
{
    auto options = load_validator_options(nlohmann::json::object());
    ASSERT_TRUE(options);
    EXPECT_TRUE(options->strict_handles);
    EXPECT_FALSE(options->reject_unknown_fields);
    EXPECT_FALSE(options->bytes_as_base64_string);
    EXPECT_EQ(options->max_depth, 128U);
}

TEST(OptionsTest, LoadsEveryValidatorOption)
{
    nlohmann::json config = {
        {        "strict_handles", false},
        { "reject_unknown_fields",  true},
        {"bytes_as_base64_string",  true},
        {             "max_depth",    16}
    };
    auto options = load_validator_options(config);
    ASSERT_TRUE(options);
    EXPECT_FALSE(options->strict_handles);
    EXPECT_TRUE(options->reject_unknown_fields);
    EXPECT_TRUE(options->bytes_as_base64_string);
    EXPECT_EQ(options->max_depth, 16U);
    EXPECT_EQ(to_json(*options), config);
}

TEST(OptionsTest, RejectsUnknownKeysAndWrongTypes)
{
    auto unknown = load_validator_options(nlohmann::json{
        {"strict", true}
    });
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, "InvalidOptions");

    auto wrong_type = load_validator_options(nlohmann::json{
        {"strict_handles", "yes"}
    });
    ASSERT_FALSE(wrong_type);
    EXPECT_EQ(wrong_type.error().code, "InvalidOptions");

    auto zero_depth = load_validator_options(nlohmann::json{
        {"max_depth", 0}
    });
    ASSERT_FALSE(zero_depth);

    auto negative_depth = load_validator_options(nlohmann::json{
        {"max_depth", -4}
    });
    ASSERT_FALSE(negative_depth);

    EXPECT_FALSE(load_validator_options(nlohmann::json::array()));
}

TEST(OptionsTest, LoadsBuildOptions)
{
    auto options = load_build_options(nlohmann::json{
        {"schema_dir", "schemas"}
    });
    ASSERT_TRUE(options);
    EXPECT_EQ(options->schema_dir, "schemas");

    auto defaults = load_build_options(nlohmann::json::object());
    ASSERT_TRUE(defaults);
    EXPECT_TRUE(defaults->schema_dir.empty());

    EXPECT_FALSE(load_build_options(nlohmann::json{
        {"schema_dir", 3}
    }));
    EXPECT_FALSE(load_build_options(nlohmann::json{
        {"registry", "x"}
    }));
}

}  // namespace atlex::test
