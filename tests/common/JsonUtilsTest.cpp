#include "common/JsonUtils.h"
#include <gtest/gtest.h>
#include <limits>

namespace RPE {

TEST(JsonUtilsTest, ParseReportsErrors) {
    auto parsed = JsonUtils::parseJson(R"({"a": [1, 2]})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(2u, (*parsed)["a"].size());

    std::string error;
    EXPECT_FALSE(JsonUtils::parseJson("{\"a\": ", &error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST(JsonUtilsTest, TypedGettersFallBackOnMismatch) {
    json document = {{"name", "worker"}, {"count", 3}, {"enabled", true}, {"nothing", nullptr}};

    EXPECT_EQ("worker", JsonUtils::getString(document, "name"));
    EXPECT_EQ("fallback", JsonUtils::getString(document, "count", "fallback"));
    EXPECT_EQ(3, JsonUtils::getInt(document, "count"));
    EXPECT_EQ(-1, JsonUtils::getInt(document, "name", -1));
    EXPECT_TRUE(JsonUtils::getBool(document, "enabled"));
    EXPECT_FALSE(JsonUtils::getBool(document, "missing"));
    EXPECT_TRUE(JsonUtils::hasKey(document, "name"));
    EXPECT_FALSE(JsonUtils::hasKey(document, "nothing"));
}

TEST(JsonUtilsTest, RepresentableValues) {
    json document = {{"text", "ok"}, {"numbers", {1, 2.5, -3}}, {"nested", {{"flag", false}, {"none", nullptr}}}};
    EXPECT_TRUE(JsonUtils::isRepresentable(document));
}

TEST(JsonUtilsTest, NonRepresentableValuesReportTheirPath) {
    std::string path;

    json nan = {{"outputs", {{"values", {1.0, 2.0, std::numeric_limits<double>::quiet_NaN()}}}}};
    EXPECT_FALSE(JsonUtils::isRepresentable(nan, &path));
    EXPECT_EQ("outputs.values[2]", path);

    json infinite = {{"ratio", std::numeric_limits<double>::infinity()}};
    EXPECT_FALSE(JsonUtils::isRepresentable(infinite, &path));
    EXPECT_EQ("ratio", path);

    json binary = {{"blob", json::binary({0xde, 0xad})}};
    EXPECT_FALSE(JsonUtils::isRepresentable(binary, &path));
    EXPECT_EQ("blob", path);

    EXPECT_FALSE(JsonUtils::isRepresentable(json(std::numeric_limits<double>::quiet_NaN()), &path));
    EXPECT_EQ("<root>", path);
}

}  // namespace RPE
