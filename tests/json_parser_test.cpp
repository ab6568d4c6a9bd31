#include <catch2/catch.hpp>
#include "utils/json_parser.hpp"

using namespace sealgate;
namespace pt = boost::property_tree;

TEST_CASE("Only JSON objects are accepted as bodies", "[json]") {
    pt::ptree tree;
    CHECK(JsonParser::parseObject("{\"a\":1}", tree));
    CHECK(JsonParser::parseObject("  \n{}", tree));
    CHECK_FALSE(JsonParser::parseObject("", tree));
    CHECK_FALSE(JsonParser::parseObject("[1,2]", tree));
    CHECK_FALSE(JsonParser::parseObject("\"text\"", tree));
    CHECK_FALSE(JsonParser::parseObject("{\"a\":", tree));
}

TEST_CASE("Scalar fields are read with null treated as absent", "[json]") {
    pt::ptree tree;
    REQUIRE(JsonParser::parseObject(
        "{\"name\":\"alice\",\"count\":42,\"neg\":-7,\"gone\":null,\"nested\":{\"x\":1},\"dotted.key\":\"v\"}", tree));

    std::string text;
    CHECK(JsonParser::getString(tree, "name", text));
    CHECK(text == "alice");
    CHECK_FALSE(JsonParser::getString(tree, "gone", text));
    CHECK_FALSE(JsonParser::getString(tree, "missing", text));
    CHECK_FALSE(JsonParser::getString(tree, "nested", text));
    CHECK(JsonParser::getString(tree, "dotted.key", text));
    CHECK(text == "v");

    int64_t number = 0;
    CHECK(JsonParser::getInt64(tree, "count", number));
    CHECK(number == 42);
    CHECK(JsonParser::getInt64(tree, "neg", number));
    CHECK(number == -7);
    CHECK_FALSE(JsonParser::getInt64(tree, "name", number));
    CHECK_FALSE(JsonParser::getInt64(tree, "gone", number));
}

TEST_CASE("String arrays", "[json]") {
    pt::ptree tree;
    REQUIRE(JsonParser::parseObject("{\"ids\":[\"a\",\"b\"],\"empty\":[],\"scalar\":\"x\",\"objects\":[{\"a\":1}]}",
                                    tree));
    std::vector<std::string> values;
    REQUIRE(JsonParser::getStringArray(tree, "ids", values));
    CHECK(values == std::vector<std::string>{"a", "b"});
    REQUIRE(JsonParser::getStringArray(tree, "empty", values));
    CHECK(values.empty());
    CHECK_FALSE(JsonParser::getStringArray(tree, "scalar", values));
    CHECK_FALSE(JsonParser::getStringArray(tree, "objects", values));
    CHECK_FALSE(JsonParser::getStringArray(tree, "missing", values));
}

TEST_CASE("Responses are escaped", "[json]") {
    CHECK(JsonParser::quote("a\"b\\c\n") == "\"a\\\"b\\\\c\\n\"");
    CHECK(JsonParser::escapeJson(std::string(1, '\x01')) == "\\u0001");
    CHECK(JsonParser::stringArray({"x", "y"}) == "[\"x\",\"y\"]");
    CHECK(JsonParser::stringArray({}) == "[]");
    CHECK(JsonParser::createSuccessResponse("ok") == "{\"success\":true,\"message\":\"ok\"}");
    CHECK(JsonParser::createErrorResponse("GROUP_FULL", "full", {{"max_participants", "3"}}) ==
          "{\"success\":false,\"error\":\"GROUP_FULL\",\"message\":\"full\",\"max_participants\":\"3\"}");
    CHECK(JsonParser::createErrorResponse("", "Group not found", {}) ==
          "{\"success\":false,\"error\":\"Group not found\",\"message\":\"Group not found\"}");
}
