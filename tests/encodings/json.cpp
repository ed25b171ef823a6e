#include <docpatch/encodings/json.h>

#include <docpatch/core/testing.h>
#include <docpatch/diff/diff.h>
#include <docpatch/utilities/text.h>

using namespace docpatch;

TEST_CASE("reading JSON", "[encodings][json]")
{
    auto v = parse_json_value(
        R"({
            "name": "John",
            "age": 25,
            "score": 2.5,
            "active": true,
            "tags": ["a", null],
            "created_at": "2017-04-26T01:02:03.456Z",
            "no_millis": "2017-04-26T01:02:03Z"
        })");
    REQUIRE(
        v
        == dynamic(
            {{"name", "John"},
             {"age", 25},
             {"score", 2.5},
             {"active", true},
             {"tags", dynamic(dynamic_array{dynamic("a"), dynamic(nil)})},
             {"created_at", parse_ptime("2017-04-26T01:02:03.456Z")},
             {"no_millis", "2017-04-26T01:02:03Z"}}));
}

TEST_CASE("malformed JSON", "[encodings][json]")
{
    try
    {
        parse_json_value("{\"a\": ");
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<expected_format_info>(e) == "JSON");
        REQUIRE(get_required_error_info<parsed_text_info>(e) == "{\"a\": ");
    }
}

TEST_CASE("writing JSON", "[encodings][json]")
{
    REQUIRE(value_to_json(dynamic(nil)) == "null");
    REQUIRE(
        value_to_json(dynamic({{"b", 1.5}, {"a", dynamic{1, 2}}}))
        == R"({"a":[1,2],"b":1.5})");
    REQUIRE(
        value_to_json(dynamic(parse_ptime("2017-04-26T01:02:03.456Z")))
        == "\"2017-04-26T01:02:03.456Z\"");
    // A cleared datetime has no value.
    REQUIRE(value_to_json(dynamic(ptime())) == "null");
    REQUIRE(
        value_to_json(dynamic({{"a", true}}), 2)
        == "{\n  \"a\": true\n}");
}

TEST_CASE("writing patch info as JSON", "[encodings][json]")
{
    patch p;
    p.add_operation(set_operator, "age", dynamic(integer(26)));
    REQUIRE(
        patch_info_to_json(p.info(), -1)
        == R"({"metadata":{"fieldsChanged":["age"],)"
           R"("operationTypes":{"age":"$set"},"totalChanges":1},)"
           R"("operations":{"$set":{"age":26}}})");
}

TEST_CASE("diffing JSON documents", "[encodings][json]")
{
    auto old_document = parse_json_value(
        R"({"name": "John", "age": 25, "tags": ["a"], "extra": {"x": 1}})");
    auto new_document = parse_json_value(
        R"({"name": "John", "age": 26, "tags": ["a", "b"]})");

    diff_config config;
    config.arrays = array_strategy::APPEND;
    auto p = compute_patch(old_document, new_document, config);
    REQUIRE(
        to_dynamic(p)
        == dynamic(
            {{"$set", {{"age", 26}}},
             {"$unset", {{"extra", ""}}},
             {"$push", {{"tags", "b"}}}}));
}
