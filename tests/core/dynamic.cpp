#include <docpatch/core/dynamic.h>

#include <docpatch/core/testing.h>
#include <docpatch/utilities/text.h>

using namespace docpatch;

TEST_CASE("value_type streaming", "[core][dynamic]")
{
    REQUIRE(lexical_cast<string>(value_type::NIL) == "nil");
    REQUIRE(lexical_cast<string>(value_type::BOOLEAN) == "boolean");
    REQUIRE(lexical_cast<string>(value_type::INTEGER) == "integer");
    REQUIRE(lexical_cast<string>(value_type::FLOAT) == "float");
    REQUIRE(lexical_cast<string>(value_type::STRING) == "string");
    REQUIRE(lexical_cast<string>(value_type::DATETIME) == "datetime");
    REQUIRE(lexical_cast<string>(value_type::ARRAY) == "array");
    REQUIRE(lexical_cast<string>(value_type::MAP) == "map");
    REQUIRE_THROWS_AS(
        lexical_cast<string>(value_type(-1)), invalid_enum_value);
}

TEST_CASE("dynamic initializer lists", "[core][dynamic]")
{
    // lists of string-keyed pairs are maps
    dynamic m{{"a", 1}, {"b", "x"}};
    REQUIRE(m.type() == value_type::MAP);
    REQUIRE(get_field(cast<dynamic_map>(m), "a") == dynamic(integer(1)));
    REQUIRE(get_field(cast<dynamic_map>(m), "b") == dynamic("x"));

    // anything else is an array
    dynamic a{1, 2, 3};
    REQUIRE(a.type() == value_type::ARRAY);
    REQUIRE(cast<dynamic_array>(a).size() == 3);
}

TEST_CASE("dynamic type checking", "[core][dynamic]")
{
    dynamic v(integer(4));
    REQUIRE(cast<integer>(v) == 4);
    try
    {
        cast<string>(v);
        FAIL("no exception thrown");
    }
    catch (value_type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<expected_value_type_info>(e)
            == value_type::STRING);
        REQUIRE(
            get_required_error_info<actual_value_type_info>(e)
            == value_type::INTEGER);
    }
}

TEST_CASE("missing map fields", "[core][dynamic]")
{
    dynamic_map m{{dynamic("a"), dynamic(true)}};
    dynamic const* v;
    REQUIRE(get_field(&v, m, "a"));
    REQUIRE(*v == dynamic(true));
    REQUIRE(!get_field(&v, m, "b"));
    try
    {
        get_field(m, "b");
        FAIL("no exception thrown");
    }
    catch (missing_field& e)
    {
        REQUIRE(get_required_error_info<field_name_info>(e) == "b");
    }
}

TEST_CASE("dynamic comparisons", "[core][dynamic]")
{
    REQUIRE(dynamic(integer(1)) == dynamic(integer(1)));
    REQUIRE(dynamic(integer(1)) != dynamic(1.0));
    REQUIRE(dynamic("a") < dynamic("b"));
    REQUIRE(dynamic(nil) == dynamic());
    REQUIRE(dynamic{1, 2} != dynamic{1, 3});
}

TEST_CASE("datetime conversions", "[core][dynamic]")
{
    using namespace boost::posix_time;
    using boost::gregorian::date;

    ptime t(
        date(2017, boost::gregorian::Apr, 26),
        hours(1) + minutes(2) + seconds(3) + milliseconds(456));
    REQUIRE(to_value_string(t) == "2017-04-26T01:02:03.456Z");
    REQUIRE(parse_ptime("2017-04-26T01:02:03.456Z") == t);
    REQUIRE_THROWS_AS(parse_ptime("2017-04-26T01:02:03.456"), parsing_error);

    REQUIRE(datetimes_equal(ptime(), ptime()));
    REQUIRE(!datetimes_equal(ptime(), t));
    REQUIRE(dynamic(ptime()) == dynamic(ptime()));
}

TEST_CASE("base type conversions", "[core][dynamic]")
{
    test_dynamic_conversion(true, dynamic(true));
    test_dynamic_conversion(integer(7), dynamic(integer(7)));
    test_dynamic_conversion(1.5, dynamic(1.5));
    test_dynamic_conversion(string("abc"), dynamic("abc"));
    test_dynamic_conversion(
        std::vector<string>{"a", "b"},
        dynamic(dynamic_array{dynamic("a"), dynamic("b")}));

    // integers are accepted where floats are expected
    REQUIRE(from_dynamic<double>(dynamic(integer(2))) == 2.0);
}

TEST_CASE("vector conversion errors", "[core][dynamic]")
{
    try
    {
        from_dynamic<std::vector<string>>(
            dynamic(dynamic_array{dynamic("a"), dynamic(1.5)}));
        FAIL("no exception thrown");
    }
    catch (value_type_mismatch& e)
    {
        REQUIRE(get_required_error_info<dynamic_array_index_info>(e) == 1);
    }
}
