#include <docpatch/core/reflection.h>

#include <docpatch/core/testing.h>
#include <docpatch/utilities/text.h>

#include "../test_types.h"

using namespace docpatch;

TEST_CASE("value_kind streaming", "[core][reflection]")
{
    REQUIRE(lexical_cast<string>(value_kind::BOOLEAN) == "boolean");
    REQUIRE(lexical_cast<string>(value_kind::STRUCTURE) == "structure");
    REQUIRE(lexical_cast<string>(value_kind::POINTER) == "pointer");
    REQUIRE(lexical_cast<string>(value_kind::DYNAMIC) == "dynamic");
    REQUIRE_THROWS_AS(
        lexical_cast<string>(value_kind(-1)), invalid_enum_value);
}

TEST_CASE("value kinds of C++ types", "[core][reflection]")
{
    REQUIRE(get_type_interface<bool>().kind() == value_kind::BOOLEAN);
    REQUIRE(get_type_interface<int>().kind() == value_kind::INTEGER);
    REQUIRE(get_type_interface<uint16_t>().kind() == value_kind::INTEGER);
    REQUIRE(get_type_interface<float>().kind() == value_kind::FLOAT);
    REQUIRE(get_type_interface<string>().kind() == value_kind::STRING);
    REQUIRE(get_type_interface<ptime>().kind() == value_kind::DATETIME);
    REQUIRE(get_type_interface<user>().kind() == value_kind::STRUCTURE);
    REQUIRE(
        get_type_interface<std::vector<int>>().kind() == value_kind::ARRAY);
    REQUIRE(
        (get_type_interface<std::array<int, 3>>().kind()
         == value_kind::ARRAY));
    REQUIRE(
        (get_type_interface<std::map<string, int>>().kind()
         == value_kind::MAP));
    REQUIRE(get_type_interface<int*>().kind() == value_kind::POINTER);
    REQUIRE(
        get_type_interface<std::shared_ptr<profile>>().kind()
        == value_kind::POINTER);
    REQUIRE(get_type_interface<dynamic>().kind() == value_kind::DYNAMIC);

    REQUIRE(is_primitive_kind(value_kind::STRING));
    REQUIRE(!is_primitive_kind(value_kind::DATETIME));
    REQUIRE(is_scalar_kind(value_kind::DATETIME));
    REQUIRE(!is_scalar_kind(value_kind::ARRAY));
}

TEST_CASE("external field names", "[core][reflection]")
{
    REQUIRE(to_snake_case("Name") == "name");
    REQUIRE(to_snake_case("CreatedAt") == "created_at");
    REQUIRE(to_snake_case("UserID") == "user_i_d");
    REQUIRE(to_snake_case("") == "");

    REQUIRE(
        resolve_external_name("Email", "email_address,omitempty")
        == "email_address");
    REQUIRE(resolve_external_name("Email", ",omitempty") == "email");
    REQUIRE(resolve_external_name("ZipCode", "") == "zip_code");
    REQUIRE(resolve_external_name("Secret", "-") == "-");
}

TEST_CASE("structure fields", "[core][reflection]")
{
    auto const& type = static_cast<structure_interface const&>(
        get_type_interface<user>());
    REQUIRE(type.fields().size() == 9);

    auto email = type.find_field("Email");
    REQUIRE(email);
    REQUIRE(email->external_name == "email_address");
    REQUIRE(email->tag == "email_address,omitempty");
    REQUIRE(!email->is_skipped());

    auto secret = type.find_field("Secret");
    REQUIRE(secret);
    REQUIRE(secret->is_skipped());

    REQUIRE(!type.find_field("email_address"));

    user u;
    u.age = 31;
    auto age = type.find_field("Age")->in(&u);
    REQUIRE(age.object == &u.age);
    REQUIRE(age.type->kind() == value_kind::INTEGER);
}

TEST_CASE("zero values", "[core][reflection]")
{
    user u;
    REQUIRE(get_type_interface<user>().is_zero(&u));
    u.home.city = "Paris";
    REQUIRE(!get_type_interface<user>().is_zero(&u));

    REQUIRE(get_type_interface<ptime>().is_zero(&u.created_at));

    std::array<int, 3> levels = {{0, 0, 0}};
    REQUIRE(get_type_interface<std::array<int, 3>>().is_zero(&levels));
    levels[1] = 2;
    REQUIRE(!get_type_interface<std::array<int, 3>>().is_zero(&levels));

    std::vector<int> numbers;
    REQUIRE(get_type_interface<std::vector<int>>().is_zero(&numbers));

    int* p = nullptr;
    REQUIRE(get_type_interface<int*>().is_zero(&p));
}

TEST_CASE("skipped fields in comparisons", "[core][reflection]")
{
    auto const& type = get_type_interface<user>();
    user a, b;
    b.secret = "hidden";
    REQUIRE(type.is_zero(&b));
    REQUIRE(type.equals(&a, &b));
    b.name = "John";
    REQUIRE(!type.equals(&a, &b));
}

TEST_CASE("boolean vectors", "[core][reflection]")
{
    auto const& type = static_cast<array_interface const&>(
        get_type_interface<std::vector<bool>>());
    REQUIRE(type.kind() == value_kind::ARRAY);

    std::vector<bool> flags{true, false, true};
    REQUIRE(type.size(&flags) == 3);
    auto first = type.element(&flags, 0);
    REQUIRE(first.type->kind() == value_kind::BOOLEAN);
    REQUIRE(*static_cast<bool const*>(first.object));
    REQUIRE(!*static_cast<bool const*>(type.element(&flags, 1).object));

    std::vector<bool> other{true, false, false};
    REQUIRE(!type.equals(&flags, &other));
    other[2] = true;
    REQUIRE(type.equals(&flags, &other));
    REQUIRE(
        type.as_dynamic(&flags) == dynamic(dynamic{true, false, true}));

    std::vector<bool> empty;
    REQUIRE(type.is_zero(&empty));
    REQUIRE(!type.is_zero(&flags));
}

TEST_CASE("structure conversion to dynamic", "[core][reflection]")
{
    user u;
    u.name = "John";
    u.age = 25;
    u.tags = {"a"};
    u.secret = "hidden";

    auto v = get_type_interface<user>().as_dynamic(&u);
    auto const& m = cast<dynamic_map>(v);
    REQUIRE(m.size() == 8);
    REQUIRE(get_field(m, "name") == dynamic("John"));
    REQUIRE(get_field(m, "age") == dynamic(integer(25)));
    REQUIRE(get_field(m, "email_address") == dynamic(""));
    REQUIRE(get_field(m, "created_at") == dynamic(ptime()));
    REQUIRE(
        get_field(m, "tags") == dynamic(dynamic_array{dynamic("a")}));
    REQUIRE(
        get_field(m, "home")
        == dynamic({{"street", ""}, {"city", ""}, {"zip_code", ""}}));
    REQUIRE(get_field(m, "metadata") == dynamic(dynamic_map()));
    REQUIRE(m.find(dynamic("secret")) == m.end());
}

TEST_CASE("less common field types", "[core][reflection]")
{
    settings s;
    s.levels = {{1, 2, 3}};
    s.weights["x"] = 0.5;
    s.extra = dynamic{{"k", true}};
    s.ratio = 0.25f;
    s.port = 8080;

    auto v = get_type_interface<settings>().as_dynamic(&s);
    auto const& m = cast<dynamic_map>(v);
    REQUIRE(get_field(m, "levels") == dynamic{1, 2, 3});
    REQUIRE(get_field(m, "weights") == dynamic{{"x", 0.5}});
    REQUIRE(get_field(m, "extra") == dynamic{{"k", true}});
    REQUIRE(get_field(m, "ratio") == dynamic(0.25));
    REQUIRE(get_field(m, "port") == dynamic(integer(8080)));

    settings t = s;
    REQUIRE(get_type_interface<settings>().equals(&s, &t));
    t.weights["x"] = 0.75;
    REQUIRE(!get_type_interface<settings>().equals(&s, &t));
}

TEST_CASE("pointer equality", "[core][reflection]")
{
    int a = 1, b = 1, c = 2;
    int* pa = &a;
    int* pb = &b;
    int* pc = &c;
    int* null = nullptr;
    auto const& type = get_type_interface<int*>();
    REQUIRE(type.equals(&pa, &pb));
    REQUIRE(!type.equals(&pa, &pc));
    REQUIRE(!type.equals(&pa, &null));
    REQUIRE(type.equals(&null, &null));

    auto x = std::make_shared<profile>(profile{"bio"});
    auto y = std::make_shared<profile>(profile{"bio"});
    REQUIRE(get_type_interface<std::shared_ptr<profile>>().equals(&x, &y));
}

TEST_CASE("cyclic graphs", "[core][reflection]")
{
    node a, b;
    a.value = 1;
    a.next = &a;
    b.value = 1;
    b.next = &b;

    // Comparison terminates and treats the cycles as equal.
    REQUIRE(get_type_interface<node>().equals(&a, &b));
    b.value = 2;
    REQUIRE(!get_type_interface<node>().equals(&a, &b));

    // Conversion can't represent them.
    try
    {
        get_type_interface<node>().as_dynamic(&a);
        FAIL("no exception thrown");
    }
    catch (cyclic_value_graph& e)
    {
        REQUIRE(
            get_required_error_info<type_name_info>(e)
            == get_type_interface<node>().name());
    }
}

TEST_CASE("dynamic resolution", "[core][reflection]")
{
    dynamic nothing;
    REQUIRE(resolve(make_value_ref(nothing)).is_absent());
    REQUIRE(resolve(make_value_ref(nil)).is_absent());

    dynamic n(integer(3));
    auto r = resolve(make_value_ref(n));
    REQUIRE(!r.is_absent());
    REQUIRE(r.type->kind() == value_kind::INTEGER);
    REQUIRE(r.type->id() == std::type_index(typeid(integer)));

    dynamic m{{"a", 1}};
    auto rm = resolve(make_value_ref(m));
    REQUIRE(rm.type->kind() == value_kind::MAP);
    auto const& map_type = static_cast<map_interface const&>(*rm.type);
    REQUIRE(map_type.keys(rm.object) == std::vector<string>{"a"});
    REQUIRE(map_type.find(rm.object, "b").is_absent());
    REQUIRE(
        resolve(map_type.find(rm.object, "a")).type->kind()
        == value_kind::INTEGER);
}

TEST_CASE("dynamic maps with non-string keys", "[core][reflection]")
{
    dynamic_map m{{dynamic(integer(1)), dynamic(true)}};
    auto const& type = static_cast<map_interface const&>(
        get_type_interface<dynamic_map>());
    try
    {
        type.keys(&m);
        FAIL("no exception thrown");
    }
    catch (unsupported_map_key& e)
    {
        REQUIRE(
            get_required_error_info<map_key_type_info>(e)
            == value_type::INTEGER);
    }
}
