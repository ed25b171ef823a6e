#include <docpatch/diff/diff.h>

#include <docpatch/core/testing.h>

#include "../test_types.h"

using namespace docpatch;

TEST_CASE("identical structures", "[diff][structs]")
{
    user u;
    u.name = "John";
    u.age = 25;
    u.tags = {"a", "b"};
    u.metadata["k"] = "v";
    for (auto strategy :
         {array_strategy::REPLACE,
          array_strategy::SMART,
          array_strategy::APPEND,
          array_strategy::MERGE})
    {
        diff_config config;
        config.arrays = strategy;
        auto p = compute_patch(u, u, config);
        REQUIRE(p.is_empty());
        REQUIRE(!p.has_array_filters());
        REQUIRE(p.metadata().total_changes == 0);
    }
}

TEST_CASE("changed structure field", "[diff][structs]")
{
    user old_user;
    old_user.name = "John";
    old_user.age = 25;
    user new_user = old_user;
    new_user.age = 26;

    auto p = compute_patch(old_user, new_user);
    REQUIRE(to_dynamic(p) == dynamic({{"$set", {{"age", 26}}}}));
    REQUIRE(p.metadata().fields_changed == std::vector<string>{"age"});
    REQUIRE(p.metadata().operation_types.at("age") == "$set");
    REQUIRE(p.metadata().total_changes == 1);
}

TEST_CASE("nested structure fields", "[diff][structs]")
{
    user old_user;
    old_user.home.city = "Paris";
    user new_user = old_user;
    new_user.home.city = "Lyon";
    new_user.home.zip_code = "69001";

    auto p = compute_patch(old_user, new_user);
    REQUIRE(
        to_dynamic(p)
        == dynamic(
            {{"$set", {{"home.city", "Lyon"}, {"home.zip_code", "69001"}}}}));
}

TEST_CASE("tagged and skipped fields", "[diff][structs]")
{
    user old_user;
    user new_user;
    new_user.email = "john@example.com";
    new_user.secret = "changed";

    auto p = compute_patch(old_user, new_user);
    REQUIRE(
        to_dynamic(p)
        == dynamic({{"$set", {{"email_address", "john@example.com"}}}}));
}

TEST_CASE("structure added", "[diff][structs]")
{
    user u;
    u.name = "John";
    u.age = 30;
    u.home.city = "Paris";

    auto p = compute_patch(nil, u);
    REQUIRE(
        to_dynamic(p)
        == dynamic(
            {{"$set", {{"name", "John"}, {"age", 30}, {"home.city", "Paris"}}}}));
    REQUIRE(
        p.metadata().fields_changed
        == (std::vector<string>{"name", "age", "home.city"}));
}

TEST_CASE("structure removed", "[diff][structs]")
{
    user u;
    u.name = "John";
    u.age = 30;
    u.home.city = "Paris";

    auto p = compute_patch(u, nil);
    REQUIRE(
        to_dynamic(p)
        == dynamic(
            {{"$unset", {{"name", ""}, {"age", ""}, {"home.city", ""}}}}));
}

TEST_CASE("added and removed structures mirror each other", "[diff][structs]")
{
    user u;
    u.name = "John";
    u.email = "john@example.com";
    u.active = true;
    u.home.street = "Main";

    auto added = compute_patch(nil, u);
    auto removed = compute_patch(u, nil);
    REQUIRE(added.metadata().fields_changed
            == removed.metadata().fields_changed);
    for (auto const& path : removed.metadata().fields_changed)
        REQUIRE(removed.metadata().operation_types.at(path) == "$unset");
}

TEST_CASE("removed containers are unset whole", "[diff][structs]")
{
    user u;
    u.tags = {"x"};
    u.metadata["k"] = "v";

    auto p = compute_patch(u, nil);
    REQUIRE(
        to_dynamic(p)
        == dynamic({{"$unset", {{"tags", ""}, {"metadata", ""}}}}));
}

TEST_CASE("ignored fields", "[diff][structs]")
{
    user old_user;
    user new_user;
    new_user.name = "John";
    new_user.email = "john@example.com";
    new_user.home.city = "Paris";
    new_user.home.street = "Main";

    SECTION("by declared name")
    {
        diff_config config;
        config.ignore_fields = {"Email"};
        auto p = compute_patch(old_user, new_user, config);
        REQUIRE(
            to_dynamic(p)
            == dynamic(
                {{"$set",
                  {{"name", "John"},
                   {"home.city", "Paris"},
                   {"home.street", "Main"}}}}));
    }
    SECTION("by external name")
    {
        diff_config config;
        config.ignore_fields = {"email_address", "name"};
        auto p = compute_patch(old_user, new_user, config);
        REQUIRE(
            to_dynamic(p)
            == dynamic(
                {{"$set", {{"home.city", "Paris"}, {"home.street", "Main"}}}}));
    }
    SECTION("by path")
    {
        diff_config config;
        config.ignore_fields = {"home.city"};
        auto p = compute_patch(old_user, new_user, config);
        REQUIRE(
            to_dynamic(p)
            == dynamic(
                {{"$set",
                  {{"name", "John"},
                   {"email_address", "john@example.com"},
                   {"home.street", "Main"}}}}));
    }
    SECTION("whole structures")
    {
        diff_config config;
        config.ignore_fields = {"home"};
        auto p = compute_patch(old_user, new_user, config);
        REQUIRE(p.metadata().fields_changed
                == (std::vector<string>{"name", "email_address"}));
    }
}

TEST_CASE("ignored fields are never unset", "[diff][structs]")
{
    user u;
    u.name = "John";
    u.age = 30;
    diff_config config;
    config.ignore_fields = {"age"};
    auto p = compute_patch(u, nil, config);
    REQUIRE(to_dynamic(p) == dynamic({{"$unset", {{"name", ""}}}}));
}

TEST_CASE("structure type mismatch", "[diff][structs]")
{
    user u;
    team t;
    try
    {
        compute_patch(u, t);
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(get_required_error_info<field_path_info>(e) == "");
        REQUIRE(
            get_required_error_info<old_type_info>(e)
            == get_type_interface<user>().name());
        REQUIRE(
            get_required_error_info<new_type_info>(e)
            == get_type_interface<team>().name());
    }
}

TEST_CASE("both sides absent", "[diff][structs]")
{
    REQUIRE_THROWS_AS(compute_patch(nil, nil), nil_pair);
    dynamic a, b;
    REQUIRE_THROWS_AS(compute_patch(a, b), nil_pair);
}
