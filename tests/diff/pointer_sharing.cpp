#include <docpatch/diff/diff.h>
#include <docpatch/diff/pointer_tracker.h>

#include <docpatch/core/testing.h>

#include "../test_types.h"

using namespace docpatch;

TEST_CASE("tracking pointers", "[diff][pointer_sharing]")
{
    int x = 1, y = 2;
    std::vector<int*> pointers{&x, nullptr, &y};
    std::map<string, int*> named{{"first", &x}};

    pointer_tracker tracker;
    tracker.track(true, make_value_ref(pointers));
    tracker.track(false, make_value_ref(named));
    REQUIRE(tracker.is_tracked(true, &x));
    REQUIRE(tracker.is_tracked(true, &y));
    REQUIRE(!tracker.is_tracked(false, &y));

    auto sharing = tracker.find_sharing();
    REQUIRE(sharing);
    REQUIRE(sharing->address == &x);
    REQUIRE(sharing->old_path == "[0]");
    REQUIRE(sharing->new_path == "first");
}

TEST_CASE("tracking cyclic graphs", "[diff][pointer_sharing]")
{
    node a, b;
    a.next = &b;
    b.next = &a;

    pointer_tracker tracker;
    tracker.track(true, make_value_ref(a));
    REQUIRE(tracker.is_tracked(true, &a));
    REQUIRE(tracker.is_tracked(true, &b));
    REQUIRE(!tracker.find_sharing());
}

TEST_CASE("tracking absent values", "[diff][pointer_sharing]")
{
    pointer_tracker tracker;
    tracker.track(true, value_ref());
    tracker.track(false, make_value_ref(dynamic()));
    REQUIRE(!tracker.find_sharing());
}

TEST_CASE("describing pointer sharing", "[diff][pointer_sharing]")
{
    pointer_sharing sharing{nullptr, "a", "b"};
    auto description = describe_pointer_sharing(sharing);
    REQUIRE(description.find("old field 'a'") != string::npos);
    REQUIRE(description.find("new field 'b'") != string::npos);
    REQUIRE(
        description.find("point to the same memory location")
        != string::npos);
}

TEST_CASE("detecting shared pointees", "[diff][pointer_sharing]")
{
    int score = 10;
    account old_account, new_account;
    old_account.user_id = "u1";
    new_account.user_id = "u2";
    old_account.score = &score;
    new_account.score = &score;

    diff_config config;
    config.detect_pointer_sharing = true;
    try
    {
        compute_patch(old_account, new_account, config);
        FAIL("no exception thrown");
    }
    catch (pointer_sharing_detected& e)
    {
        REQUIRE(get_required_error_info<field_path_info>(e) == "score");
        REQUIRE(get_required_error_info<old_field_path_info>(e) == "score");
        REQUIRE(
            get_required_error_info<pointer_address_info>(e)
            == reinterpret_cast<uintptr_t>(&score));
    }

    // Without detection, the diff goes ahead.
    config.detect_pointer_sharing = false;
    auto p = compute_patch(old_account, new_account, config);
    REQUIRE(to_dynamic(p) == dynamic({{"$set", {{"user_i_d", "u2"}}}}));
}

TEST_CASE("reporting the first shared pointee", "[diff][pointer_sharing]")
{
    int score = 10;
    auto details = std::make_shared<profile>(profile{"bio"});
    account old_account, new_account;
    old_account.details = details;
    new_account.details = details;
    old_account.score = &score;
    new_account.score = &score;

    diff_config config;
    config.detect_pointer_sharing = true;
    try
    {
        compute_patch(old_account, new_account, config);
        FAIL("no exception thrown");
    }
    catch (pointer_sharing_detected& e)
    {
        REQUIRE(get_required_error_info<field_path_info>(e) == "details");
    }
}

TEST_CASE("distinct pointees aren't shared", "[diff][pointer_sharing]")
{
    int old_score = 10, new_score = 10;
    account old_account, new_account;
    old_account.score = &old_score;
    new_account.score = &new_score;

    diff_config config;
    config.detect_pointer_sharing = true;
    REQUIRE(compute_patch(old_account, new_account, config).is_empty());
}
