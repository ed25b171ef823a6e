#ifndef DOCPATCH_CORE_TESTING_H
#define DOCPATCH_CORE_TESTING_H

#include <catch2/catch.hpp>

#include <docpatch/core/dynamic.h>

namespace docpatch {

// Test that converting :x to a dynamic produces :expected and that converting
// it back produces an equal value.
template<class T>
void
test_dynamic_conversion(T const& x, dynamic const& expected)
{
    dynamic v;
    to_dynamic(&v, x);
    REQUIRE(v == expected);

    T y;
    from_dynamic(&y, v);
    REQUIRE(y == x);
}

} // namespace docpatch

#endif
