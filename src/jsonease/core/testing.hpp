#ifndef JSONEASE_CORE_TESTING_HPP
#define JSONEASE_CORE_TESTING_HPP

#include <catch2/catch.hpp>

#include <jsonease/core/type_interfaces.hpp>

namespace jsonease {

// Test that a type correctly implements the regular type interface for the
// given value: copying, assignment and swapping should all behave like they do
// for built-in values, and the value should survive a trip through dynamic.
template<class T>
void
test_regular_value(T const& x)
{
    {
        INFO("Copy construction should produce an equal value.")
        T y = x;
        REQUIRE(y == x);
    }

    {
        INFO("Assignment should produce an equal value.")
        T y;
        y = x;
        REQUIRE(y == x);
    }

    {
        INFO("std::swap should swap values.")

        T default_initialized = T();

        T y = x;
        T z = default_initialized;
        REQUIRE(y == x);
        REQUIRE(z == default_initialized);

        using std::swap;
        swap(y, z);
        REQUIRE(z == x);
        REQUIRE(y == default_initialized);

        INFO("A second std::swap should restore the original values.")
        swap(y, z);
        REQUIRE(y == x);
        REQUIRE(z == default_initialized);
    }

    {
        INFO(
            "Conversion to jsonease::dynamic and then back should produce an "
            "equal value.")
        jsonease::dynamic v;
        to_dynamic(&v, x);
        T y;
        from_dynamic(&y, v);
        REQUIRE(y == x);
    }
}

// Same as above, but for a pair of different values.
template<class T>
void
test_regular_value_pair(T const& x, T const& y)
{
    test_regular_value(x);
    test_regular_value(y);

    REQUIRE(x != y);
    REQUIRE(!(x == y));

    using std::swap;
    T a = x;
    T b = y;
    swap(a, b);
    REQUIRE(a == y);
    REQUIRE(b == x);
}

} // namespace jsonease

#endif
