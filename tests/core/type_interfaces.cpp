#include <jsonease/core/type_interfaces.hpp>

#include <boost/uuid/string_generator.hpp>

#include <jsonease/core/testing.hpp>

using namespace jsonease;

TEST_CASE("bool type interface", "[core][types]")
{
    test_regular_value_pair(false, true);
}

template<class Integer>
void
test_integer_interface()
{
    test_regular_value_pair(Integer(0), Integer(1));

    REQUIRE(to_dynamic(Integer(7)) == dynamic(integer(7)));
}

TEST_CASE("integer type interfaces", "[core][types]")
{
    test_integer_interface<signed char>();
    test_integer_interface<unsigned char>();
    test_integer_interface<signed short>();
    test_integer_interface<unsigned short>();
    test_integer_interface<signed int>();
    test_integer_interface<unsigned int>();
    test_integer_interface<signed long>();
    test_integer_interface<unsigned long>();
    test_integer_interface<signed long long>();
    test_integer_interface<unsigned long long>();
}

TEST_CASE("integer range checking", "[core][types]")
{
    REQUIRE_THROWS(from_dynamic<unsigned char>(dynamic(integer(256))));
    REQUIRE_THROWS(from_dynamic<unsigned int>(dynamic(integer(-1))));
    // Floats are accepted if they convert.
    REQUIRE(from_dynamic<int>(dynamic(3.0)) == 3);
}

template<class Float>
void
test_float_interface()
{
    test_regular_value_pair(Float(0.5), Float(1.5));
}

TEST_CASE("floating point type interfaces", "[core][types]")
{
    test_float_interface<float>();
    test_float_interface<double>();

    // Integers are accepted as floats.
    REQUIRE(from_dynamic<double>(dynamic(integer(2))) == 2.0);
}

TEST_CASE("string type interface", "[core][types]")
{
    test_regular_value_pair(string("hello"), string("world!"));

    REQUIRE_THROWS_AS(from_dynamic<string>(dynamic(false)), type_mismatch);
}

TEST_CASE("extended scalar type interfaces", "[core][types]")
{
    test_regular_value_pair(
        date(2017, boost::gregorian::Apr, 26),
        date(2017, boost::gregorian::Apr, 27));

    test_regular_value_pair(
        time_of_day(10, 53, 22), time_of_day(10, 53, 23));

    test_regular_value_pair(complex(1, 2), complex(1, 3));

    boost::uuids::string_generator generate;
    test_regular_value_pair(
        generate("6e57b1c6-4ef5-4d8b-9a34-c91b65b8cbd9"),
        generate("6e57b1c6-4ef5-4d8b-9a34-c91b65b8cbda"));

    datetime t;
    t.local = boost::posix_time::ptime(
        date(2017, boost::gregorian::Nov, 20), time_of_day(10, 53, 22));
    t.utc_offset = -300;
    REQUIRE(from_dynamic<datetime>(to_dynamic(t)) == t);

    range r;
    r.start = integer(1);
    r.stop = integer(5);
    REQUIRE(from_dynamic<range>(to_dynamic(r)) == r);
}

TEST_CASE("vector interface", "[core][types]")
{
    std::vector<integer> x{1, 2, 3};
    dynamic v = to_dynamic(x);
    REQUIRE(v.type() == value_type::ARRAY);
    REQUIRE(v == dynamic({integer(1), integer(2), integer(3)}));
    REQUIRE(from_dynamic<std::vector<integer>>(v) == x);

    // Element errors report their position.
    try
    {
        from_dynamic<std::vector<integer>>(
            dynamic({integer(1), string("two")}));
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<dynamic_value_path_info>(e)
            == std::list<dynamic>({dynamic(integer(1))}));
    }
}

TEST_CASE("other containers map to sequences", "[core][types]")
{
    auto expected = dynamic_sequence{
        dynamic_array{dynamic(integer(1)), dynamic(integer(2))}};

    REQUIRE(to_dynamic(std::list<integer>{1, 2}) == dynamic(expected));
    REQUIRE(to_dynamic(std::deque<integer>{1, 2}) == dynamic(expected));
    REQUIRE(to_dynamic(std::set<integer>{2, 1}) == dynamic(expected));
    REQUIRE(
        to_dynamic(std::array<integer, 2>{{1, 2}}) == dynamic(expected));

    // Sequences can be read back as vectors.
    REQUIRE(
        from_dynamic<std::vector<integer>>(dynamic(expected))
        == std::vector<integer>({1, 2}));
}

TEST_CASE("maps map to mappings", "[core][types]")
{
    std::map<string, integer> x{{"b", 2}, {"a", 1}};
    dynamic v = to_dynamic(x);
    REQUIRE(v.type() == value_type::MAPPING);
    // std::map enumerates in key order.
    auto const& entries = cast<dynamic_mapping>(v).entries;
    REQUIRE(entries.begin()->first == "a");
    REQUIRE((from_dynamic<std::map<string, integer>>(v)) == x);
}

TEST_CASE("optional interface", "[core][types]")
{
    REQUIRE(to_dynamic(optional<integer>()) == dynamic(nil));
    REQUIRE(to_dynamic(some(integer(4))) == dynamic(integer(4)));

    auto absent = from_dynamic<optional<integer>>(dynamic(nil));
    REQUIRE(!absent);
    auto present = from_dynamic<optional<integer>>(dynamic(integer(4)));
    REQUIRE(bool(present));
    REQUIRE(*present == 4);
}
