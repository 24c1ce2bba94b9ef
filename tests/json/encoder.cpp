#include <jsonease/json/encoder.hpp>

#include <deque>
#include <limits>

#include <boost/uuid/string_generator.hpp>

#include <jsonease/core/testing.hpp>

using namespace jsonease;

static string
encode(dynamic const& value, chain_tier tier = chain_tier::BASIC)
{
    return make_encoder(tier).encode(value);
}

static string
float_text(double x)
{
    string out;
    write_float(out, x);
    return out;
}

TEST_CASE("scalar encoding", "[json][encoder]")
{
    REQUIRE(encode(nil) == "null");
    REQUIRE(encode(true) == "true");
    REQUIRE(encode(false) == "false");
    REQUIRE(encode(integer(123)) == "123");
    REQUIRE(encode(integer(-123)) == "-123");
    REQUIRE(encode(integer(0)) == "0");
    REQUIRE(encode(0.123) == "0.123");
    REQUIRE(encode("123") == "\"123\"");
    REQUIRE(encode("123\n456") == "\"123\\n456\"");
}

TEST_CASE("float text", "[json][encoder]")
{
    REQUIRE(float_text(0.) == "0.0");
    REQUIRE(float_text(-0.) == "-0.0");
    REQUIRE(float_text(1.) == "1.0");
    REQUIRE(float_text(5.) == "5.0");
    REQUIRE(float_text(100.) == "100.0");
    REQUIRE(float_text(-2.5) == "-2.5");
    REQUIRE(float_text(0.1) == "0.1");
    REQUIRE(float_text(0.0001) == "0.0001");
    REQUIRE(float_text(0.00001) == "1e-05");
    REQUIRE(float_text(1.5e-7) == "1.5e-07");
    REQUIRE(float_text(123456.789) == "123456.789");
    REQUIRE(float_text(1e15) == "1000000000000000.0");
    REQUIRE(float_text(1e16) == "1e+16");
    REQUIRE(float_text(1.25e22) == "1.25e+22");
    REQUIRE(float_text(1e-300) == "1e-300");
    REQUIRE(float_text(0.1 + 0.2) == "0.30000000000000004");
}

TEST_CASE("string escaping", "[json][encoder]")
{
    string out;
    write_json_string(out, "quote\" backslash\\ slash/");
    REQUIRE(out == "\"quote\\\" backslash\\\\ slash/\"");

    out.clear();
    write_json_string(out, "\b\f\n\r\t");
    REQUIRE(out == "\"\\b\\f\\n\\r\\t\"");

    // Other control characters get \u escapes.
    out.clear();
    write_json_string(out, string("\x01\x1f\0", 3));
    REQUIRE(out == "\"\\u0001\\u001f\\u0000\"");

    // Non-ASCII characters are written as they are.
    out.clear();
    write_json_string(out, "caf\xc3\xa9");
    REQUIRE(out == "\"caf\xc3\xa9\"");
}

TEST_CASE("container encoding", "[json][encoder]")
{
    REQUIRE(encode(dynamic_array()) == "[]");
    REQUIRE(
        encode(dynamic_array{dynamic("abc"), dynamic(true)})
        == "[\"abc\", true]");

    REQUIRE(encode(dynamic_object()) == "{}");
    REQUIRE(encode(dynamic_object{{"abc", dynamic(true)}}) == "{\"abc\": true}");
    REQUIRE(
        encode(dynamic_object{
            {"def", dynamic(dynamic_array{dynamic(false)})}})
        == "{\"def\": [false]}");

    // Keys are written in insertion order.
    REQUIRE(
        encode(dynamic_object{
            {"z", dynamic(integer(1))},
            {"a", dynamic(nil)},
            {"m", dynamic(dynamic_object())}})
        == "{\"z\": 1, \"a\": null, \"m\": {}}");

    // Keys are escaped like any other string.
    REQUIRE(
        encode(dynamic_object{{"h\naha", dynamic(integer(1))}})
        == "{\"h\\naha\": 1}");
}

TEST_CASE("non-finite floats", "[json][encoder]")
{
    for (auto tier :
         {chain_tier::BASIC, chain_tier::ADVANCED, chain_tier::CUSTOM})
    {
        try
        {
            encode(std::numeric_limits<double>::quiet_NaN(), tier);
            FAIL("no exception thrown");
        }
        catch (unsupported_type& e)
        {
            REQUIRE(
                get_required_error_info<value_type_info>(e)
                == value_type::FLOAT);
            REQUIRE(
                get_required_error_info<unsupported_reason_info>(e)
                == "non-finite floats have no JSON representation");
        }
        REQUIRE_THROWS_AS(
            encode(std::numeric_limits<double>::infinity(), tier),
            unsupported_type);
    }
    REQUIRE_THROWS_AS(
        encode(
            complex(1, std::numeric_limits<double>::infinity()),
            chain_tier::ADVANCED),
        unsupported_type);
}

TEST_CASE("basic tier rejects extended values", "[json][encoder]")
{
    try
    {
        encode(date(2017, boost::gregorian::Apr, 26));
        FAIL("no exception thrown");
    }
    catch (unsupported_type& e)
    {
        REQUIRE(
            get_required_error_info<value_type_info>(e) == value_type::DATE);
        REQUIRE(get_required_error_info<chain_tier_info>(e) == "basic");
    }

    REQUIRE_THROWS_AS(encode(complex(1, 2)), unsupported_type);
    REQUIRE_THROWS_AS(
        encode(dynamic_sequence{dynamic_array{dynamic(integer(1))}}),
        unsupported_type);
    // Unsupported items are found inside containers too.
    REQUIRE_THROWS_AS(
        encode(dynamic_array{dynamic(integer(1)), dynamic(complex(1, 2))}),
        unsupported_type);

    string out;
    REQUIRE(!make_encoder(chain_tier::BASIC).try_write(out, complex(1, 2)));
    REQUIRE(out.empty());
}

TEST_CASE("advanced scalar encoding", "[json][encoder]")
{
    boost::uuids::string_generator generate;
    REQUIRE(
        encode(
            generate("7D444840-9DC0-11D1-B245-5FFDCE74FAD2"),
            chain_tier::ADVANCED)
        == "\"7d444840-9dc0-11d1-b245-5ffdce74fad2\"");

    REQUIRE(
        encode(complex(2, 3), chain_tier::ADVANCED)
        == "{\"real\": 2.0, \"imag\": 3.0}");

    REQUIRE(
        encode(
            range{dynamic(integer(1)), dynamic(integer(5)), dynamic(integer(2))},
            chain_tier::ADVANCED)
        == "{\"start\": 1, \"stop\": 5, \"step\": 2}");
    REQUIRE(
        encode(range{dynamic(), dynamic(2.5), dynamic()}, chain_tier::ADVANCED)
        == "{\"start\": null, \"stop\": 2.5, \"step\": null}");

    REQUIRE(
        encode(date(2017, boost::gregorian::Apr, 6), chain_tier::ADVANCED)
        == "\"2017-04-06\"");
    REQUIRE(
        encode(time_of_day(10, 53, 22), chain_tier::ADVANCED)
        == "\"10:53:22\"");

    datetime t;
    t.local = boost::posix_time::ptime(
        date(2017, boost::gregorian::Nov, 20), time_of_day(10, 53, 22));
    t.utc_offset = -300;
    REQUIRE(
        encode(t, chain_tier::ADVANCED) == "\"2017-11-20T10:53:22-05:00\"");
}

TEST_CASE("advanced values without a JSON form", "[json][encoder]")
{
    // Ranges with non-numeric bounds wouldn't be recognized again.
    try
    {
        encode(
            range{dynamic("a"), dynamic(integer(5)), dynamic()},
            chain_tier::ADVANCED);
        FAIL("no exception thrown");
    }
    catch (unsupported_type& e)
    {
        REQUIRE(
            get_required_error_info<value_type_info>(e) == value_type::RANGE);
    }
    REQUIRE_THROWS_AS(
        encode(
            range{dynamic(), dynamic(integer(5)), dynamic(dynamic_array())},
            chain_tier::ADVANCED),
        unsupported_type);

    // Times must fall within a single day.
    REQUIRE_THROWS_AS(
        encode(time_of_day(30, 0, 0), chain_tier::ADVANCED),
        unsupported_type);
    REQUIRE_THROWS_AS(
        encode(time_of_day(24, 0, 0), chain_tier::ADVANCED),
        unsupported_type);
    REQUIRE_THROWS_AS(
        encode(time_of_day(-1, 0, 0), chain_tier::ADVANCED),
        unsupported_type);
    REQUIRE_THROWS_AS(
        encode(
            time_of_day(boost::posix_time::not_a_date_time),
            chain_tier::ADVANCED),
        unsupported_type);
    REQUIRE(
        encode(time_of_day(23, 59, 59), chain_tier::ADVANCED)
        == "\"23:59:59\"");

    REQUIRE_THROWS_AS(
        encode(date(boost::gregorian::not_a_date_time), chain_tier::ADVANCED),
        unsupported_type);

    datetime unset;
    REQUIRE(unset.local.is_not_a_date_time());
    REQUIRE_THROWS_AS(encode(unset, chain_tier::ADVANCED), unsupported_type);

    datetime far;
    far.local = boost::posix_time::ptime(
        date(2017, boost::gregorian::Nov, 20), time_of_day(10, 53, 22));
    far.utc_offset = 24 * 60;
    REQUIRE_THROWS_AS(encode(far, chain_tier::ADVANCED), unsupported_type);
}

TEST_CASE("advanced container encoding", "[json][encoder]")
{
    std::deque<dynamic> items{
        dynamic(false),
        dynamic(integer(123)),
        dynamic(dynamic_mapping()),
        dynamic(complex(5, 5)),
        dynamic(dynamic_mapping{dynamic_object{
            {"haha", dynamic(complex(2, 3))},
            {"toto",
             dynamic(dynamic_array{
                 dynamic(false),
                 dynamic(dynamic_object{{"nini", dynamic("xixi")}})})}}}),
        dynamic(true)};

    REQUIRE(
        encode(to_dynamic(items), chain_tier::ADVANCED)
        == "[false, 123, {}, {\"real\": 5.0, \"imag\": 5.0}, {\"haha\": "
           "{\"real\": 2.0, \"imag\": 3.0}, \"toto\": [false, {\"nini\": "
           "\"xixi\"}]}, true]");

    std::map<string, integer> scores{{"alice", 3}, {"bob", 4}};
    REQUIRE(
        encode(to_dynamic(scores), chain_tier::ADVANCED)
        == "{\"alice\": 3, \"bob\": 4}");
}

namespace {

// a structure that only exposes its fields
struct plain_structure : structure
{
    string
    type_name() const override
    {
        return "plain";
    }

    dynamic_object
    fields() const override
    {
        return dynamic_object{{"a", dynamic(integer(1))}};
    }
};

// a structure that supplies an equivalent state
struct stateful_structure : plain_structure
{
    optional<dynamic>
    equivalent_state() const override
    {
        return dynamic(dynamic_array{dynamic("state")});
    }
};

// a structure that writes its own JSON
struct self_writing_structure : plain_structure
{
    optional<string>
    to_json() const override
    {
        return string("\"self\"");
    }
};

} // namespace

TEST_CASE("structure encoding", "[json][encoder]")
{
    REQUIRE(
        encode(make_structure<plain_structure>(), chain_tier::CUSTOM)
        == "{\"a\": 1}");
    REQUIRE(
        encode(make_structure<stateful_structure>(), chain_tier::CUSTOM)
        == "[\"state\"]");
    REQUIRE(
        encode(make_structure<self_writing_structure>(), chain_tier::CUSTOM)
        == "\"self\"");

    try
    {
        encode(make_structure<plain_structure>(), chain_tier::ADVANCED);
        FAIL("no exception thrown");
    }
    catch (unsupported_type& e)
    {
        REQUIRE(
            get_required_error_info<value_type_info>(e)
            == value_type::STRUCTURE);
        REQUIRE(get_required_error_info<chain_tier_info>(e) == "advanced");
    }

    // An empty structure pointer has nothing to encode.
    try
    {
        encode(dynamic(structure_ptr()), chain_tier::CUSTOM);
        FAIL("no exception thrown");
    }
    catch (unsupported_type& e)
    {
        REQUIRE(
            get_required_error_info<value_type_info>(e)
            == value_type::STRUCTURE);
        REQUIRE(get_required_error_info<chain_tier_info>(e) == "custom");
    }
}

TEST_CASE("extending the probe chain", "[json][encoder]")
{
    auto probes = basic_encoding_probes();
    probes.push_back(
        [](value_encoder const&, dynamic const& value, string& out) {
            if (value.type() != value_type::COMPLEX)
                return false;
            out += "\"complex\"";
            return true;
        });
    value_encoder encoder(chain_tier::BASIC, text_encoding::UTF8, probes);
    REQUIRE(
        encoder.encode(dynamic_array{dynamic(complex(1, 2)), dynamic(nil)})
        == "[\"complex\", null]");
    REQUIRE(encoder.tier() == chain_tier::BASIC);
    REQUIRE(encoder.encoding() == text_encoding::UTF8);
}
