#include <jsonease/json/grammar.hpp>

#include <jsonease/core/testing.hpp>

using namespace jsonease;

TEST_CASE("whitespace skipping", "[json][grammar]")
{
    REQUIRE(skip_whitespace(" \t\r\nx", 0) == 4);
    REQUIRE(skip_whitespace("x ", 0) == 0);
    REQUIRE(skip_whitespace("  ", 1) == 2);
    // Form feeds aren't JSON whitespace.
    REQUIRE(skip_whitespace("\f", 0) == 0);

    REQUIRE(skip_byte_order_mark("\xef\xbb\xbfnull", 0) == 3);
    REQUIRE(skip_byte_order_mark("null", 0) == 0);
}

TEST_CASE("token classification", "[json][grammar]")
{
    REQUIRE(classify_token("null", 0) == token_kind::NULL_LITERAL);
    REQUIRE(classify_token("true", 0) == token_kind::BOOLEAN);
    REQUIRE(classify_token("false", 0) == token_kind::BOOLEAN);
    REQUIRE(classify_token("-1", 0) == token_kind::NUMBER);
    REQUIRE(classify_token("7", 0) == token_kind::NUMBER);
    REQUIRE(classify_token("\"\"", 0) == token_kind::STRING);
    REQUIRE(classify_token("[]", 0) == token_kind::ARRAY);
    REQUIRE(classify_token(" {}", 1) == token_kind::OBJECT);

    REQUIRE_THROWS_AS(classify_token(".123", 0), malformed_input);
    REQUIRE_THROWS_AS(classify_token("None", 0), malformed_input);
    REQUIRE_THROWS_AS(classify_token("", 0), malformed_input);

    try
    {
        classify_token("x", 0);
        FAIL("no exception thrown");
    }
    catch (malformed_input& e)
    {
        REQUIRE(
            get_required_error_info<parsing_error_info>(e)
            == "unexpected character 'x'");
    }
}

TEST_CASE("literal matching", "[json][grammar]")
{
    REQUIRE(match_null("null", 0) == 4);
    REQUIRE(match_null("nullx", 0) == 4);
    REQUIRE_THROWS_AS(match_null("nul", 0), malformed_input);
    REQUIRE_THROWS_AS(match_null("nil", 0), malformed_input);

    bool b;
    REQUIRE(match_boolean(&b, "true", 0) == 4);
    REQUIRE(b);
    REQUIRE(match_boolean(&b, "[false]", 1) == 6);
    REQUIRE(!b);
    REQUIRE_THROWS_AS(match_boolean(&b, "True", 0), malformed_input);
    REQUIRE_THROWS_AS(match_boolean(&b, "fals", 0), malformed_input);
}

TEST_CASE("number matching", "[json][grammar]")
{
    bool is_float;

    REQUIRE(match_number(&is_float, "123", 0) == 3);
    REQUIRE(!is_float);
    REQUIRE(match_number(&is_float, "-345,", 0) == 4);
    REQUIRE(!is_float);
    REQUIRE(match_number(&is_float, "-0.111]", 0) == 6);
    REQUIRE(is_float);
    REQUIRE(match_number(&is_float, "1.5e3", 0) == 5);
    REQUIRE(is_float);
    REQUIRE(match_number(&is_float, "2E-7", 0) == 4);
    REQUIRE(is_float);

    // A leading zero ends the integer part.
    REQUIRE(match_number(&is_float, "0123", 0) == 1);
    REQUIRE(!is_float);

    // A dot or exponent marker without digits is left for the caller to
    // reject.
    REQUIRE(match_number(&is_float, "1.", 0) == 1);
    REQUIRE(!is_float);
    REQUIRE(match_number(&is_float, "1e", 0) == 1);
    REQUIRE(!is_float);
    REQUIRE(match_number(&is_float, "1e+", 0) == 1);

    REQUIRE_THROWS_AS(match_number(&is_float, "-", 0), malformed_input);
    REQUIRE_THROWS_AS(match_number(&is_float, "--0.123", 0), malformed_input);
    REQUIRE_THROWS_AS(match_number(&is_float, "-.123", 0), malformed_input);
}

TEST_CASE("string matching", "[json][grammar]")
{
    string s;
    REQUIRE(match_string(&s, "\"l  sk \\n jfds\"", 0) == 15);
    REQUIRE(s == "l  sk \n jfds");

    s.clear();
    match_string(&s, "\"\\\"\\\\\\/\\b\\f\\n\\r\\t\"", 0);
    REQUIRE(s == "\"\\/\b\f\n\r\t");

    s.clear();
    match_string(&s, "\"\\u7890\"", 0);
    REQUIRE(s == "\xe7\xa2\x90");

    // Surrogate pairs combine.
    s.clear();
    match_string(&s, "\"\\ud83d\\ude00\"", 0);
    REQUIRE(s == "\xf0\x9f\x98\x80");

    // Lone surrogates are kept.
    s.clear();
    match_string(&s, "\"\\udc00x\"", 0);
    REQUIRE(s == "\xed\xb0\x80x");

    // Validation happens even without a value to store.
    REQUIRE(match_string(nullptr, "\"abc\" ", 0) == 5);
    REQUIRE_THROWS_AS(match_string(nullptr, "\"abc", 0), malformed_input);
    REQUIRE_THROWS_AS(match_string(nullptr, "\"\\x\"", 0), malformed_input);
    REQUIRE_THROWS_AS(match_string(nullptr, "\"\\u12\"", 0), malformed_input);
    REQUIRE_THROWS_AS(
        match_string(nullptr, "\"\\u12zz\"", 0), malformed_input);
    REQUIRE_THROWS_AS(match_string(nullptr, "abc", 0), malformed_input);
}

TEST_CASE("nesting depth checks", "[json][grammar]")
{
    REQUIRE_NOTHROW(check_nesting_depth(1, 1));
    REQUIRE_NOTHROW(check_nesting_depth(default_max_depth, default_max_depth));

    try
    {
        check_nesting_depth(4, 3);
        FAIL("no exception thrown");
    }
    catch (malformed_input& e)
    {
        REQUIRE(
            get_required_error_info<parsing_error_info>(e)
            == "nesting too deep");
    }
}

TEST_CASE("required characters", "[json][grammar]")
{
    REQUIRE(require_char("[1]", 2, "array") == ']');

    try
    {
        require_char("[1", 2, "array");
        FAIL("no exception thrown");
    }
    catch (malformed_input& e)
    {
        REQUIRE(
            get_required_error_info<parsing_error_info>(e)
            == "unexpected end of text in array");
    }
}
