#include <jsonease/json/chain.hpp>

#include <boost/lexical_cast.hpp>

#include <jsonease/core/testing.hpp>

using namespace jsonease;

using boost::lexical_cast;

TEST_CASE("chain tier names", "[json][chain]")
{
    REQUIRE(lexical_cast<string>(chain_tier::BASIC) == "basic");
    REQUIRE(lexical_cast<string>(chain_tier::ADVANCED) == "advanced");
    REQUIRE(lexical_cast<string>(chain_tier::CUSTOM) == "custom");

    REQUIRE(parse_chain_tier("basic") == chain_tier::BASIC);
    REQUIRE(parse_chain_tier("advanced") == chain_tier::ADVANCED);
    REQUIRE(parse_chain_tier("custom") == chain_tier::CUSTOM);

    try
    {
        parse_chain_tier("Custom");
        FAIL("no exception thrown");
    }
    catch (invalid_enum_string& e)
    {
        REQUIRE(get_required_error_info<enum_id_info>(e) == "chain_tier");
        REQUIRE(get_required_error_info<enum_string_info>(e) == "Custom");
    }

    REQUIRE_THROWS_AS(
        lexical_cast<string>(chain_tier(17)), invalid_enum_value);
}
