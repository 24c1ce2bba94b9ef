#include <jsonease/json/chain.hpp>

namespace jsonease {

std::ostream&
operator<<(std::ostream& s, chain_tier t)
{
    switch (t)
    {
        case chain_tier::BASIC:
            s << "basic";
            break;
        case chain_tier::ADVANCED:
            s << "advanced";
            break;
        case chain_tier::CUSTOM:
            s << "custom";
            break;
        default:
            JSONEASE_THROW(
                invalid_enum_value()
                << enum_id_info("chain_tier") << enum_value_info(int(t)));
    }
    return s;
}

chain_tier
parse_chain_tier(string const& name)
{
    if (name == "basic")
        return chain_tier::BASIC;
    if (name == "advanced")
        return chain_tier::ADVANCED;
    if (name == "custom")
        return chain_tier::CUSTOM;
    JSONEASE_THROW(
        invalid_enum_string()
        << enum_id_info("chain_tier") << enum_string_info(name));
}

} // namespace jsonease
