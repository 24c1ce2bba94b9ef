#ifndef JSONEASE_JSON_CHAIN_HPP
#define JSONEASE_JSON_CHAIN_HPP

#include <ostream>

#include <jsonease/core/dynamic.hpp>

namespace jsonease {

// A chain tier selects which value kinds a decoder or encoder supports.
// Each tier supports everything that the tiers before it support.
enum class chain_tier
{
    // plain JSON values only
    BASIC,
    // adds UUIDs, dates and times, complex numbers, ranges and generic
    // containers
    ADVANCED,
    // adds application structures
    CUSTOM
};

std::ostream&
operator<<(std::ostream& s, chain_tier t);

// Parse a tier name ("basic", "advanced" or "custom").
// Throws invalid_enum_string if the name isn't recognized.
chain_tier
parse_chain_tier(string const& name);

} // namespace jsonease

#endif
