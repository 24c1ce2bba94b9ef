#ifndef JSONEASE_JSON_REFLECTION_HPP
#define JSONEASE_JSON_REFLECTION_HPP

#include <jsonease/core/dynamic.hpp>

namespace jsonease {

// Collect the fields of a structure for generic serialization.
// The structure's own fields come first, followed by the fields of each
// inherited layer (nearest first) whose names haven't been seen yet.
dynamic_object
reflect_structure(structure const& s);

} // namespace jsonease

#endif
