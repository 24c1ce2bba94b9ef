#ifndef JSONEASE_CORE_ERRORS_HPP
#define JSONEASE_CORE_ERRORS_HPP

#include <jsonease/core/dynamic.hpp>

// These are the errors that the codec reports to its callers.

namespace jsonease {

// The input text isn't valid JSON. (This covers grammar violations at any
// position as well as trailing content after the top-level value.)
JSONEASE_DEFINE_EXCEPTION(malformed_input)
JSONEASE_DEFINE_ERROR_INFO(string, parsing_error)

// No tier of the encoder chain recognized a value.
JSONEASE_DEFINE_EXCEPTION(unsupported_type)
JSONEASE_DEFINE_ERROR_INFO(value_type, value_type)
JSONEASE_DEFINE_ERROR_INFO(string, chain_tier)
JSONEASE_DEFINE_ERROR_INFO(string, unsupported_reason)

// A decoded value doesn't fit the shape of the type it's supposed to be cast
// to.
JSONEASE_DEFINE_EXCEPTION(casting_error)
JSONEASE_DEFINE_ERROR_INFO(size_t, target_field_count)
JSONEASE_DEFINE_ERROR_INFO(value_type, decoded_value_type)
// Note that missing fields are reported with field_name_info.

// An encoding name isn't one that jsonease supports.
JSONEASE_DEFINE_EXCEPTION(unknown_encoding)
JSONEASE_DEFINE_ERROR_INFO(string, encoding_name)

// Text contains a character that the target encoding can't represent.
JSONEASE_DEFINE_EXCEPTION(unencodable_character)
JSONEASE_DEFINE_ERROR_INFO(uint32_t, code_point)

} // namespace jsonease

#endif
