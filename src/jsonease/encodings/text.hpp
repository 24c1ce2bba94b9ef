#ifndef JSONEASE_ENCODINGS_TEXT_HPP
#define JSONEASE_ENCODINGS_TEXT_HPP

#include <cstdint>
#include <ostream>

#include <jsonease/core/errors.hpp>

// TEXT ENCODINGS - Internally, all text is UTF-8. Raw bytes that arrive in
// some other encoding are converted at the boundaries.

namespace jsonease {

// the encoding assumed when none is given
extern char const* const default_json_encoding;

enum class text_encoding
{
    UTF8,
    LATIN1,
    ASCII
};

std::ostream&
operator<<(std::ostream& s, text_encoding e);

// Interpret an encoding name such as "utf-8", "UTF8", "latin-1" or "ascii".
// Case, dashes and underscores are ignored.
// If the name isn't recognized, this throws unknown_encoding.
text_encoding
parse_text_encoding(string const& name);

// Convert raw bytes in the given encoding to UTF-8.
// For ASCII, bytes above 0x7f are reported as malformed_input.
string
to_utf8(string const& bytes, text_encoding encoding);

// Convert UTF-8 text to the given encoding.
// Characters that the encoding can't represent throw unencodable_character.
string
from_utf8(string const& text, text_encoding encoding);

// Append the UTF-8 representation of a code point to :out.
// (Lone surrogates are written in their three-byte form.)
void
append_utf8(string& out, uint32_t code_point);

} // namespace jsonease

#endif
