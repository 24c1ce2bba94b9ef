#ifndef JSONEASE_JSON_GRAMMAR_HPP
#define JSONEASE_JSON_GRAMMAR_HPP

#include <jsonease/core/errors.hpp>

// JSON GRAMMAR - the token-level rules shared by the decoder and the
// formatter.
//
// Every matching function takes the text and a cursor position and returns the
// position just past whatever it consumed. None of them skip whitespace on
// their own; callers do that with skip_whitespace() where the grammar allows
// it.

namespace jsonease {

// the deepest nesting of arrays and objects accepted by default
unsigned const default_max_depth = 1000;

// Skip a UTF-8 byte order mark at :pos, if there is one.
size_t
skip_byte_order_mark(string const& text, size_t pos);

// Skip JSON whitespace (space, tab, CR and LF).
size_t
skip_whitespace(string const& text, size_t pos);

// the productions that can start a JSON value
enum class token_kind
{
    NULL_LITERAL,
    BOOLEAN,
    NUMBER,
    STRING,
    ARRAY,
    OBJECT
};

// Identify the production that starts at :pos.
// If no production can start there (including at the end of the text), this
// throws malformed_input.
token_kind
classify_token(string const& text, size_t pos);

// Get the character at :pos, throwing malformed_input if the text ends first.
char
require_char(string const& text, size_t pos, char const* context);

// Throw malformed_input with the given reason.
[[noreturn]] void
throw_malformed_input(string const& reason);

// Check that :depth levels of nesting are acceptable.
void
check_nesting_depth(unsigned depth, unsigned max_depth);

// Match the literal null.
size_t
match_null(string const& text, size_t pos);

// Match true or false, storing the value in :value.
size_t
match_boolean(bool* value, string const& text, size_t pos);

// Match a number (-?(0|[1-9]\d*)(\.\d+)?([eE][+-]?\d+)?).
// :is_float is set if the number has a fraction or an exponent.
size_t
match_number(bool* is_float, string const& text, size_t pos);

// Match a quoted string (with :pos at the opening quote).
// If :value isn't null, the unescaped contents are appended to it.
// Escapes are checked either way.
size_t
match_string(string* value, string const& text, size_t pos);

} // namespace jsonease

#endif
