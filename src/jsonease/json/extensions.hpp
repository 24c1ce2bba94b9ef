#ifndef JSONEASE_JSON_EXTENSIONS_HPP
#define JSONEASE_JSON_EXTENSIONS_HPP

#include <jsonease/core/errors.hpp>

// EXTENSIONS - These are the rules that map JSON strings and objects onto the
// extended value kinds, in both directions.
//
// The recognizers are probes: they return none when the input doesn't have the
// shape they're looking for.

namespace jsonease {

// STRINGS

// Recognize a canonical UUID (8-4-4-4-12 hex digits, with the version digit in
// [1-5] and the variant digit in [89ab]). Case is ignored.
optional<dynamic>
recognize_uuid(string const& s);

// Recognize an ISO-8601 date and time, optionally followed by a UTC offset
// (Z, +HH, +HHMM or +HH:MM). A missing offset is taken to be zero.
optional<dynamic>
recognize_datetime(string const& s);

// Recognize an ISO-8601 date (YYYY-MM-DD).
optional<dynamic>
recognize_date(string const& s);

// Recognize an ISO-8601 time of day (HH:MM[:SS[.ffffff]]).
// Digits beyond microseconds are dropped.
optional<dynamic>
recognize_time(string const& s);

// OBJECTS

// Recognize an object with exactly the keys "real" and "imag" as a complex
// number.
// Since the key set alone decides this, a matching object whose parts aren't
// numbers (or null, which counts as zero) is malformed_input.
optional<dynamic>
recognize_complex(dynamic_object const& object);

// Recognize an object with exactly the keys "start", "stop" and "step" as a
// range. Each bound must be an integer, a float or null.
optional<dynamic>
recognize_range(dynamic_object const& object);

// FORMATTING

// the canonical (lowercase) form of a UUID
string
format_uuid(uuid const& id);

// YYYY-MM-DD
string
format_date(date const& d);

// HH:MM:SS (fractional seconds are truncated)
string
format_time(time_of_day const& t);

// YYYY-MM-DDTHH:MM:SS followed by the UTC offset, with Z standing for a zero
// offset
string
format_datetime(datetime const& t);

} // namespace jsonease

#endif
