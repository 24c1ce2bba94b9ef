#ifndef JSONEASE_JSON_DECODER_HPP
#define JSONEASE_JSON_DECODER_HPP

#include <functional>
#include <vector>

#include <jsonease/encodings/text.hpp>
#include <jsonease/json/chain.hpp>
#include <jsonease/json/grammar.hpp>

namespace jsonease {

// DECODER RULES - A decoder's tier is nothing more than the list of
// recognizers that it applies to the plain strings and objects it decodes.
// Recognizers are tried in order and the first one to recognize a value
// replaces it. A value that nothing recognizes is left as it is.

typedef std::function<optional<dynamic>(string const& s)> string_recognizer;

typedef std::function<optional<dynamic>(dynamic_object const& object)>
    object_recognizer;

struct decoder_rules
{
    std::vector<string_recognizer> string_recognizers;
    std::vector<object_recognizer> object_recognizers;
};

// plain JSON (no recognizers)
decoder_rules
basic_decoder_rules();

// UUIDs, datetimes, dates and times (in that order) for strings; complex
// numbers and ranges for objects
decoder_rules
advanced_decoder_rules();

// Get the rules for a tier. (The Custom tier decodes with the Advanced rules
// and adds reconstruction of target types on top; see customize().)
decoder_rules
get_decoder_rules(chain_tier tier);

// VALUE DECODER

class value_decoder
{
 public:
    value_decoder(
        text_encoding encoding,
        decoder_rules rules,
        unsigned max_depth = default_max_depth);

    // Decode a complete JSON text.
    // :text is raw bytes in the decoder's encoding. A leading byte order mark
    // and whitespace on either side of the value are allowed. Anything else is
    // malformed_input.
    dynamic
    decode(string const& text) const;

    // Decode the value that starts at :pos (after any whitespace) in the UTF-8
    // text :text. The value is stored in :v and the position just past it is
    // returned. :depth is the nesting depth of the value.
    size_t
    scan(dynamic* v, string const& text, size_t pos, unsigned depth = 0) const;

    text_encoding
    encoding() const
    {
        return encoding_;
    }

    unsigned
    max_depth() const
    {
        return max_depth_;
    }

 private:
    size_t
    scan_number(dynamic* v, string const& text, size_t pos) const;

    size_t
    scan_string(dynamic* v, string const& text, size_t pos) const;

    size_t
    scan_array(
        dynamic* v, string const& text, size_t pos, unsigned depth) const;

    size_t
    scan_object(
        dynamic* v, string const& text, size_t pos, unsigned depth) const;

    text_encoding encoding_;
    decoder_rules rules_;
    unsigned max_depth_;
};

// Make a decoder for the given tier and encoding name.
value_decoder
make_decoder(
    chain_tier tier,
    string const& encoding = default_json_encoding,
    unsigned max_depth = default_max_depth);

// CUSTOM RECONSTRUCTION

// A target type describes how to reconstruct an application value from a
// decoded one: the names of the fields that its constructor takes (in order)
// and the constructor itself, which receives the field values positionally.
struct target_type
{
    std::vector<string> field_names;
    std::function<dynamic(dynamic_array const& arguments)> construct;
};

// Reconstruct a :target value from the generic decoded value :value.
//
// If the target declares no fields, it's constructed with no arguments.
// Scalars (including the extended scalar kinds) require exactly one field.
// Arrays and sequences require as many fields as they have items and supply
// them in order. Objects and mappings must contain every declared field name
// as a key and supply the fields by name.
//
// Mismatches are reported as casting_error.
dynamic
customize(dynamic const& value, target_type const& target);

} // namespace jsonease

#endif
