#ifndef JSONEASE_JSON_ENCODER_HPP
#define JSONEASE_JSON_ENCODER_HPP

#include <functional>
#include <vector>

#include <jsonease/encodings/text.hpp>
#include <jsonease/json/chain.hpp>

// ENCODER - An encoder writes dynamic values as compact JSON text
// (", " between items and ": " between keys and values).
//
// Each tier is an ordered list of probes. Every probe handles a few value
// kinds. The encoder tries them in order and only reports unsupported_type
// once none of them recognizes the value.

namespace jsonease {

class value_encoder;

// An encoding probe tries to write :value to :out.
// If it doesn't recognize the value, it returns false without writing
// anything. Probes that write containers encode the items with
// encoder.write(), so items get the full chain.
typedef std::function<bool(
    value_encoder const& encoder, dynamic const& value, string& out)>
    encoding_probe;

// null, booleans, numbers, strings, arrays and objects
std::vector<encoding_probe>
basic_encoding_probes();

// the basic probes plus UUIDs, complex numbers, ranges, dates and times,
// sequences and mappings
std::vector<encoding_probe>
advanced_encoding_probes();

// the advanced probes plus application structures
std::vector<encoding_probe>
custom_encoding_probes();

std::vector<encoding_probe>
get_encoding_probes(chain_tier tier);

class value_encoder
{
 public:
    value_encoder(
        chain_tier tier,
        text_encoding encoding,
        std::vector<encoding_probe> probes);

    // Encode :value as (UTF-8) JSON text.
    string
    encode(dynamic const& value) const;

    // Write :value to :out.
    // If no probe recognizes it, this throws unsupported_type.
    void
    write(string& out, dynamic const& value) const;

    // Same, but returns false instead of throwing.
    bool
    try_write(string& out, dynamic const& value) const;

    chain_tier
    tier() const
    {
        return tier_;
    }

    text_encoding
    encoding() const
    {
        return encoding_;
    }

 private:
    chain_tier tier_;
    text_encoding encoding_;
    std::vector<encoding_probe> probes_;
};

// Make an encoder for the given tier and encoding name.
value_encoder
make_encoder(chain_tier tier, string const& encoding = default_json_encoding);

// Write :s as a quoted JSON string.
// Quotes, backslashes and control characters are escaped. Everything else
// (including '/' and non-ASCII characters) is written as it is.
void
write_json_string(string& out, string const& s);

// Write a finite float the way Python's repr() does: the shortest digits that
// read back as the same value, in fixed notation for decimal exponents from -4
// to 15 and in exponent notation otherwise. Integral values keep a trailing
// ".0".
void
write_float(string& out, double x);

} // namespace jsonease

#endif
