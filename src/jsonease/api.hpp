#ifndef JSONEASE_API_HPP
#define JSONEASE_API_HPP

#include <istream>
#include <ostream>

#include <jsonease/fs/types.hpp>
#include <jsonease/json/decoder.hpp>
#include <jsonease/json/encoder.hpp>
#include <jsonease/json/formatter.hpp>

// This is the public face of jsonease. Each operation picks a decoder,
// encoder or formatter according to its options and forwards to it.

namespace jsonease {

struct dump_options
{
    // the encoding of the text written to sinks
    string encoding = default_json_encoding;
    chain_tier tier = chain_tier::CUSTOM;
    // If this is set, the output is pretty-printed with the default
    // formatter_config. The width itself is not used.
    optional<unsigned> indent;
};

struct load_options
{
    // the encoding of the input text
    string encoding = default_json_encoding;
    chain_tier tier = chain_tier::CUSTOM;
    // If this is set, the decoded value is reconstructed as this type. (This
    // always decodes with the Custom tier.)
    optional<target_type> target;
};

// Encode :value as JSON. The result is UTF-8.
string
dumps(dynamic const& value, dump_options const& options = dump_options());

// Encode :value as JSON and write it to :destination in the encoding named by
// the options.
void
dump(
    dynamic const& value,
    std::ostream& destination,
    dump_options const& options = dump_options());

// Decode the JSON text :text (which is in the encoding named by the options).
dynamic
loads(string const& text, load_options const& options = load_options());

// Read everything from :source and decode it.
dynamic
load(std::istream& source, load_options const& options = load_options());

// Re-indent the JSON text :text.
string
format(string const& text, formatter_config const& config = formatter_config());

// Read and decode a JSON file.
dynamic
load_file(file_path const& path, load_options const& options = load_options());

// Encode :value and write it to a file (replacing its contents).
void
dump_file(
    dynamic const& value,
    file_path const& path,
    dump_options const& options = dump_options());

} // namespace jsonease

#endif
