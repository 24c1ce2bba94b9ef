#ifndef JSONEASE_CONFIG_HPP
#define JSONEASE_CONFIG_HPP

#include <jsonease/core/type_interfaces.hpp>

namespace jsonease {

// the settings of jsonease-tool that can come from a configuration file
// (Anything that's omitted falls back to the tool's defaults, and command-line
// options override whatever is given here.)
struct tool_config
{
    // the chain tier used to re-encode input ("basic", "advanced" or
    // "custom")
    optional<string> tier;
    // the encoding of input and output files
    optional<string> encoding;
    // whether or not to pretty-print instead of re-encoding
    optional<bool> format;
    // formatter settings
    optional<unsigned> indent;
    optional<unsigned> align;
    // "lf" or "crlf"
    optional<string> line_ending;
};

void
from_dynamic(tool_config* config, dynamic const& v);

void
to_dynamic(dynamic* v, tool_config const& config);

} // namespace jsonease

#endif
