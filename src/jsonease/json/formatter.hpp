#ifndef JSONEASE_JSON_FORMATTER_HPP
#define JSONEASE_JSON_FORMATTER_HPP

#include <jsonease/json/grammar.hpp>

// FORMATTER - The formatter re-indents JSON text without decoding it.
// Scalars are copied token for token (numbers and string escapes are not
// normalized), and only the whitespace around array items and object members
// changes.

namespace jsonease {

struct formatter_config
{
    // the number of spaces before the top-level value
    unsigned align = 0;
    // the number of additional spaces for each level of nesting
    unsigned indent = 4;
    // written between items (and between members)
    string item_separator = ",\r\n";
    // written between a key and its value
    string key_separator = ": ";
    // written after an opening bracket and before a closing one
    string line_ending = "\r\n";
};

class formatter
{
 public:
    explicit formatter(
        formatter_config config = formatter_config(),
        unsigned max_depth = default_max_depth);

    // Format a complete JSON text.
    // Whitespace (and a byte order mark) before and after the top-level value
    // is passed through unchanged. The text is checked against the same grammar
    // that the decoder uses, so anything the decoder would reject is
    // malformed_input here too.
    string
    format(string const& text) const;

    formatter_config const&
    config() const
    {
        return config_;
    }

 private:
    // Format the value starting at :pos (after any whitespace), appending it to
    // :out with :lead spaces before it. :align is the indentation of the
    // value's own line.
    size_t
    scan(
        string& out,
        string const& text,
        size_t pos,
        unsigned lead,
        unsigned align,
        unsigned depth) const;

    size_t
    format_array(
        string& out,
        string const& text,
        size_t pos,
        unsigned lead,
        unsigned align,
        unsigned depth) const;

    size_t
    format_object(
        string& out,
        string const& text,
        size_t pos,
        unsigned lead,
        unsigned align,
        unsigned depth) const;

    formatter_config config_;
    unsigned max_depth_;
};

} // namespace jsonease

#endif
