#include <jsonease/json/formatter.hpp>

namespace jsonease {

formatter::formatter(formatter_config config, unsigned max_depth)
    : config_(std::move(config)), max_depth_(max_depth)
{
}

string
formatter::format(string const& text) const
{
    if (text.empty())
        throw_malformed_input("empty JSON text");
    size_t pos = skip_whitespace(text, skip_byte_order_mark(text, 0));
    string out(text, 0, pos);
    size_t end = scan(out, text, pos, config_.align, config_.align, 0);
    if (skip_whitespace(text, end) != text.size())
        throw_malformed_input("incorrect end of JSON text");
    out.append(text, end, string::npos);
    return out;
}

size_t
formatter::scan(
    string& out,
    string const& text,
    size_t pos,
    unsigned lead,
    unsigned align,
    unsigned depth) const
{
    pos = skip_whitespace(text, pos);
    size_t end;
    switch (classify_token(text, pos))
    {
        case token_kind::NULL_LITERAL:
            end = match_null(text, pos);
            break;
        case token_kind::BOOLEAN: {
            bool b;
            end = match_boolean(&b, text, pos);
            break;
        }
        case token_kind::NUMBER: {
            bool is_float;
            end = match_number(&is_float, text, pos);
            break;
        }
        case token_kind::STRING:
            end = match_string(nullptr, text, pos);
            break;
        case token_kind::ARRAY:
            return format_array(out, text, pos, lead, align, depth + 1);
        case token_kind::OBJECT:
        default:
            return format_object(out, text, pos, lead, align, depth + 1);
    }
    out.append(lead, ' ');
    out.append(text, pos, end - pos);
    return end;
}

size_t
formatter::format_array(
    string& out,
    string const& text,
    size_t pos,
    unsigned lead,
    unsigned align,
    unsigned depth) const
{
    check_nesting_depth(depth, max_depth_);
    out.append(lead, ' ');
    size_t end = skip_whitespace(text, pos + 1);
    if (require_char(text, end, "array") == ']')
    {
        out += "[]";
        return end + 1;
    }
    out.push_back('[');
    out += config_.line_ending;
    unsigned item_align = align + config_.indent;
    while (true)
    {
        end = scan(out, text, end, item_align, item_align, depth);
        end = skip_whitespace(text, end);
        char c = require_char(text, end, "array");
        if (c == ']')
            break;
        if (c != ',')
            throw_malformed_input("expected ',' or ']' in array");
        ++end;
        out += config_.item_separator;
    }
    out += config_.line_ending;
    out.append(align, ' ');
    out.push_back(']');
    return end + 1;
}

size_t
formatter::format_object(
    string& out,
    string const& text,
    size_t pos,
    unsigned lead,
    unsigned align,
    unsigned depth) const
{
    check_nesting_depth(depth, max_depth_);
    out.append(lead, ' ');
    size_t end = skip_whitespace(text, pos + 1);
    if (require_char(text, end, "object") == '}')
    {
        out += "{}";
        return end + 1;
    }
    out.push_back('{');
    out += config_.line_ending;
    unsigned member_align = align + config_.indent;
    while (true)
    {
        size_t key_start = skip_whitespace(text, end);
        end = match_string(nullptr, text, key_start);
        out.append(member_align, ' ');
        out.append(text, key_start, end - key_start);
        end = skip_whitespace(text, end);
        if (require_char(text, end, "object") != ':')
            throw_malformed_input("expected ':' in object");
        out += config_.key_separator;
        // The value follows the key on the same line, but anything it spans
        // is indented relative to the member.
        end = scan(out, text, end + 1, 0, member_align, depth);
        end = skip_whitespace(text, end);
        char c = require_char(text, end, "object");
        if (c == '}')
            break;
        if (c != ',')
            throw_malformed_input("expected ',' or '}' in object");
        ++end;
        out += config_.item_separator;
    }
    out += config_.line_ending;
    out.append(align, ' ');
    out.push_back('}');
    return end + 1;
}

} // namespace jsonease
