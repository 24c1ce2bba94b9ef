#include <jsonease/json/grammar.hpp>

#include <boost/format.hpp>

#include <jsonease/encodings/text.hpp>

namespace jsonease {

void
throw_malformed_input(string const& reason)
{
    JSONEASE_THROW(malformed_input() << parsing_error_info(reason));
}

char
require_char(string const& text, size_t pos, char const* context)
{
    if (pos >= text.size())
    {
        throw_malformed_input(
            str(boost::format("unexpected end of text in %s") % context));
    }
    return text[pos];
}

void
check_nesting_depth(unsigned depth, unsigned max_depth)
{
    if (depth > max_depth)
        throw_malformed_input("nesting too deep");
}

size_t
skip_byte_order_mark(string const& text, size_t pos)
{
    if (text.compare(pos, 3, "\xef\xbb\xbf") == 0)
        return pos + 3;
    return pos;
}

size_t
skip_whitespace(string const& text, size_t pos)
{
    size_t const n = text.size();
    while (pos < n)
    {
        char c = text[pos];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
            break;
        ++pos;
    }
    return pos;
}

static bool
is_digit(char c)
{
    return c >= '0' && c <= '9';
}

token_kind
classify_token(string const& text, size_t pos)
{
    char c = require_char(text, pos, "JSON value");
    switch (c)
    {
        case 'n':
            return token_kind::NULL_LITERAL;
        case 't':
        case 'f':
            return token_kind::BOOLEAN;
        case '"':
            return token_kind::STRING;
        case '[':
            return token_kind::ARRAY;
        case '{':
            return token_kind::OBJECT;
        default:
            if (c == '-' || is_digit(c))
                return token_kind::NUMBER;
            throw_malformed_input(
                str(boost::format("unexpected character '%c'") % c));
    }
}

size_t
match_null(string const& text, size_t pos)
{
    if (text.compare(pos, 4, "null") != 0)
        throw_malformed_input("invalid null literal");
    return pos + 4;
}

size_t
match_boolean(bool* value, string const& text, size_t pos)
{
    if (text.compare(pos, 4, "true") == 0)
    {
        *value = true;
        return pos + 4;
    }
    if (text.compare(pos, 5, "false") == 0)
    {
        *value = false;
        return pos + 5;
    }
    throw_malformed_input("invalid boolean literal");
}

// Match one or more digits. Returns the position past them (or :pos if there
// are none).
static size_t
match_digits(string const& text, size_t pos)
{
    while (pos < text.size() && is_digit(text[pos]))
        ++pos;
    return pos;
}

size_t
match_number(bool* is_float, string const& text, size_t pos)
{
    size_t const n = text.size();
    *is_float = false;

    if (pos < n && text[pos] == '-')
        ++pos;

    // integer part
    if (pos >= n || !is_digit(text[pos]))
        throw_malformed_input("invalid number");
    if (text[pos] == '0')
        ++pos;
    else
        pos = match_digits(text, pos);

    // fraction
    if (pos < n && text[pos] == '.')
    {
        size_t end = match_digits(text, pos + 1);
        // A dot without digits isn't part of the number.
        if (end != pos + 1)
        {
            *is_float = true;
            pos = end;
        }
    }

    // exponent
    if (pos < n && (text[pos] == 'e' || text[pos] == 'E'))
    {
        size_t p = pos + 1;
        if (p < n && (text[p] == '+' || text[p] == '-'))
            ++p;
        size_t end = match_digits(text, p);
        if (end != p)
        {
            *is_float = true;
            pos = end;
        }
    }

    return pos;
}

static int
hex_digit_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Read the four hex digits of a \u escape starting at :pos.
static uint32_t
read_code_unit(string const& text, size_t pos)
{
    if (pos + 4 > text.size())
        throw_malformed_input("truncated \\u escape");
    uint32_t unit = 0;
    for (size_t i = pos; i != pos + 4; ++i)
    {
        int digit = hex_digit_value(text[i]);
        if (digit < 0)
            throw_malformed_input("invalid \\u escape");
        unit = (unit << 4) | uint32_t(digit);
    }
    return unit;
}

static bool
is_high_surrogate(uint32_t unit)
{
    return unit >= 0xd800 && unit <= 0xdbff;
}

static bool
is_low_surrogate(uint32_t unit)
{
    return unit >= 0xdc00 && unit <= 0xdfff;
}

size_t
match_string(string* value, string const& text, size_t pos)
{
    if (require_char(text, pos, "string") != '"')
        throw_malformed_input("expected string");
    size_t const n = text.size();
    size_t end = pos + 1;
    while (true)
    {
        // Copy everything up to the next quote or backslash in one go.
        size_t stop = text.find_first_of("\"\\", end);
        if (stop == string::npos)
            throw_malformed_input("unterminated string");
        if (value)
            value->append(text, end, stop - end);
        end = stop + 1;
        if (text[stop] == '"')
            break;

        char escape = require_char(text, end, "string escape");
        ++end;
        char unescaped;
        switch (escape)
        {
            case '"':
                unescaped = '"';
                break;
            case '\\':
                unescaped = '\\';
                break;
            case '/':
                unescaped = '/';
                break;
            case 'b':
                unescaped = '\b';
                break;
            case 'f':
                unescaped = '\f';
                break;
            case 'n':
                unescaped = '\n';
                break;
            case 'r':
                unescaped = '\r';
                break;
            case 't':
                unescaped = '\t';
                break;
            case 'u': {
                uint32_t code_point = read_code_unit(text, end);
                end += 4;
                // A high surrogate followed directly by an escaped low
                // surrogate combines with it into a single code point.
                if (is_high_surrogate(code_point) && end + 6 <= n
                    && text[end] == '\\' && text[end + 1] == 'u')
                {
                    uint32_t low = read_code_unit(text, end + 2);
                    if (is_low_surrogate(low))
                    {
                        code_point = 0x10000 + ((code_point - 0xd800) << 10)
                                     + (low - 0xdc00);
                        end += 6;
                    }
                }
                if (value)
                    append_utf8(*value, code_point);
                continue;
            }
            default:
                throw_malformed_input(
                    str(boost::format("invalid escape '\\%c'") % escape));
        }
        if (value)
            value->push_back(unescaped);
    }
    return end;
}

} // namespace jsonease
