#include <jsonease/encodings/text.hpp>

#include <cctype>

#include <boost/lexical_cast.hpp>

namespace jsonease {

char const* const default_json_encoding = "utf-8";

std::ostream&
operator<<(std::ostream& s, text_encoding e)
{
    switch (e)
    {
        case text_encoding::UTF8:
            s << "utf-8";
            break;
        case text_encoding::LATIN1:
            s << "latin-1";
            break;
        case text_encoding::ASCII:
            s << "ascii";
            break;
        default:
            JSONEASE_THROW(
                invalid_enum_value()
                << enum_id_info("text_encoding") << enum_value_info(int(e)));
    }
    return s;
}

text_encoding
parse_text_encoding(string const& name)
{
    string normalized;
    for (char c : name)
    {
        if (c == '-' || c == '_')
            continue;
        normalized.push_back(
            char(std::tolower(static_cast<unsigned char>(c))));
    }
    if (normalized == "utf8")
        return text_encoding::UTF8;
    if (normalized == "latin1" || normalized == "iso88591")
        return text_encoding::LATIN1;
    if (normalized == "ascii" || normalized == "usascii")
        return text_encoding::ASCII;
    JSONEASE_THROW(unknown_encoding() << encoding_name_info(name));
}

void
append_utf8(string& out, uint32_t code_point)
{
    if (code_point < 0x80)
    {
        out.push_back(char(code_point));
    }
    else if (code_point < 0x800)
    {
        out.push_back(char(0xc0 | (code_point >> 6)));
        out.push_back(char(0x80 | (code_point & 0x3f)));
    }
    else if (code_point < 0x10000)
    {
        out.push_back(char(0xe0 | (code_point >> 12)));
        out.push_back(char(0x80 | ((code_point >> 6) & 0x3f)));
        out.push_back(char(0x80 | (code_point & 0x3f)));
    }
    else
    {
        out.push_back(char(0xf0 | (code_point >> 18)));
        out.push_back(char(0x80 | ((code_point >> 12) & 0x3f)));
        out.push_back(char(0x80 | ((code_point >> 6) & 0x3f)));
        out.push_back(char(0x80 | (code_point & 0x3f)));
    }
}

string
to_utf8(string const& bytes, text_encoding encoding)
{
    switch (encoding)
    {
        case text_encoding::UTF8:
        default:
            return bytes;
        case text_encoding::LATIN1: {
            string utf8;
            utf8.reserve(bytes.size());
            for (char c : bytes)
                append_utf8(utf8, static_cast<unsigned char>(c));
            return utf8;
        }
        case text_encoding::ASCII:
            for (char c : bytes)
            {
                if (static_cast<unsigned char>(c) > 0x7f)
                {
                    JSONEASE_THROW(
                        malformed_input()
                        << parsing_error_info("non-ASCII byte in ASCII text"));
                }
            }
            return bytes;
    }
}

[[noreturn]] static void
throw_invalid_utf8(size_t offset)
{
    JSONEASE_THROW(
        malformed_input()
        << parsing_error_info(
               "invalid UTF-8 sequence at byte "
               + boost::lexical_cast<string>(offset)));
}

// Decode the UTF-8 sequence starting at :i, advancing :i past it.
static uint32_t
next_code_point(string const& text, size_t& i)
{
    auto byte = [&](size_t k) -> uint32_t {
        return static_cast<unsigned char>(text[k]);
    };
    uint32_t lead = byte(i);
    if (lead < 0x80)
    {
        ++i;
        return lead;
    }
    size_t length = (lead & 0xe0) == 0xc0   ? 2
                    : (lead & 0xf0) == 0xe0 ? 3
                    : (lead & 0xf8) == 0xf0 ? 4
                                            : 0;
    if (length == 0 || i + length > text.size())
        throw_invalid_utf8(i);
    uint32_t code_point = lead & (0xff >> (length + 1));
    for (size_t k = 1; k != length; ++k)
    {
        if ((byte(i + k) & 0xc0) != 0x80)
            throw_invalid_utf8(i);
        code_point = (code_point << 6) | (byte(i + k) & 0x3f);
    }
    i += length;
    return code_point;
}

string
from_utf8(string const& text, text_encoding encoding)
{
    if (encoding == text_encoding::UTF8)
        return text;
    uint32_t const limit = encoding == text_encoding::LATIN1 ? 0xff : 0x7f;
    string narrowed;
    narrowed.reserve(text.size());
    size_t i = 0;
    while (i != text.size())
    {
        uint32_t code_point = next_code_point(text, i);
        if (code_point > limit)
        {
            JSONEASE_THROW(
                unencodable_character()
                << encoding_name_info(boost::lexical_cast<string>(encoding))
                << code_point_info(code_point));
        }
        narrowed.push_back(char(code_point));
    }
    return narrowed;
}

} // namespace jsonease
