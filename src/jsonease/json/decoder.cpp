#include <jsonease/json/decoder.hpp>

#include <algorithm>
#include <charconv>
#include <limits>

#include <boost/lexical_cast.hpp>

#include <jsonease/core/logging.hpp>
#include <jsonease/core/type_interfaces.hpp>
#include <jsonease/json/extensions.hpp>

namespace jsonease {

decoder_rules
basic_decoder_rules()
{
    return decoder_rules();
}

decoder_rules
advanced_decoder_rules()
{
    decoder_rules rules;
    rules.string_recognizers
        = {recognize_uuid, recognize_datetime, recognize_date, recognize_time};
    rules.object_recognizers = {recognize_complex, recognize_range};
    return rules;
}

decoder_rules
get_decoder_rules(chain_tier tier)
{
    switch (tier)
    {
        case chain_tier::BASIC:
            return basic_decoder_rules();
        case chain_tier::ADVANCED:
        case chain_tier::CUSTOM:
            return advanced_decoder_rules();
        default:
            JSONEASE_THROW(
                invalid_enum_value()
                << enum_id_info("chain_tier") << enum_value_info(int(tier)));
    }
}

value_decoder::value_decoder(
    text_encoding encoding, decoder_rules rules, unsigned max_depth)
    : encoding_(encoding), rules_(std::move(rules)), max_depth_(max_depth)
{
}

dynamic
value_decoder::decode(string const& raw) const
{
    string converted;
    if (encoding_ != text_encoding::UTF8)
        converted = to_utf8(raw, encoding_);
    string const& text = encoding_ == text_encoding::UTF8 ? raw : converted;

    if (text.empty())
        throw_malformed_input("empty JSON text");
    dynamic v;
    size_t pos = scan(&v, text, skip_byte_order_mark(text, 0));
    if (skip_whitespace(text, pos) != text.size())
        throw_malformed_input("incorrect end of JSON text");
    return v;
}

size_t
value_decoder::scan(
    dynamic* v, string const& text, size_t pos, unsigned depth) const
{
    pos = skip_whitespace(text, pos);
    switch (classify_token(text, pos))
    {
        case token_kind::NULL_LITERAL:
            *v = nil;
            return match_null(text, pos);
        case token_kind::BOOLEAN: {
            bool b;
            pos = match_boolean(&b, text, pos);
            *v = b;
            return pos;
        }
        case token_kind::NUMBER:
            return scan_number(v, text, pos);
        case token_kind::STRING:
            return scan_string(v, text, pos);
        case token_kind::ARRAY:
            return scan_array(v, text, pos, depth + 1);
        case token_kind::OBJECT:
        default:
            return scan_object(v, text, pos, depth + 1);
    }
}

// Parse the text of a float token.
// Values too large for a double become infinite, and values too small become
// zero.
static double
parse_float(char const* first, char const* last)
{
    double value = 0;
    auto result = std::from_chars(first, last, value);
    if (result.ec == std::errc::result_out_of_range)
    {
        char const* exponent = std::find_if(
            first, last, [](char c) { return c == 'e' || c == 'E'; });
        bool underflow;
        if (exponent != last)
            underflow = exponent + 1 != last && exponent[1] == '-';
        else
            underflow = first[*first == '-' ? 1 : 0] == '0';
        double magnitude
            = underflow ? 0.0 : std::numeric_limits<double>::infinity();
        return *first == '-' ? -magnitude : magnitude;
    }
    return value;
}

size_t
value_decoder::scan_number(dynamic* v, string const& text, size_t pos) const
{
    bool is_float;
    size_t end = match_number(&is_float, text, pos);
    char const* first = text.data() + pos;
    char const* last = text.data() + end;
    if (!is_float)
    {
        integer i;
        auto result = std::from_chars(first, last, i);
        if (result.ec == std::errc())
        {
            *v = i;
            return end;
        }
        // Integers that don't fit in 64 bits are decoded as floats.
    }
    *v = parse_float(first, last);
    return end;
}

size_t
value_decoder::scan_string(dynamic* v, string const& text, size_t pos) const
{
    string s;
    size_t end = match_string(&s, text, pos);
    for (auto const& recognize : rules_.string_recognizers)
    {
        auto recognized = recognize(s);
        if (recognized)
        {
            *v = std::move(*recognized);
            return end;
        }
    }
    *v = std::move(s);
    return end;
}

size_t
value_decoder::scan_array(
    dynamic* v, string const& text, size_t pos, unsigned depth) const
{
    check_nesting_depth(depth, max_depth_);
    dynamic_array items;
    size_t end = skip_whitespace(text, pos + 1);
    if (require_char(text, end, "array") != ']')
    {
        while (true)
        {
            items.emplace_back();
            end = scan(&items.back(), text, end, depth);
            end = skip_whitespace(text, end);
            char c = require_char(text, end, "array");
            if (c == ']')
                break;
            if (c != ',')
                throw_malformed_input("expected ',' or ']' in array");
            ++end;
        }
    }
    *v = std::move(items);
    return end + 1;
}

size_t
value_decoder::scan_object(
    dynamic* v, string const& text, size_t pos, unsigned depth) const
{
    check_nesting_depth(depth, max_depth_);
    dynamic_object object;
    size_t end = skip_whitespace(text, pos + 1);
    if (require_char(text, end, "object") != '}')
    {
        while (true)
        {
            string key;
            end = match_string(&key, text, skip_whitespace(text, end));
            end = skip_whitespace(text, end);
            if (require_char(text, end, "object") != ':')
                throw_malformed_input("expected ':' in object");
            dynamic value;
            end = scan(&value, text, end + 1, depth);
            // A repeated key replaces the earlier value but keeps its place.
            object.set(std::move(key), std::move(value));
            end = skip_whitespace(text, end);
            char c = require_char(text, end, "object");
            if (c == '}')
                break;
            if (c != ',')
                throw_malformed_input("expected ',' or '}' in object");
            ++end;
        }
    }
    for (auto const& recognize : rules_.object_recognizers)
    {
        auto recognized = recognize(object);
        if (recognized)
        {
            *v = std::move(*recognized);
            return end + 1;
        }
    }
    *v = std::move(object);
    return end + 1;
}

value_decoder
make_decoder(chain_tier tier, string const& encoding, unsigned max_depth)
{
    get_logger()->debug(
        "making {} decoder for {}",
        boost::lexical_cast<string>(tier),
        encoding);
    return value_decoder(
        parse_text_encoding(encoding), get_decoder_rules(tier), max_depth);
}

[[noreturn]] static void
throw_casting_error(target_type const& target, dynamic const& value)
{
    JSONEASE_THROW(
        casting_error()
        << target_field_count_info(target.field_names.size())
        << decoded_value_type_info(value.type()));
}

dynamic
customize(dynamic const& value, target_type const& target)
{
    auto const& names = target.field_names;
    if (names.empty())
        return target.construct(dynamic_array());

    switch (value.type())
    {
        case value_type::ARRAY:
        case value_type::SEQUENCE: {
            dynamic_array const& items = get_items(value);
            if (items.size() != names.size())
                throw_casting_error(target, value);
            return target.construct(items);
        }
        case value_type::OBJECT:
        case value_type::MAPPING: {
            dynamic_object const& entries = get_entries(value);
            dynamic_array arguments;
            arguments.reserve(names.size());
            for (auto const& name : names)
            {
                dynamic const* field = entries.find(name);
                if (!field)
                {
                    JSONEASE_THROW(
                        casting_error()
                        << target_field_count_info(names.size())
                        << decoded_value_type_info(value.type())
                        << field_name_info(name));
                }
                arguments.push_back(*field);
            }
            return target.construct(arguments);
        }
        case value_type::STRUCTURE:
            // Decoding never produces structures.
            throw_casting_error(target, value);
        default:
            // Everything else (including complex numbers and ranges) is
            // treated as a single scalar argument.
            if (names.size() != 1)
                throw_casting_error(target, value);
            return target.construct(dynamic_array(1, value));
    }
}

} // namespace jsonease
