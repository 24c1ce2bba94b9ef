#include <jsonease/json/encoder.hpp>

#include <charconv>
#include <cmath>
#include <cstdlib>

#include <boost/lexical_cast.hpp>

#include <fmt/format.h>

#include <jsonease/core/logging.hpp>
#include <jsonease/json/extensions.hpp>
#include <jsonease/json/reflection.hpp>

namespace jsonease {

// FORMATTING HELPERS

void
write_json_string(string& out, string const& s)
{
    out.push_back('"');
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                    out += fmt::format("\\u{:04x}", int(c));
                else
                    out.push_back(c);
        }
    }
    out.push_back('"');
}

void
write_float(string& out, double x)
{
    // The shortest round-trip representation in scientific notation gives us
    // the significant digits and the decimal exponent.
    char buffer[32];
    auto result = std::to_chars(
        buffer, buffer + sizeof(buffer), x, std::chars_format::scientific);
    string scientific(buffer, result.ptr);

    bool negative = scientific[0] == '-';
    size_t e = scientific.find('e');
    string digits;
    for (size_t i = negative ? 1 : 0; i != e; ++i)
    {
        if (scientific[i] != '.')
            digits.push_back(scientific[i]);
    }
    int exponent = std::stoi(scientific.substr(e + 1));

    if (negative)
        out.push_back('-');
    if (exponent >= -4 && exponent < 16)
    {
        if (exponent < 0)
        {
            out += "0.";
            out.append(size_t(-exponent - 1), '0');
            out += digits;
        }
        else if (digits.size() <= size_t(exponent) + 1)
        {
            out += digits;
            out.append(size_t(exponent) + 1 - digits.size(), '0');
            out += ".0";
        }
        else
        {
            out.append(digits, 0, size_t(exponent) + 1);
            out.push_back('.');
            out.append(digits, size_t(exponent) + 1, string::npos);
        }
    }
    else
    {
        out.push_back(digits[0]);
        if (digits.size() > 1)
        {
            out.push_back('.');
            out.append(digits, 1, string::npos);
        }
        out += fmt::format(
            "e{}{:02d}", exponent < 0 ? '-' : '+', std::abs(exponent));
    }
}

static void
write_items(
    value_encoder const& encoder, string& out, dynamic_array const& items)
{
    if (items.empty())
    {
        out += "[]";
        return;
    }
    out.push_back('[');
    bool first = true;
    for (auto const& item : items)
    {
        if (!first)
            out += ", ";
        first = false;
        encoder.write(out, item);
    }
    out.push_back(']');
}

static void
write_entries(
    value_encoder const& encoder, string& out, dynamic_object const& entries)
{
    if (entries.empty())
    {
        out += "{}";
        return;
    }
    out.push_back('{');
    bool first = true;
    for (auto const& entry : entries)
    {
        if (!first)
            out += ", ";
        first = false;
        write_json_string(out, entry.first);
        out += ": ";
        encoder.write(out, entry.second);
    }
    out.push_back('}');
}

// BASIC PROBES

static bool
write_null(value_encoder const&, dynamic const& value, string& out)
{
    if (value.type() != value_type::NIL)
        return false;
    out += "null";
    return true;
}

static bool
write_boolean(value_encoder const&, dynamic const& value, string& out)
{
    if (value.type() != value_type::BOOLEAN)
        return false;
    out += cast<bool>(value) ? "true" : "false";
    return true;
}

static bool
write_number(value_encoder const&, dynamic const& value, string& out)
{
    switch (value.type())
    {
        case value_type::INTEGER:
            out += std::to_string(cast<integer>(value));
            return true;
        case value_type::FLOAT: {
            double x = cast<double>(value);
            // NaN and infinities have no JSON representation.
            if (!std::isfinite(x))
                return false;
            write_float(out, x);
            return true;
        }
        default:
            return false;
    }
}

static bool
write_string(value_encoder const&, dynamic const& value, string& out)
{
    if (value.type() != value_type::STRING)
        return false;
    write_json_string(out, cast<string>(value));
    return true;
}

static bool
write_array(value_encoder const& encoder, dynamic const& value, string& out)
{
    if (value.type() != value_type::ARRAY)
        return false;
    write_items(encoder, out, cast<dynamic_array>(value));
    return true;
}

static bool
write_object(value_encoder const& encoder, dynamic const& value, string& out)
{
    if (value.type() != value_type::OBJECT)
        return false;
    write_entries(encoder, out, cast<dynamic_object>(value));
    return true;
}

std::vector<encoding_probe>
basic_encoding_probes()
{
    return {
        write_null,
        write_boolean,
        write_number,
        write_string,
        write_array,
        write_object};
}

// ADVANCED PROBES

static bool
write_uuid(value_encoder const&, dynamic const& value, string& out)
{
    if (value.type() != value_type::UUID)
        return false;
    write_json_string(out, format_uuid(cast<uuid>(value)));
    return true;
}

static bool
write_complex(value_encoder const&, dynamic const& value, string& out)
{
    if (value.type() != value_type::COMPLEX)
        return false;
    complex const& z = cast<complex>(value);
    if (!std::isfinite(z.real()) || !std::isfinite(z.imag()))
        return false;
    out += "{\"real\": ";
    write_float(out, z.real());
    out += ", \"imag\": ";
    write_float(out, z.imag());
    out.push_back('}');
    return true;
}

// Range bounds must be nil or numbers to be recognized again on decoding.
static bool
is_range_bound(dynamic const& bound)
{
    switch (bound.type())
    {
        case value_type::NIL:
        case value_type::INTEGER:
        case value_type::FLOAT:
            return true;
        default:
            return false;
    }
}

static bool
write_range(value_encoder const& encoder, dynamic const& value, string& out)
{
    if (value.type() != value_type::RANGE)
        return false;
    range const& r = cast<range>(value);
    if (!is_range_bound(r.start) || !is_range_bound(r.stop)
        || !is_range_bound(r.step))
    {
        return false;
    }
    out += "{\"start\": ";
    encoder.write(out, r.start);
    out += ", \"stop\": ";
    encoder.write(out, r.stop);
    out += ", \"step\": ";
    encoder.write(out, r.step);
    out.push_back('}');
    return true;
}

// Only a time within a single day has an ISO form.
static bool
is_clock_time(time_of_day const& t)
{
    return !t.is_special() && !t.is_negative()
           && t < boost::posix_time::hours(24);
}

static bool
write_date_or_time(value_encoder const&, dynamic const& value, string& out)
{
    switch (value.type())
    {
        case value_type::DATE: {
            auto const& d = cast<date>(value);
            if (d.is_special())
                return false;
            write_json_string(out, format_date(d));
            return true;
        }
        case value_type::TIME: {
            auto const& t = cast<time_of_day>(value);
            if (!is_clock_time(t))
                return false;
            write_json_string(out, format_time(t));
            return true;
        }
        case value_type::DATETIME: {
            auto const& t = cast<datetime>(value);
            if (t.local.is_special() || t.utc_offset <= -24 * 60
                || t.utc_offset >= 24 * 60)
            {
                return false;
            }
            write_json_string(out, format_datetime(t));
            return true;
        }
        default:
            return false;
    }
}

static bool
write_sequence(value_encoder const& encoder, dynamic const& value, string& out)
{
    if (value.type() != value_type::SEQUENCE)
        return false;
    write_items(encoder, out, cast<dynamic_sequence>(value).items);
    return true;
}

static bool
write_mapping(value_encoder const& encoder, dynamic const& value, string& out)
{
    if (value.type() != value_type::MAPPING)
        return false;
    write_entries(encoder, out, cast<dynamic_mapping>(value).entries);
    return true;
}

std::vector<encoding_probe>
advanced_encoding_probes()
{
    auto probes = basic_encoding_probes();
    probes.insert(
        probes.end(),
        {write_uuid,
         write_complex,
         write_range,
         write_date_or_time,
         write_sequence,
         write_mapping});
    return probes;
}

// CUSTOM PROBES

static bool
write_structure(
    value_encoder const& encoder, dynamic const& value, string& out)
{
    if (value.type() != value_type::STRUCTURE)
        return false;
    auto const& pointer = cast<structure_ptr>(value);
    if (!pointer)
        return false;
    structure const& s = *pointer;
    auto state = s.equivalent_state();
    if (state)
    {
        encoder.write(out, *state);
        return true;
    }
    auto json = s.to_json();
    if (json)
    {
        out += *json;
        return true;
    }
    write_entries(encoder, out, reflect_structure(s));
    return true;
}

std::vector<encoding_probe>
custom_encoding_probes()
{
    auto probes = advanced_encoding_probes();
    probes.push_back(write_structure);
    return probes;
}

std::vector<encoding_probe>
get_encoding_probes(chain_tier tier)
{
    switch (tier)
    {
        case chain_tier::BASIC:
            return basic_encoding_probes();
        case chain_tier::ADVANCED:
            return advanced_encoding_probes();
        case chain_tier::CUSTOM:
            return custom_encoding_probes();
        default:
            JSONEASE_THROW(
                invalid_enum_value()
                << enum_id_info("chain_tier") << enum_value_info(int(tier)));
    }
}

// VALUE ENCODER

value_encoder::value_encoder(
    chain_tier tier,
    text_encoding encoding,
    std::vector<encoding_probe> probes)
    : tier_(tier), encoding_(encoding), probes_(std::move(probes))
{
}

string
value_encoder::encode(dynamic const& value) const
{
    string out;
    write(out, value);
    return out;
}

bool
value_encoder::try_write(string& out, dynamic const& value) const
{
    for (auto const& probe : probes_)
    {
        if (probe(*this, value, out))
            return true;
    }
    return false;
}

void
value_encoder::write(string& out, dynamic const& value) const
{
    if (!try_write(out, value))
    {
        JSONEASE_THROW(
            unsupported_type()
            << value_type_info(value.type())
            << chain_tier_info(boost::lexical_cast<string>(tier_))
            << unsupported_reason_info(
                   value.type() == value_type::FLOAT
                       ? "non-finite floats have no JSON representation"
                       : "no probe recognized the value"));
    }
}

value_encoder
make_encoder(chain_tier tier, string const& encoding)
{
    get_logger()->debug(
        "making {} encoder for {}",
        boost::lexical_cast<string>(tier),
        encoding);
    return value_encoder(
        tier, parse_text_encoding(encoding), get_encoding_probes(tier));
}

} // namespace jsonease
