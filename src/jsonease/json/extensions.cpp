#include <jsonease/json/extensions.hpp>

#include <stdexcept>

#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fmt/format.h>

namespace jsonease {

// The date and time patterns are written so that they can be concatenated into
// the datetime pattern.
#define JSONEASE_DATE_PATTERN                                                 \
    "([12][0-9]{3})-(0[1-9]|1[0-2])-(0[1-9]|[12][0-9]|3[01])"
#define JSONEASE_TIME_PATTERN                                                 \
    "(2[0-3]|[01][0-9]):([0-5][0-9])"                                         \
    "(?::([0-5][0-9])(?:\\.([0-9]{1,6})[0-9]{0,6})?)?"
#define JSONEASE_OFFSET_PATTERN "(Z|z|[+-][0-9]{2}(?::?[0-9]{2})?)"

static boost::regex const uuid_pattern(
    "[a-f0-9]{8}-[a-f0-9]{4}-[1-5][a-f0-9]{3}-[89ab][a-f0-9]{3}-[a-f0-9]{12}",
    boost::regex::icase);
static boost::regex const date_pattern(JSONEASE_DATE_PATTERN);
static boost::regex const time_pattern(JSONEASE_TIME_PATTERN);
static boost::regex const datetime_pattern(
    JSONEASE_DATE_PATTERN "[T ]" JSONEASE_TIME_PATTERN JSONEASE_OFFSET_PATTERN
                          "?");

static int
to_int(boost::ssub_match const& group)
{
    return boost::lexical_cast<int>(group.str());
}

// Microseconds are written with up to six digits and are left-justified, so
// ".5" means 500000 microseconds.
static int
to_microseconds(boost::ssub_match const& group)
{
    string digits = group.str();
    digits.resize(6, '0');
    return boost::lexical_cast<int>(digits);
}

// Construct a date from the three captures starting at :first.
// Out-of-range dates (like February 31st) throw std::out_of_range.
static date
make_date(boost::smatch const& match, size_t first)
{
    return date(
        to_int(match[first]), to_int(match[first + 1]), to_int(match[first + 2]));
}

// Construct a time of day from the four captures starting at :first.
static time_of_day
make_time(boost::smatch const& match, size_t first)
{
    time_of_day t = boost::posix_time::hours(to_int(match[first]))
                    + boost::posix_time::minutes(to_int(match[first + 1]));
    if (match[first + 2].matched)
        t += boost::posix_time::seconds(to_int(match[first + 2]));
    if (match[first + 3].matched)
        t += boost::posix_time::microseconds(to_microseconds(match[first + 3]));
    return t;
}

// Parse a UTC offset as minutes east of Greenwich.
// Returns none if the offset is out of range.
static optional<int>
parse_utc_offset(string const& offset)
{
    if (offset == "Z" || offset == "z")
        return 0;
    int hours = boost::lexical_cast<int>(offset.substr(1, 2));
    int minutes = offset.size() > 3
                      ? boost::lexical_cast<int>(offset.substr(offset.size() - 2))
                      : 0;
    if (hours >= 24 || minutes >= 60)
        return none;
    int total = hours * 60 + minutes;
    return offset[0] == '-' ? -total : total;
}

optional<dynamic>
recognize_uuid(string const& s)
{
    if (!boost::regex_match(s, uuid_pattern))
        return none;
    boost::uuids::string_generator generate;
    return dynamic(generate(s));
}

optional<dynamic>
recognize_datetime(string const& s)
{
    boost::smatch match;
    if (!boost::regex_match(s, match, datetime_pattern))
        return none;
    try
    {
        datetime t;
        t.local = boost::posix_time::ptime(make_date(match, 1), make_time(match, 4));
        if (match[8].matched)
        {
            auto offset = parse_utc_offset(match[8].str());
            if (!offset)
                return none;
            t.utc_offset = *offset;
        }
        return dynamic(t);
    }
    catch (std::out_of_range&)
    {
        return none;
    }
}

optional<dynamic>
recognize_date(string const& s)
{
    boost::smatch match;
    if (!boost::regex_match(s, match, date_pattern))
        return none;
    try
    {
        return dynamic(make_date(match, 1));
    }
    catch (std::out_of_range&)
    {
        return none;
    }
}

optional<dynamic>
recognize_time(string const& s)
{
    boost::smatch match;
    if (!boost::regex_match(s, match, time_pattern))
        return none;
    return dynamic(make_time(match, 1));
}

// Get a complex number part. Null counts as zero.
static double
get_complex_part(dynamic const& part)
{
    if (part.type() == value_type::NIL)
        return 0;
    if (!is_number(part))
    {
        JSONEASE_THROW(
            malformed_input() << parsing_error_info(
                "complex number parts must be numbers"));
    }
    return number_as_double(part);
}

optional<dynamic>
recognize_complex(dynamic_object const& object)
{
    if (!has_same_keys(object, {"real", "imag"}))
        return none;
    return dynamic(complex(
        get_complex_part(get_field(object, "real")),
        get_complex_part(get_field(object, "imag"))));
}

static dynamic const&
get_range_bound(dynamic_object const& object, char const* name)
{
    dynamic const& bound = get_field(object, name);
    if (bound.type() != value_type::NIL && !is_number(bound))
    {
        JSONEASE_THROW(
            malformed_input()
            << parsing_error_info("range bounds must be numbers or null")
            << field_name_info(name));
    }
    return bound;
}

optional<dynamic>
recognize_range(dynamic_object const& object)
{
    if (!has_same_keys(object, {"start", "stop", "step"}))
        return none;
    range r;
    r.start = get_range_bound(object, "start");
    r.stop = get_range_bound(object, "stop");
    r.step = get_range_bound(object, "step");
    return dynamic(r);
}

string
format_uuid(uuid const& id)
{
    return boost::uuids::to_string(id);
}

string
format_date(date const& d)
{
    return fmt::format(
        "{:04d}-{:02d}-{:02d}",
        int(d.year()),
        int(d.month().as_number()),
        int(d.day().as_number()));
}

string
format_time(time_of_day const& t)
{
    return fmt::format(
        "{:02d}:{:02d}:{:02d}",
        int(t.hours()),
        int(t.minutes()),
        int(t.seconds()));
}

string
format_datetime(datetime const& t)
{
    string text = format_date(t.local.date()) + "T"
                  + format_time(t.local.time_of_day());
    if (t.utc_offset == 0)
        return text + "Z";
    int magnitude = t.utc_offset < 0 ? -t.utc_offset : t.utc_offset;
    return text
           + fmt::format(
               "{}{:02d}:{:02d}",
               t.utc_offset < 0 ? '-' : '+',
               magnitude / 60,
               magnitude % 60);
}

} // namespace jsonease
