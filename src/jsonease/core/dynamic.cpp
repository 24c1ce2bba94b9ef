#include <jsonease/core/dynamic.hpp>

#include <algorithm>
#include <type_traits>

#include <jsonease/json/encoder.hpp>

namespace jsonease {

std::ostream&
operator<<(std::ostream& s, value_type t)
{
    switch (t)
    {
        case value_type::NIL:
            s << "nil";
            break;
        case value_type::BOOLEAN:
            s << "boolean";
            break;
        case value_type::INTEGER:
            s << "integer";
            break;
        case value_type::FLOAT:
            s << "float";
            break;
        case value_type::STRING:
            s << "string";
            break;
        case value_type::ARRAY:
            s << "array";
            break;
        case value_type::OBJECT:
            s << "object";
            break;
        case value_type::UUID:
            s << "uuid";
            break;
        case value_type::DATE:
            s << "date";
            break;
        case value_type::TIME:
            s << "time";
            break;
        case value_type::DATETIME:
            s << "datetime";
            break;
        case value_type::COMPLEX:
            s << "complex";
            break;
        case value_type::RANGE:
            s << "range";
            break;
        case value_type::SEQUENCE:
            s << "sequence";
            break;
        case value_type::MAPPING:
            s << "mapping";
            break;
        case value_type::STRUCTURE:
            s << "structure";
            break;
        default:
            JSONEASE_THROW(
                invalid_enum_value()
                << enum_id_info("value_type") << enum_value_info(int(t)));
    }
    return s;
}

void
check_type(value_type expected, value_type actual)
{
    if (expected != actual)
    {
        JSONEASE_THROW(
            type_mismatch() << expected_value_type_info(expected)
                            << actual_value_type_info(actual));
    }
}

dynamic::dynamic(std::initializer_list<dynamic> list)
{
    // If this is a list of arrays, all of which are length two and have
    // strings as their first elements, treat it as an object.
    if (list.size() != 0
        && std::all_of(list.begin(), list.end(), [](dynamic const& v) {
               return v.type() == value_type::ARRAY
                      && cast<dynamic_array>(v).size() == 2
                      && cast<dynamic_array>(v)[0].type()
                             == value_type::STRING;
           }))
    {
        dynamic_object object;
        for (auto const& v : list)
        {
            auto const& array = cast<dynamic_array>(v);
            object.set(cast<string>(array[0]), array[1]);
        }
        *this = std::move(object);
    }
    else
    {
        *this = dynamic_array(list);
    }
}

void
dynamic::set(nil_t _)
{
    type_ = value_type::NIL;
    value_.reset();
}
void
dynamic::set(bool v)
{
    type_ = value_type::BOOLEAN;
    value_ = v;
}
void
dynamic::set(integer v)
{
    type_ = value_type::INTEGER;
    value_ = v;
}
void
dynamic::set(double v)
{
    type_ = value_type::FLOAT;
    value_ = v;
}
void
dynamic::set(string const& v)
{
    type_ = value_type::STRING;
    value_ = v;
}
void
dynamic::set(string&& v)
{
    type_ = value_type::STRING;
    value_ = std::move(v);
}
void
dynamic::set(dynamic_array const& v)
{
    type_ = value_type::ARRAY;
    value_ = v;
}
void
dynamic::set(dynamic_array&& v)
{
    type_ = value_type::ARRAY;
    value_ = std::move(v);
}
void
dynamic::set(dynamic_object const& v)
{
    type_ = value_type::OBJECT;
    value_ = v;
}
void
dynamic::set(dynamic_object&& v)
{
    type_ = value_type::OBJECT;
    value_ = std::move(v);
}
void
dynamic::set(uuid const& v)
{
    type_ = value_type::UUID;
    value_ = v;
}
void
dynamic::set(date const& v)
{
    type_ = value_type::DATE;
    value_ = v;
}
void
dynamic::set(time_of_day const& v)
{
    type_ = value_type::TIME;
    value_ = v;
}
void
dynamic::set(datetime const& v)
{
    type_ = value_type::DATETIME;
    value_ = v;
}
void
dynamic::set(complex const& v)
{
    type_ = value_type::COMPLEX;
    value_ = v;
}
void
dynamic::set(range const& v)
{
    type_ = value_type::RANGE;
    value_ = v;
}
void
dynamic::set(dynamic_sequence const& v)
{
    type_ = value_type::SEQUENCE;
    value_ = v;
}
void
dynamic::set(dynamic_sequence&& v)
{
    type_ = value_type::SEQUENCE;
    value_ = std::move(v);
}
void
dynamic::set(dynamic_mapping const& v)
{
    type_ = value_type::MAPPING;
    value_ = v;
}
void
dynamic::set(dynamic_mapping&& v)
{
    type_ = value_type::MAPPING;
    value_ = std::move(v);
}
void
dynamic::set(structure_ptr const& v)
{
    type_ = value_type::STRUCTURE;
    value_ = v;
}

void
swap(dynamic& a, dynamic& b)
{
    using std::swap;
    swap(a.type_, b.type_);
    swap(a.value_, b.value_);
}

// OBJECTS

dynamic_object::dynamic_object(std::initializer_list<entry> entries)
{
    for (auto const& e : entries)
        set(e.first, e.second);
}

dynamic&
dynamic_object::operator[](string const& key)
{
    dynamic* existing = find(key);
    if (existing)
        return *existing;
    entries_.emplace_back(key, dynamic());
    return entries_.back().second;
}

void
dynamic_object::set(string key, dynamic value)
{
    dynamic* existing = find(key);
    if (existing)
        *existing = std::move(value);
    else
        entries_.emplace_back(std::move(key), std::move(value));
}

dynamic const*
dynamic_object::find(string const& key) const
{
    for (auto const& e : entries_)
    {
        if (e.first == key)
            return &e.second;
    }
    return nullptr;
}

dynamic*
dynamic_object::find(string const& key)
{
    for (auto& e : entries_)
    {
        if (e.first == key)
            return &e.second;
    }
    return nullptr;
}

bool
dynamic_object::erase(string const& key)
{
    auto i = std::find_if(entries_.begin(), entries_.end(), [&](entry const& e) {
        return e.first == key;
    });
    if (i == entries_.end())
        return false;
    entries_.erase(i);
    return true;
}

dynamic const&
get_field(dynamic_object const& r, string const& field)
{
    dynamic const* v;
    if (!get_field(&v, r, field))
    {
        JSONEASE_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

dynamic&
get_field(dynamic_object& r, string const& field)
{
    dynamic* v = r.find(field);
    if (!v)
    {
        JSONEASE_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

bool
get_field(dynamic const** v, dynamic_object const& r, string const& field)
{
    *v = r.find(field);
    return *v != nullptr;
}

bool
has_same_keys(
    dynamic_object const& object, std::initializer_list<char const*> keys)
{
    if (object.size() != keys.size())
        return false;
    return std::all_of(keys.begin(), keys.end(), [&](char const* key) {
        return object.contains(key);
    });
}

void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element)
{
    std::list<dynamic>* info = get_error_info<dynamic_value_path_info>(e);
    if (info)
    {
        info->push_front(path_element);
    }
    else
    {
        e << dynamic_value_path_info(std::list<dynamic>({path_element}));
    }
}

double
number_as_double(dynamic const& v)
{
    if (v.type() == value_type::INTEGER)
        return double(cast<integer>(v));
    return cast<double>(v);
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v)
{
    os << make_encoder(chain_tier::CUSTOM).encode(v);
    return os;
}

std::ostream&
operator<<(std::ostream& os, std::list<dynamic> const& v)
{
    os << dynamic(dynamic_array{std::begin(v), std::end(v)});
    return os;
}

// COMPARISON OPERATORS

static inline bool
operator==(nil_t, nil_t)
{
    return true;
}

bool
structures_equal(structure const& a, structure const& b)
{
    return a.type_name() == b.type_name() && a.fields() == b.fields();
}

bool
operator==(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return false;
    switch (a.type())
    {
        case value_type::NIL:
            return true;
        case value_type::STRUCTURE: {
            auto const& x = cast<structure_ptr>(a);
            auto const& y = cast<structure_ptr>(b);
            if (!x || !y)
                return x == y;
            return x == y || structures_equal(*x, *y);
        }
        default:
            return apply_to_dynamic(
                [&b](auto const& x) {
                    return x == cast<std::decay_t<decltype(x)>>(b);
                },
                a);
    }
}
bool
operator!=(dynamic const& a, dynamic const& b)
{
    return !(a == b);
}

bool
operator==(dynamic_object const& a, dynamic_object const& b)
{
    if (a.size() != b.size())
        return false;
    for (auto const& e : a)
    {
        dynamic const* other = b.find(e.first);
        if (!other || *other != e.second)
            return false;
    }
    return true;
}
bool
operator!=(dynamic_object const& a, dynamic_object const& b)
{
    return !(a == b);
}

bool
operator==(datetime const& a, datetime const& b)
{
    return a.local == b.local && a.utc_offset == b.utc_offset;
}
bool
operator!=(datetime const& a, datetime const& b)
{
    return !(a == b);
}

bool
operator==(range const& a, range const& b)
{
    return a.start == b.start && a.stop == b.stop && a.step == b.step;
}
bool
operator!=(range const& a, range const& b)
{
    return !(a == b);
}

bool
operator==(dynamic_sequence const& a, dynamic_sequence const& b)
{
    return a.items == b.items;
}
bool
operator!=(dynamic_sequence const& a, dynamic_sequence const& b)
{
    return !(a == b);
}

bool
operator==(dynamic_mapping const& a, dynamic_mapping const& b)
{
    return a.entries == b.entries;
}
bool
operator!=(dynamic_mapping const& a, dynamic_mapping const& b)
{
    return !(a == b);
}

} // namespace jsonease
