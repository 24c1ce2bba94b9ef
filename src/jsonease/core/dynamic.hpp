#ifndef JSONEASE_CORE_DYNAMIC_HPP
#define JSONEASE_CORE_DYNAMIC_HPP

#include <list>
#include <ostream>

#include <jsonease/core/exception.hpp>
#include <jsonease/core/type_definitions.hpp>

namespace jsonease {

// DYNAMIC VALUES - Dynamic values are values whose structure is determined at
// run-time rather than compile time.

std::ostream&
operator<<(std::ostream& s, value_type t);

// Check that two value types match.
void
check_type(value_type expected, value_type actual);

// If the above check fails, it throws this exception.
JSONEASE_DEFINE_EXCEPTION(type_mismatch)
JSONEASE_DEFINE_ERROR_INFO(value_type, expected_value_type)
JSONEASE_DEFINE_ERROR_INFO(value_type, actual_value_type)

// invalid_enum_value is thrown when an enum's raw (integer) value is invalid.
JSONEASE_DEFINE_EXCEPTION(invalid_enum_value)
JSONEASE_DEFINE_ERROR_INFO(string, enum_id)
JSONEASE_DEFINE_ERROR_INFO(int, enum_value)

// invalid_enum_string is thrown when attempting to convert a string value to
// an enum and the string doesn't match any of the enum's cases.
JSONEASE_DEFINE_EXCEPTION(invalid_enum_string)
// Note that this also uses the enum_id info declared above.
JSONEASE_DEFINE_ERROR_INFO(string, enum_string)

// Get the value_type value for a C++ type.
template<class T>
struct value_type_of
{
};
template<>
struct value_type_of<nil_t>
{
    static value_type const value = value_type::NIL;
};
template<>
struct value_type_of<bool>
{
    static value_type const value = value_type::BOOLEAN;
};
template<>
struct value_type_of<integer>
{
    static value_type const value = value_type::INTEGER;
};
template<>
struct value_type_of<double>
{
    static value_type const value = value_type::FLOAT;
};
template<>
struct value_type_of<string>
{
    static value_type const value = value_type::STRING;
};
template<>
struct value_type_of<dynamic_array>
{
    static value_type const value = value_type::ARRAY;
};
template<>
struct value_type_of<dynamic_object>
{
    static value_type const value = value_type::OBJECT;
};
template<>
struct value_type_of<uuid>
{
    static value_type const value = value_type::UUID;
};
template<>
struct value_type_of<date>
{
    static value_type const value = value_type::DATE;
};
template<>
struct value_type_of<time_of_day>
{
    static value_type const value = value_type::TIME;
};
template<>
struct value_type_of<datetime>
{
    static value_type const value = value_type::DATETIME;
};
template<>
struct value_type_of<complex>
{
    static value_type const value = value_type::COMPLEX;
};
template<>
struct value_type_of<range>
{
    static value_type const value = value_type::RANGE;
};
template<>
struct value_type_of<dynamic_sequence>
{
    static value_type const value = value_type::SEQUENCE;
};
template<>
struct value_type_of<dynamic_mapping>
{
    static value_type const value = value_type::MAPPING;
};
template<>
struct value_type_of<structure_ptr>
{
    static value_type const value = value_type::STRUCTURE;
};

// OBJECTS

// This queries an object for a field with a key matching the given string.
// If the field is not present in the object, an exception is thrown.
dynamic const&
get_field(dynamic_object const& r, string const& field);
// non-const version
dynamic&
get_field(dynamic_object& r, string const& field);

JSONEASE_DEFINE_EXCEPTION(missing_field)
JSONEASE_DEFINE_ERROR_INFO(string, field_name)

// This is the same as above, but its return value indicates whether or not
// the field is in the object.
bool
get_field(dynamic const** v, dynamic_object const& r, string const& field);

// Do the two objects contain the same keys?
// (Order is ignored. Values aren't compared.)
bool
has_same_keys(
    dynamic_object const& object, std::initializer_list<char const*> keys);

// When an error occurs in the processing of a dynamic value, this provides the
// path to the location within the value where the error occurred.
JSONEASE_DEFINE_ERROR_INFO(std::list<dynamic>, dynamic_value_path)

// Given an exception :e, this will add :path_element to the beginning of the
// dynamic_value_path info associated with :e. If there is currently no path
// info associated with :e, a path containing only :p is associated with it.
void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element);

// VALUES

// Cast a dynamic value to one of the base types.
template<class T>
T const&
cast(dynamic const& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T const&>(v.contents());
}
// Same, but with a non-const reference.
template<class T>
T&
cast(dynamic& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&>(v.contents());
}
// Same, but with move semantics.
template<class T>
T&&
cast(dynamic&& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&&>(std::move(v).contents());
}

// Is :v a number (an integer or a float)?
inline bool
is_number(dynamic const& v)
{
    return v.type() == value_type::INTEGER || v.type() == value_type::FLOAT;
}

// Get the value of a number (integer or float) as a double.
double
number_as_double(dynamic const& v);

// Writes :v as compact JSON (using every extended encoding).
std::ostream&
operator<<(std::ostream& os, dynamic const& v);

std::ostream&
operator<<(std::ostream& os, std::list<dynamic> const& v);

void
swap(dynamic& a, dynamic& b);

bool
operator==(dynamic const& a, dynamic const& b);
bool
operator!=(dynamic const& a, dynamic const& b);

// Comparison of the other composite types follows the same rules as dynamic.
// Object comparison ignores key order.
bool
operator==(dynamic_object const& a, dynamic_object const& b);
bool
operator!=(dynamic_object const& a, dynamic_object const& b);
bool
operator==(datetime const& a, datetime const& b);
bool
operator!=(datetime const& a, datetime const& b);
bool
operator==(range const& a, range const& b);
bool
operator!=(range const& a, range const& b);
bool
operator==(dynamic_sequence const& a, dynamic_sequence const& b);
bool
operator!=(dynamic_sequence const& a, dynamic_sequence const& b);
bool
operator==(dynamic_mapping const& a, dynamic_mapping const& b);
bool
operator!=(dynamic_mapping const& a, dynamic_mapping const& b);

// Two structures are equal if they have the same type name and the same own
// fields.
bool
structures_equal(structure const& a, structure const& b);

// Apply the functor fn to the value v.
// fn must have the function call operator overloaded for all supported
// types (including nil). If it doesn't, you'll get a compile-time error.
template<class Fn>
auto
apply_to_dynamic(Fn&& fn, dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // All cases are covered, so this is just to avoid warnings.
            return fn(nil);
        case value_type::BOOLEAN:
            return fn(cast<bool>(v));
        case value_type::INTEGER:
            return fn(cast<integer>(v));
        case value_type::FLOAT:
            return fn(cast<double>(v));
        case value_type::STRING:
            return fn(cast<string>(v));
        case value_type::ARRAY:
            return fn(cast<dynamic_array>(v));
        case value_type::OBJECT:
            return fn(cast<dynamic_object>(v));
        case value_type::UUID:
            return fn(cast<uuid>(v));
        case value_type::DATE:
            return fn(cast<date>(v));
        case value_type::TIME:
            return fn(cast<time_of_day>(v));
        case value_type::DATETIME:
            return fn(cast<datetime>(v));
        case value_type::COMPLEX:
            return fn(cast<complex>(v));
        case value_type::RANGE:
            return fn(cast<range>(v));
        case value_type::SEQUENCE:
            return fn(cast<dynamic_sequence>(v));
        case value_type::MAPPING:
            return fn(cast<dynamic_mapping>(v));
        case value_type::STRUCTURE:
            return fn(cast<structure_ptr>(v));
    }
}

} // namespace jsonease

#endif
