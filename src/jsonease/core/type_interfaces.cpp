#include <jsonease/core/type_interfaces.hpp>

#include <boost/numeric/conversion/cast.hpp>

namespace jsonease {

// BOOL

void
to_dynamic(dynamic* v, bool x)
{
    *v = x;
}

void
from_dynamic(bool* x, dynamic const& v)
{
    *x = cast<bool>(v);
}

// STRING

void
to_dynamic(dynamic* v, string const& x)
{
    *v = x;
}

void
from_dynamic(string* x, dynamic const& v)
{
    *x = cast<string>(v);
}

// INTEGERS

#define JSONEASE_DEFINE_INTEGER_INTERFACE(T)                                  \
    void to_dynamic(dynamic* v, T x)                                          \
    {                                                                         \
        *v = boost::numeric_cast<integer>(x);                                 \
    }                                                                         \
    void from_dynamic(T* x, dynamic const& v)                                 \
    {                                                                         \
        /* Floats can also be acceptable as integers if they convert          \
         * properly.                                                          \
         */                                                                   \
        if (v.type() == value_type::FLOAT)                                    \
            *x = boost::numeric_cast<T>(cast<double>(v));                     \
        else                                                                  \
            *x = boost::numeric_cast<T>(cast<integer>(v));                    \
    }

JSONEASE_DEFINE_INTEGER_INTERFACE(signed char)
JSONEASE_DEFINE_INTEGER_INTERFACE(unsigned char)
JSONEASE_DEFINE_INTEGER_INTERFACE(signed short)
JSONEASE_DEFINE_INTEGER_INTERFACE(unsigned short)
JSONEASE_DEFINE_INTEGER_INTERFACE(signed int)
JSONEASE_DEFINE_INTEGER_INTERFACE(unsigned int)
JSONEASE_DEFINE_INTEGER_INTERFACE(signed long)
JSONEASE_DEFINE_INTEGER_INTERFACE(unsigned long)
JSONEASE_DEFINE_INTEGER_INTERFACE(signed long long)
JSONEASE_DEFINE_INTEGER_INTERFACE(unsigned long long)

// FLOATS

#define JSONEASE_DEFINE_FLOAT_INTERFACE(T)                                    \
    void to_dynamic(dynamic* v, T x)                                          \
    {                                                                         \
        *v = double(x);                                                       \
    }                                                                         \
    void from_dynamic(T* x, dynamic const& v)                                 \
    {                                                                         \
        /* Integers are also acceptable as floats if they convert properly.  \
         */                                                                   \
        if (v.type() == value_type::INTEGER)                                  \
            *x = boost::numeric_cast<T>(cast<integer>(v));                    \
        else                                                                  \
            *x = boost::numeric_cast<T>(cast<double>(v));                     \
    }

JSONEASE_DEFINE_FLOAT_INTERFACE(double)
JSONEASE_DEFINE_FLOAT_INTERFACE(float)

// EXTENDED SCALARS

#define JSONEASE_DEFINE_EXTENDED_INTERFACE(T)                                 \
    void to_dynamic(dynamic* v, T const& x)                                   \
    {                                                                         \
        *v = x;                                                               \
    }                                                                         \
    void from_dynamic(T* x, dynamic const& v)                                 \
    {                                                                         \
        *x = cast<T>(v);                                                      \
    }

JSONEASE_DEFINE_EXTENDED_INTERFACE(uuid)
JSONEASE_DEFINE_EXTENDED_INTERFACE(date)
JSONEASE_DEFINE_EXTENDED_INTERFACE(time_of_day)
JSONEASE_DEFINE_EXTENDED_INTERFACE(datetime)
JSONEASE_DEFINE_EXTENDED_INTERFACE(complex)
JSONEASE_DEFINE_EXTENDED_INTERFACE(range)

// CONTAINERS

dynamic_array const&
get_items(dynamic const& v)
{
    if (v.type() == value_type::SEQUENCE)
        return cast<dynamic_sequence>(v).items;
    return cast<dynamic_array>(v);
}

dynamic_object const&
get_entries(dynamic const& v)
{
    if (v.type() == value_type::MAPPING)
        return cast<dynamic_mapping>(v).entries;
    return cast<dynamic_object>(v);
}

} // namespace jsonease
