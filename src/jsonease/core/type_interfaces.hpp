#ifndef JSONEASE_CORE_TYPE_INTERFACES_HPP
#define JSONEASE_CORE_TYPE_INTERFACES_HPP

#include <array>
#include <deque>
#include <list>
#include <map>
#include <set>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <jsonease/core/dynamic.hpp>

// This file provides conversions to and from dynamic values for the C++ types
// that jsonease knows how to encode.
//
// The mapping follows the JSON tiers: std::vector maps to a plain ARRAY (and is
// therefore encodable at every tier), while the other standard containers map
// to SEQUENCE or MAPPING, which only the Advanced and Custom tiers accept.

namespace jsonease {

// NIL

// Note that we don't have to do anything here because callers of to_dynamic
// are required to provide a default-constructed dynamic, which is already nil.
static inline void
to_dynamic(dynamic* v, nil_t n)
{
}

static inline void
from_dynamic(nil_t* n, dynamic const& v)
{
}

// BOOL

void
to_dynamic(dynamic* v, bool x);

void
from_dynamic(bool* x, dynamic const& v);

// INTEGERS AND FLOATS

#define JSONEASE_DECLARE_NUMBER_INTERFACE(T)                                  \
    void to_dynamic(dynamic* v, T x);                                         \
                                                                              \
    void from_dynamic(T* x, dynamic const& v);

JSONEASE_DECLARE_NUMBER_INTERFACE(signed char)
JSONEASE_DECLARE_NUMBER_INTERFACE(unsigned char)
JSONEASE_DECLARE_NUMBER_INTERFACE(signed short)
JSONEASE_DECLARE_NUMBER_INTERFACE(unsigned short)
JSONEASE_DECLARE_NUMBER_INTERFACE(signed int)
JSONEASE_DECLARE_NUMBER_INTERFACE(unsigned int)
JSONEASE_DECLARE_NUMBER_INTERFACE(signed long)
JSONEASE_DECLARE_NUMBER_INTERFACE(unsigned long)
JSONEASE_DECLARE_NUMBER_INTERFACE(signed long long)
JSONEASE_DECLARE_NUMBER_INTERFACE(unsigned long long)
JSONEASE_DECLARE_NUMBER_INTERFACE(float)
JSONEASE_DECLARE_NUMBER_INTERFACE(double)

// STRING

void
to_dynamic(dynamic* v, string const& x);

void
from_dynamic(string* x, dynamic const& v);

static inline void
to_dynamic(dynamic* v, char const* x)
{
    *v = string(x);
}

// EXTENDED SCALARS

#define JSONEASE_DECLARE_EXTENDED_INTERFACE(T)                                \
    void to_dynamic(dynamic* v, T const& x);                                  \
                                                                              \
    void from_dynamic(T* x, dynamic const& v);

JSONEASE_DECLARE_EXTENDED_INTERFACE(uuid)
JSONEASE_DECLARE_EXTENDED_INTERFACE(date)
JSONEASE_DECLARE_EXTENDED_INTERFACE(time_of_day)
JSONEASE_DECLARE_EXTENDED_INTERFACE(datetime)
JSONEASE_DECLARE_EXTENDED_INTERFACE(complex)
JSONEASE_DECLARE_EXTENDED_INTERFACE(range)

// DYNAMIC

inline void
to_dynamic(dynamic* v, dynamic const& x)
{
    *v = x;
}
inline void
from_dynamic(dynamic* x, dynamic const& v)
{
    *x = v;
}

// All convertible types provide to_dynamic(&v, x) and from_dynamic(&x, v).
// The following are alternate, often more convenient forms.
template<class T>
dynamic
to_dynamic(T const& x)
{
    dynamic v;
    to_dynamic(&v, x);
    return v;
}
template<class T>
T
from_dynamic(dynamic const& v)
{
    T x;
    from_dynamic(&x, v);
    return x;
}

// STRUCTURES

// Any application type that implements the structure interface converts to a
// STRUCTURE value.
template<class T>
std::enable_if_t<std::is_base_of<structure, T>::value>
to_dynamic(dynamic* v, std::shared_ptr<T> const& x)
{
    *v = structure_ptr(x);
}

// Construct a structure value of type T.
template<class T, class... Args>
dynamic
make_structure(Args&&... args)
{
    return structure_ptr(std::make_shared<T>(std::forward<Args>(args)...));
}

// STD::VECTOR

template<class T>
void
to_dynamic(dynamic* v, std::vector<T> const& x)
{
    dynamic_array array;
    size_t n_elements = x.size();
    array.resize(n_elements);
    for (size_t i = 0; i != n_elements; ++i)
    {
        to_dynamic(&array[i], x[i]);
    }
    *v = std::move(array);
}

// Get the items of an ARRAY or a SEQUENCE.
dynamic_array const&
get_items(dynamic const& v);

template<class T>
void
from_dynamic(std::vector<T>* x, dynamic const& v)
{
    dynamic_array const& array = get_items(v);
    size_t n_elements = array.size();
    x->resize(n_elements);
    for (size_t i = 0; i != n_elements; ++i)
    {
        try
        {
            from_dynamic(&(*x)[i], array[i]);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, integer(i));
            throw;
        }
    }
}

// OTHER SEQUENCES

template<class Container>
dynamic_sequence
to_dynamic_sequence(Container const& x)
{
    dynamic_sequence sequence;
    sequence.items.reserve(x.size());
    for (auto const& i : x)
        sequence.items.push_back(to_dynamic(i));
    return sequence;
}

template<class T, size_t N>
void
to_dynamic(dynamic* v, std::array<T, N> const& x)
{
    *v = to_dynamic_sequence(x);
}

template<class T>
void
to_dynamic(dynamic* v, std::list<T> const& x)
{
    *v = to_dynamic_sequence(x);
}

template<class T>
void
to_dynamic(dynamic* v, std::deque<T> const& x)
{
    *v = to_dynamic_sequence(x);
}

template<class T>
void
to_dynamic(dynamic* v, std::set<T> const& x)
{
    *v = to_dynamic_sequence(x);
}

template<class T>
void
to_dynamic(dynamic* v, std::unordered_set<T> const& x)
{
    *v = to_dynamic_sequence(x);
}

// MAPS

template<class Map>
dynamic_mapping
to_dynamic_mapping(Map const& x)
{
    dynamic_mapping mapping;
    for (auto const& i : x)
        to_dynamic(&mapping.entries[i.first], i.second);
    return mapping;
}

template<class Value>
void
to_dynamic(dynamic* v, std::map<string, Value> const& x)
{
    *v = to_dynamic_mapping(x);
}

template<class Value>
void
to_dynamic(dynamic* v, std::unordered_map<string, Value> const& x)
{
    *v = to_dynamic_mapping(x);
}

// Get the entries of an OBJECT or a MAPPING.
dynamic_object const&
get_entries(dynamic const& v);

template<class Value>
void
from_dynamic(std::map<string, Value>* x, dynamic const& v)
{
    for (auto const& i : get_entries(v))
    {
        try
        {
            from_dynamic(&(*x)[i.first], i.second);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, i.first);
            throw;
        }
    }
}

// OPTIONAL

// An optional value is nil when it's absent.
template<class T>
void
to_dynamic(dynamic* v, optional<T> const& x)
{
    if (x)
        to_dynamic(v, *x);
    else
        *v = nil;
}

template<class T>
void
from_dynamic(optional<T>* x, dynamic const& v)
{
    if (v.type() == value_type::NIL)
    {
        *x = none;
    }
    else
    {
        T t;
        from_dynamic(&t, v);
        *x = std::move(t);
    }
}

} // namespace jsonease

#endif
