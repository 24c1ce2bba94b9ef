#ifndef JSONEASE_CORE_TYPE_DEFINITIONS_HPP
#define JSONEASE_CORE_TYPE_DEFINITIONS_HPP

#include <any>
#include <complex>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/optional.hpp>
#include <boost/uuid/uuid.hpp>

namespace jsonease {

using std::string;

using boost::none;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_reference_t<T>>(std::forward<T>(x));
}

typedef int64_t integer;

// nil_t is a unit type. It has only one possible value, :nil.
struct nil_t
{
};
static nil_t nil;

typedef boost::uuids::uuid uuid;

typedef boost::gregorian::date date;

// a time of day without a date (and without a UTC offset)
typedef boost::posix_time::time_duration time_of_day;

// datetime is a wall clock time together with its offset from UTC.
struct datetime
{
    boost::posix_time::ptime local;
    // offset from UTC in minutes (positive east of Greenwich)
    int utc_offset = 0;
};

typedef std::complex<double> complex;

struct dynamic;
class dynamic_object;
struct range;
struct dynamic_sequence;
struct dynamic_mapping;
struct structure;

typedef std::shared_ptr<structure const> structure_ptr;

enum class value_type
{
    NIL, // nil_t - no value
    BOOLEAN, // bool
    INTEGER, // integer
    FLOAT, // double
    STRING, // string
    ARRAY, // dynamic_array - array of dynamic values
    OBJECT, // dynamic_object - ordered collection of named dynamic values
    UUID, // uuid
    DATE, // date
    TIME, // time_of_day
    DATETIME, // datetime
    COMPLEX, // complex
    RANGE, // range
    SEQUENCE, // dynamic_sequence - any other ordered or unordered container
    MAPPING, // dynamic_mapping - any other keyed container
    STRUCTURE, // structure_ptr - application object exposing its fields
};

// Arrays are represented as std::vectors and can be manipulated as such.
typedef std::vector<dynamic> dynamic_array;

struct dynamic
{
    // CONSTRUCTORS

    // Default construction creates a nil value.
    dynamic()
    {
        set(nil);
    }

    // Construct a dynamic from one of the base types.
    dynamic(nil_t v)
    {
        set(v);
    }
    dynamic(bool v)
    {
        set(v);
    }
    dynamic(integer v)
    {
        set(v);
    }
    dynamic(double v)
    {
        set(v);
    }
    dynamic(string const& v)
    {
        set(v);
    }
    dynamic(string&& v)
    {
        set(std::move(v));
    }
    dynamic(char const* v)
    {
        set(string(v));
    }
    dynamic(dynamic_array const& v)
    {
        set(v);
    }
    dynamic(dynamic_array&& v)
    {
        set(std::move(v));
    }
    dynamic(dynamic_object const& v)
    {
        set(v);
    }
    dynamic(dynamic_object&& v)
    {
        set(std::move(v));
    }

    // Construct a dynamic from one of the extended types.
    dynamic(uuid const& v)
    {
        set(v);
    }
    dynamic(date const& v)
    {
        set(v);
    }
    dynamic(time_of_day const& v)
    {
        set(v);
    }
    dynamic(datetime const& v)
    {
        set(v);
    }
    dynamic(complex const& v)
    {
        set(v);
    }
    dynamic(range const& v)
    {
        set(v);
    }
    dynamic(dynamic_sequence const& v)
    {
        set(v);
    }
    dynamic(dynamic_sequence&& v)
    {
        set(std::move(v));
    }
    dynamic(dynamic_mapping const& v)
    {
        set(v);
    }
    dynamic(dynamic_mapping&& v)
    {
        set(std::move(v));
    }
    dynamic(structure_ptr const& v)
    {
        set(v);
    }

    // Construct from an initializer list.
    dynamic(std::initializer_list<dynamic> list);

    // GETTERS

    // Get the type of value stored here.
    value_type
    type() const
    {
        return type_;
    }

    // Get the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any const&
    contents() const&
    {
        return value_;
    }

    // Get a non-const reference to the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any&
    contents() &
    {
        return value_;
    }

    // Get an r-value reference to the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any&&
    contents() &&
    {
        return std::move(value_);
    }

 private:
    void
    set(nil_t _);
    void
    set(bool v);
    void
    set(integer v);
    void
    set(double v);
    void
    set(string const& v);
    void
    set(string&& v);
    void
    set(dynamic_array const& v);
    void
    set(dynamic_array&& v);
    void
    set(dynamic_object const& v);
    void
    set(dynamic_object&& v);
    void
    set(uuid const& v);
    void
    set(date const& v);
    void
    set(time_of_day const& v);
    void
    set(datetime const& v);
    void
    set(complex const& v);
    void
    set(range const& v);
    void
    set(dynamic_sequence const& v);
    void
    set(dynamic_sequence&& v);
    void
    set(dynamic_mapping const& v);
    void
    set(dynamic_mapping&& v);
    void
    set(structure_ptr const& v);

    friend void
    swap(dynamic& a, dynamic& b);

    value_type type_;
    std::any value_;
};

// OBJECTS

// A dynamic_object is the value of a JSON object. Keys are unique and
// iteration follows the order in which each key was first inserted.
// Assigning to an existing key replaces its value but keeps its position.
class dynamic_object
{
 public:
    typedef std::pair<string, dynamic> entry;
    typedef std::vector<entry>::iterator iterator;
    typedef std::vector<entry>::const_iterator const_iterator;

    dynamic_object()
    {
    }

    dynamic_object(std::initializer_list<entry> entries);

    size_t
    size() const
    {
        return entries_.size();
    }

    bool
    empty() const
    {
        return entries_.empty();
    }

    iterator
    begin()
    {
        return entries_.begin();
    }
    iterator
    end()
    {
        return entries_.end();
    }
    const_iterator
    begin() const
    {
        return entries_.begin();
    }
    const_iterator
    end() const
    {
        return entries_.end();
    }

    // Get the value stored under :key, appending a nil value if there isn't
    // one yet.
    dynamic&
    operator[](string const& key);

    // Store :value under :key.
    void
    set(string key, dynamic value);

    // Look up the value stored under :key.
    // The return value is null if the key isn't present.
    dynamic const*
    find(string const& key) const;
    dynamic*
    find(string const& key);

    bool
    contains(string const& key) const
    {
        return find(key) != nullptr;
    }

    // Remove :key (if present). Returns whether or not anything was removed.
    bool
    erase(string const& key);

 private:
    std::vector<entry> entries_;
};

// EXTENDED VALUES

// range is a (start, stop, step) triple. A nil component is an open bound.
struct range
{
    dynamic start;
    dynamic stop;
    dynamic step;
};

// dynamic_sequence holds the items of any enumerable container other than a
// plain array (tuples, lists, deques, sets, ...), in enumeration order.
struct dynamic_sequence
{
    dynamic_array items;
};

// dynamic_mapping holds the entries of any keyed container other than a plain
// JSON object, in enumeration order.
struct dynamic_mapping
{
    dynamic_object entries;
};

// structure is the interface through which application objects expose their
// state for generic serialization.
struct structure
{
    virtual ~structure()
    {
    }

    // the name of the value's type (for diagnostics)
    virtual string
    type_name() const = 0;

    // the value's own fields, in declaration order
    virtual dynamic_object
    fields() const = 0;

    // fields defined at the type level, first for the value's own type and
    // then for each of its ancestors (nearest first)
    virtual std::vector<dynamic_object>
    inherited_fields() const
    {
        return std::vector<dynamic_object>();
    }

    // If the type supplies an equivalent state to serialize in place of
    // itself, this returns it. none means that no such state is available.
    virtual optional<dynamic>
    equivalent_state() const
    {
        return none;
    }

    // If the type knows how to write itself as JSON, this returns that text.
    virtual optional<string>
    to_json() const
    {
        return none;
    }
};

} // namespace jsonease

#endif
