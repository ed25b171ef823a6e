#ifndef DOCPATCH_CORE_REFLECTION_H
#define DOCPATCH_CORE_REFLECTION_H

#include <array>
#include <functional>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <unordered_map>

#include <boost/numeric/conversion/cast.hpp>

#include <docpatch/core/dynamic.h>

// This file provides the run-time view of C++ values that the differ walks.
//
// Every supported C++ type T has a single type_interface (obtained through
// get_type_interface<T>()) that knows how to inspect objects of type T through
// untyped pointers. A value_ref pairs such an interface with an object.
//
// Structures take part by specializing structure_definition<T> and listing
// their fields:
//
//   template<>
//   struct structure_definition<user>
//   {
//       static void
//       define(structure_builder<user>& s)
//       {
//           s.field("Name", &user::name);
//           s.field("Email", &user::email, "email_address,omitempty");
//       }
//   };
//
// The first argument is the field's declared (short) name. Its external name,
// which is what appears in patch paths, is the first comma-separated segment
// of the tag, or the short name converted to snake_case if there is no tag.
// A field whose external name is "-" is neither diffed nor serialized.

namespace docpatch {

enum class value_kind
{
    BOOLEAN,
    INTEGER,
    FLOAT,
    STRING,
    DATETIME,
    STRUCTURE,
    ARRAY,
    MAP,
    POINTER,
    // The concrete kind is only known once the value is resolved.
    DYNAMIC
};

std::ostream&
operator<<(std::ostream& s, value_kind k);

// Is :kind a boolean, number or string?
bool
is_primitive_kind(value_kind kind);

// Is :kind a primitive or a datetime?
bool
is_scalar_kind(value_kind kind);

struct type_interface;

// A reference to an object along with the interface for inspecting it.
// A value_ref without an object represents an absent value.
struct value_ref
{
    type_interface const* type = nullptr;
    void const* object = nullptr;

    bool
    is_absent() const
    {
        return object == nullptr;
    }
};

struct type_interface : noncopyable
{
    virtual ~type_interface()
    {
    }

    // the identity of the C++ type
    virtual std::type_index
    id() const = 0;

    // a human-readable name for the C++ type
    string
    name() const;

    virtual value_kind
    kind() const = 0;

    // Some types (i.e., dynamic) only know the concrete type of their
    // contents at run-time. For those, this produces a reference to the
    // contents (or an absent reference if there are none). For everything
    // else, it's the identity.
    virtual value_ref
    resolve(void const* object) const
    {
        return value_ref{this, object};
    }

    // deep, semantic equality
    virtual bool
    equals(void const* a, void const* b) const = 0;

    // Is this the zero value of its type? (For containers, this means empty.
    // For pointers, it means null. For structures, it means every field is
    // zero.)
    virtual bool
    is_zero(void const* object) const = 0;

    virtual dynamic
    as_dynamic(void const* object) const = 0;
};

// Resolve a reference to its concrete type. Absent references stay absent.
value_ref
resolve(value_ref ref);

// Thrown when a map with non-string keys is encountered.
DOCPATCH_DEFINE_EXCEPTION(unsupported_map_key)
DOCPATCH_DEFINE_ERROR_INFO(value_type, map_key_type)

// Thrown when a value refers back to itself in a way that can't be followed
// (e.g., converting a cyclic graph to a dynamic).
DOCPATCH_DEFINE_EXCEPTION(cyclic_value_graph)
DOCPATCH_DEFINE_ERROR_INFO(string, type_name)

template<class T>
type_interface const&
get_type_interface();

// STRUCTURES

struct field_interface
{
    // the name the field is declared under
    string name;
    // the serialization tag (e.g., "email_address,omitempty"), possibly empty
    string tag;
    // the name the field is known by in documents
    string external_name;

    type_interface const& (*type)();

    std::function<void const*(void const*)> get;

    bool
    is_skipped() const
    {
        return external_name == "-";
    }

    value_ref
    in(void const* structure) const
    {
        return value_ref{&type(), get(structure)};
    }
};

// Convert a PascalCase name to snake_case by inserting an underscore before
// each uppercase letter (other than the first) and lowercasing everything.
// Note that runs of capitals are split up (e.g., "UserID" -> "user_i_d").
string
to_snake_case(string const& name);

// Get the external name of a field from its declared name and tag.
string
resolve_external_name(string const& name, string const& tag);

struct structure_interface : type_interface
{
    value_kind
    kind() const override
    {
        return value_kind::STRUCTURE;
    }

    virtual std::vector<field_interface> const&
    fields() const = 0;

    // a default-constructed instance of the structure
    virtual void const*
    zero_value() const = 0;

    // Look up a field by its declared name.
    field_interface const*
    find_field(string const& name) const;

    bool
    equals(void const* a, void const* b) const override;

    bool
    is_zero(void const* object) const override;

    dynamic
    as_dynamic(void const* object) const override;
};

template<class Structure>
struct structure_builder
{
    template<class Field>
    structure_builder&
    field(string name, Field Structure::*member, string tag = string())
    {
        field_interface f;
        f.external_name = resolve_external_name(name, tag);
        f.name = std::move(name);
        f.tag = std::move(tag);
        f.type = &get_type_interface<Field>;
        f.get = [member](void const* object) -> void const* {
            return &(static_cast<Structure const*>(object)->*member);
        };
        fields.push_back(std::move(f));
        return *this;
    }

    std::vector<field_interface> fields;
};

// structure_definition<T>::define(builder) registers the fields of T.
// All structures that are diffed must provide a specialization of this.
template<class T>
struct structure_definition
{
};

template<class T, class Enable = void>
struct is_reflected_structure : std::false_type
{
};
template<class T>
struct is_reflected_structure<
    T,
    std::void_t<decltype(structure_definition<T>::define(
        std::declval<structure_builder<T>&>()))>> : std::true_type
{
};

// SEQUENCES

struct array_interface : type_interface
{
    value_kind
    kind() const override
    {
        return value_kind::ARRAY;
    }

    virtual size_t
    size(void const* array) const = 0;

    // Get a reference to an element (unresolved).
    virtual value_ref
    element(void const* array, size_t index) const = 0;

    // Sequences whose size is part of their type (std::array) are only zero
    // when all their elements are.
    virtual bool
    is_fixed_size() const = 0;

    bool
    equals(void const* a, void const* b) const override;

    bool
    is_zero(void const* object) const override;

    dynamic
    as_dynamic(void const* object) const override;
};

// MAPS

struct map_interface : type_interface
{
    value_kind
    kind() const override
    {
        return value_kind::MAP;
    }

    virtual std::vector<string>
    keys(void const* map) const = 0;

    // Get a reference to the value associated with :key (unresolved).
    // If there's no such value, the result is absent.
    virtual value_ref
    find(void const* map, string const& key) const = 0;

    bool
    equals(void const* a, void const* b) const override;

    bool
    is_zero(void const* object) const override;

    dynamic
    as_dynamic(void const* object) const override;
};

// POINTERS

struct pointer_interface : type_interface
{
    value_kind
    kind() const override
    {
        return value_kind::POINTER;
    }

    // the address of the pointee, or nullptr
    virtual void const*
    pointee(void const* pointer) const = 0;

    virtual type_interface const&
    pointee_type() const = 0;

    // Get a reference to the pointee (unresolved), absent if the pointer is
    // null.
    value_ref
    target(void const* pointer) const
    {
        return value_ref{&pointee_type(), pointee(pointer)};
    }

    bool
    equals(void const* a, void const* b) const override;

    bool
    is_zero(void const* object) const override;

    dynamic
    as_dynamic(void const* object) const override;
};

namespace detail {

template<class T, class Enable = void>
struct scalar_kind_of
{
};
template<>
struct scalar_kind_of<bool>
{
    static constexpr value_kind value = value_kind::BOOLEAN;
};
template<class T>
struct scalar_kind_of<
    T,
    std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value>>
{
    static constexpr value_kind value = value_kind::INTEGER;
};
template<class T>
struct scalar_kind_of<T, std::enable_if_t<std::is_floating_point<T>::value>>
{
    static constexpr value_kind value = value_kind::FLOAT;
};
template<>
struct scalar_kind_of<string>
{
    static constexpr value_kind value = value_kind::STRING;
};
template<>
struct scalar_kind_of<ptime>
{
    static constexpr value_kind value = value_kind::DATETIME;
};

template<class T>
bool
scalar_equals(T const& a, T const& b)
{
    return a == b;
}
inline bool
scalar_equals(ptime const& a, ptime const& b)
{
    return datetimes_equal(a, b);
}

template<class T>
bool
scalar_is_zero(T const& x)
{
    return x == T();
}
inline bool
scalar_is_zero(string const& x)
{
    return x.empty();
}
inline bool
scalar_is_zero(ptime const& x)
{
    return x.is_not_a_date_time();
}

inline dynamic
scalar_to_dynamic(bool x)
{
    return dynamic(x);
}
template<class T>
std::enable_if_t<std::is_integral<T>::value, dynamic>
scalar_to_dynamic(T x)
{
    return dynamic(boost::numeric_cast<integer>(x));
}
template<class T>
std::enable_if_t<std::is_floating_point<T>::value, dynamic>
scalar_to_dynamic(T x)
{
    return dynamic(double(x));
}
inline dynamic
scalar_to_dynamic(string const& x)
{
    return dynamic(x);
}
inline dynamic
scalar_to_dynamic(ptime const& x)
{
    return dynamic(x);
}

template<class Pointer>
void const*
pointer_address(Pointer const& p)
{
    return static_cast<void const*>(p.get());
}
template<class T>
void const*
pointer_address(T* p)
{
    return static_cast<void const*>(p);
}

} // namespace detail

// Get the interface for type T.
// Each interface is a function-local static, so this is safe to call from
// any thread.
template<class T, class Enable = void>
struct type_interface_for;

template<class T>
type_interface const&
get_type_interface()
{
    static type_interface_for<T> instance;
    return instance;
}

// SCALARS

template<class T>
struct type_interface_for<
    T,
    std::void_t<decltype(detail::scalar_kind_of<T>::value)>> : type_interface
{
    std::type_index
    id() const override
    {
        return typeid(T);
    }
    value_kind
    kind() const override
    {
        return detail::scalar_kind_of<T>::value;
    }
    bool
    equals(void const* a, void const* b) const override
    {
        return detail::scalar_equals(
            *static_cast<T const*>(a), *static_cast<T const*>(b));
    }
    bool
    is_zero(void const* object) const override
    {
        return detail::scalar_is_zero(*static_cast<T const*>(object));
    }
    dynamic
    as_dynamic(void const* object) const override
    {
        return detail::scalar_to_dynamic(*static_cast<T const*>(object));
    }
};

// STRUCTURES

template<class T>
struct type_interface_for<T, std::enable_if_t<is_reflected_structure<T>::value>>
    : structure_interface
{
    type_interface_for()
    {
        structure_builder<T> builder;
        structure_definition<T>::define(builder);
        fields_ = std::move(builder.fields);
    }

    std::type_index
    id() const override
    {
        return typeid(T);
    }

    std::vector<field_interface> const&
    fields() const override
    {
        return fields_;
    }

    void const*
    zero_value() const override
    {
        static T const zero{};
        return &zero;
    }

 private:
    std::vector<field_interface> fields_;
};

// SEQUENCES

namespace detail {

template<class Sequence, class Element, bool FixedSize>
struct sequence_interface : array_interface
{
    std::type_index
    id() const override
    {
        return typeid(Sequence);
    }
    size_t
    size(void const* array) const override
    {
        return static_cast<Sequence const*>(array)->size();
    }
    value_ref
    element(void const* array, size_t index) const override
    {
        return value_ref{
            &get_type_interface<Element>(),
            &(*static_cast<Sequence const*>(array))[index]};
    }
    bool
    is_fixed_size() const override
    {
        return FixedSize;
    }
};

} // namespace detail

template<class T, class Allocator>
struct type_interface_for<std::vector<T, Allocator>>
    : detail::sequence_interface<std::vector<T, Allocator>, T, false>
{
};

// std::vector<bool> has no addressable elements, so elements are referenced
// through shared constants.
template<class Allocator>
struct type_interface_for<std::vector<bool, Allocator>> : array_interface
{
    typedef std::vector<bool, Allocator> vector_type;

    std::type_index
    id() const override
    {
        return typeid(vector_type);
    }
    size_t
    size(void const* array) const override
    {
        return static_cast<vector_type const*>(array)->size();
    }
    value_ref
    element(void const* array, size_t index) const override
    {
        static bool const values[] = {false, true};
        bool value = (*static_cast<vector_type const*>(array))[index];
        return value_ref{&get_type_interface<bool>(), &values[value ? 1 : 0]};
    }
    bool
    is_fixed_size() const override
    {
        return false;
    }
};

template<class T, size_t N>
struct type_interface_for<std::array<T, N>>
    : detail::sequence_interface<std::array<T, N>, T, true>
{
};

// MAPS

namespace detail {

template<class Map, class Mapped>
struct string_map_interface : map_interface
{
    std::type_index
    id() const override
    {
        return typeid(Map);
    }
    std::vector<string>
    keys(void const* map) const override
    {
        std::vector<string> keys;
        for (auto const& i : *static_cast<Map const*>(map))
            keys.push_back(i.first);
        return keys;
    }
    value_ref
    find(void const* map, string const& key) const override
    {
        auto const& m = *static_cast<Map const*>(map);
        auto i = m.find(key);
        if (i == m.end())
            return value_ref();
        return value_ref{&get_type_interface<Mapped>(), &i->second};
    }
};

} // namespace detail

template<class T, class Compare, class Allocator>
struct type_interface_for<std::map<string, T, Compare, Allocator>>
    : detail::string_map_interface<std::map<string, T, Compare, Allocator>, T>
{
};

template<class T, class Hash, class Equal, class Allocator>
struct type_interface_for<std::unordered_map<string, T, Hash, Equal, Allocator>>
    : detail::string_map_interface<
          std::unordered_map<string, T, Hash, Equal, Allocator>,
          T>
{
};

// POINTERS

namespace detail {

template<class Pointer, class Pointee>
struct pointer_interface_for : pointer_interface
{
    std::type_index
    id() const override
    {
        return typeid(Pointer);
    }
    void const*
    pointee(void const* pointer) const override
    {
        return pointer_address(*static_cast<Pointer const*>(pointer));
    }
    type_interface const&
    pointee_type() const override
    {
        return get_type_interface<std::remove_const_t<Pointee>>();
    }
};

} // namespace detail

template<class T>
struct type_interface_for<T*> : detail::pointer_interface_for<T*, T>
{
};

template<class T>
struct type_interface_for<std::shared_ptr<T>>
    : detail::pointer_interface_for<std::shared_ptr<T>, T>
{
};

template<class T, class Deleter>
struct type_interface_for<std::unique_ptr<T, Deleter>>
    : detail::pointer_interface_for<std::unique_ptr<T, Deleter>, T>
{
};

// DYNAMIC VALUES

template<>
struct type_interface_for<dynamic> : type_interface
{
    std::type_index
    id() const override;
    value_kind
    kind() const override;
    value_ref
    resolve(void const* object) const override;
    bool
    equals(void const* a, void const* b) const override;
    bool
    is_zero(void const* object) const override;
    dynamic
    as_dynamic(void const* object) const override;
};

// Maps within dynamic values must have string keys to be diffed.
template<>
struct type_interface_for<dynamic_map> : map_interface
{
    std::type_index
    id() const override;
    std::vector<string>
    keys(void const* map) const override;
    value_ref
    find(void const* map, string const& key) const override;
    bool
    equals(void const* a, void const* b) const override;
    dynamic
    as_dynamic(void const* object) const override;
};

// REFERENCES

template<class T>
value_ref
make_value_ref(T const& x)
{
    return value_ref{&get_type_interface<T>(), &x};
}

inline value_ref
make_value_ref(nil_t)
{
    return value_ref();
}

inline value_ref
make_value_ref(std::nullptr_t)
{
    return value_ref();
}

} // namespace docpatch

#endif
