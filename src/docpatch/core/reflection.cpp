#include <docpatch/core/reflection.h>

#include <cctype>
#include <set>

#include <boost/core/demangle.hpp>

namespace docpatch {

std::ostream&
operator<<(std::ostream& s, value_kind k)
{
    switch (k)
    {
        case value_kind::BOOLEAN:
            s << "boolean";
            break;
        case value_kind::INTEGER:
            s << "integer";
            break;
        case value_kind::FLOAT:
            s << "float";
            break;
        case value_kind::STRING:
            s << "string";
            break;
        case value_kind::DATETIME:
            s << "datetime";
            break;
        case value_kind::STRUCTURE:
            s << "structure";
            break;
        case value_kind::ARRAY:
            s << "array";
            break;
        case value_kind::MAP:
            s << "map";
            break;
        case value_kind::POINTER:
            s << "pointer";
            break;
        case value_kind::DYNAMIC:
            s << "dynamic";
            break;
        default:
            DOCPATCH_THROW(
                invalid_enum_value()
                << enum_id_info("value_kind") << enum_value_info(int(k)));
    }
    return s;
}

bool
is_primitive_kind(value_kind kind)
{
    switch (kind)
    {
        case value_kind::BOOLEAN:
        case value_kind::INTEGER:
        case value_kind::FLOAT:
        case value_kind::STRING:
            return true;
        default:
            return false;
    }
}

bool
is_scalar_kind(value_kind kind)
{
    return is_primitive_kind(kind) || kind == value_kind::DATETIME;
}

string
type_interface::name() const
{
    return boost::core::demangle(id().name());
}

value_ref
resolve(value_ref ref)
{
    if (ref.is_absent())
        return value_ref();
    return ref.type->resolve(ref.object);
}

// NAMES

string
to_snake_case(string const& name)
{
    string result;
    for (size_t i = 0; i != name.size(); ++i)
    {
        unsigned char c = name[i];
        if (std::isupper(c))
        {
            if (i > 0)
                result.push_back('_');
            result.push_back(char(std::tolower(c)));
        }
        else
        {
            result.push_back(char(c));
        }
    }
    return result;
}

string
resolve_external_name(string const& name, string const& tag)
{
    if (!tag.empty())
    {
        auto external = tag.substr(0, tag.find(','));
        if (!external.empty())
            return external;
    }
    return to_snake_case(name);
}

// STRUCTURES

field_interface const*
structure_interface::find_field(string const& name) const
{
    for (auto const& f : fields())
    {
        if (f.name == name)
            return &f;
    }
    return nullptr;
}

bool
structure_interface::equals(void const* a, void const* b) const
{
    for (auto const& f : fields())
    {
        if (f.is_skipped())
            continue;
        if (!f.type().equals(f.get(a), f.get(b)))
            return false;
    }
    return true;
}

bool
structure_interface::is_zero(void const* object) const
{
    for (auto const& f : fields())
    {
        if (f.is_skipped())
            continue;
        if (!f.type().is_zero(f.get(object)))
            return false;
    }
    return true;
}

dynamic
structure_interface::as_dynamic(void const* object) const
{
    dynamic_map map;
    for (auto const& f : fields())
    {
        if (f.is_skipped())
            continue;
        map[dynamic(f.external_name)] = f.type().as_dynamic(f.get(object));
    }
    return dynamic(std::move(map));
}

// SEQUENCES

bool
array_interface::equals(void const* a, void const* b) const
{
    size_t n = size(a);
    if (size(b) != n)
        return false;
    for (size_t i = 0; i != n; ++i)
    {
        auto x = element(a, i);
        auto y = element(b, i);
        if (!x.type->equals(x.object, y.object))
            return false;
    }
    return true;
}

bool
array_interface::is_zero(void const* object) const
{
    size_t n = size(object);
    if (!is_fixed_size())
        return n == 0;
    for (size_t i = 0; i != n; ++i)
    {
        auto x = element(object, i);
        if (!x.type->is_zero(x.object))
            return false;
    }
    return true;
}

dynamic
array_interface::as_dynamic(void const* object) const
{
    size_t n = size(object);
    dynamic_array array;
    array.reserve(n);
    for (size_t i = 0; i != n; ++i)
    {
        auto x = element(object, i);
        array.push_back(x.type->as_dynamic(x.object));
    }
    return dynamic(std::move(array));
}

// MAPS

bool
map_interface::equals(void const* a, void const* b) const
{
    auto keys_a = keys(a);
    if (keys_a.size() != keys(b).size())
        return false;
    for (auto const& key : keys_a)
    {
        auto x = find(a, key);
        auto y = find(b, key);
        if (y.is_absent() || !x.type->equals(x.object, y.object))
            return false;
    }
    return true;
}

bool
map_interface::is_zero(void const* object) const
{
    return keys(object).empty();
}

dynamic
map_interface::as_dynamic(void const* object) const
{
    dynamic_map map;
    for (auto const& key : keys(object))
    {
        auto x = find(object, key);
        map[dynamic(key)] = x.type->as_dynamic(x.object);
    }
    return dynamic(std::move(map));
}

// POINTERS

namespace {

// Records an entry in a set for the lifetime of the object.
template<class Set>
struct scoped_entry
{
    scoped_entry(Set& set, typename Set::value_type entry)
        : set(set), entry(entry)
    {
        inserted = set.insert(entry).second;
    }
    ~scoped_entry()
    {
        if (inserted)
            set.erase(entry);
    }

    Set& set;
    typename Set::value_type entry;
    bool inserted;
};

typedef std::set<std::pair<void const*, void const*>> pointee_pair_set;
typedef std::set<void const*> pointee_set;

// pointee pairs currently being compared on this thread
thread_local pointee_pair_set active_comparisons;

// pointees currently being converted on this thread
thread_local pointee_set active_conversions;

} // namespace

bool
pointer_interface::equals(void const* a, void const* b) const
{
    auto pa = pointee(a);
    auto pb = pointee(b);
    if (!pa || !pb)
        return !pa && !pb;
    if (pa == pb)
        return true;
    // A pair that's already being compared further up the stack is assumed
    // equal, so that cyclic graphs compare in finite time.
    scoped_entry<pointee_pair_set> entry(
        active_comparisons, std::make_pair(pa, pb));
    if (!entry.inserted)
        return true;
    return pointee_type().equals(pa, pb);
}

bool
pointer_interface::is_zero(void const* object) const
{
    return pointee(object) == nullptr;
}

dynamic
pointer_interface::as_dynamic(void const* object) const
{
    auto p = pointee(object);
    if (!p)
        return dynamic(nil);
    scoped_entry<pointee_set> entry(active_conversions, p);
    if (!entry.inserted)
    {
        DOCPATCH_THROW(
            cyclic_value_graph() << type_name_info(pointee_type().name()));
    }
    return pointee_type().as_dynamic(p);
}

// DYNAMIC VALUES

std::type_index
type_interface_for<dynamic>::id() const
{
    return typeid(dynamic);
}

value_kind
type_interface_for<dynamic>::kind() const
{
    return value_kind::DYNAMIC;
}

value_ref
type_interface_for<dynamic>::resolve(void const* object) const
{
    auto const& v = *static_cast<dynamic const*>(object);
    switch (v.type())
    {
        case value_type::NIL:
        default:
            return value_ref();
        case value_type::BOOLEAN:
            return make_value_ref(cast<bool>(v));
        case value_type::INTEGER:
            return make_value_ref(cast<integer>(v));
        case value_type::FLOAT:
            return make_value_ref(cast<double>(v));
        case value_type::STRING:
            return make_value_ref(cast<string>(v));
        case value_type::DATETIME:
            return make_value_ref(cast<ptime>(v));
        case value_type::ARRAY:
            return make_value_ref(cast<dynamic_array>(v));
        case value_type::MAP:
            return make_value_ref(cast<dynamic_map>(v));
    }
}

bool
type_interface_for<dynamic>::equals(void const* a, void const* b) const
{
    return *static_cast<dynamic const*>(a) == *static_cast<dynamic const*>(b);
}

bool
type_interface_for<dynamic>::is_zero(void const* object) const
{
    return static_cast<dynamic const*>(object)->type() == value_type::NIL;
}

dynamic
type_interface_for<dynamic>::as_dynamic(void const* object) const
{
    return *static_cast<dynamic const*>(object);
}

std::type_index
type_interface_for<dynamic_map>::id() const
{
    return typeid(dynamic_map);
}

std::vector<string>
type_interface_for<dynamic_map>::keys(void const* map) const
{
    std::vector<string> keys;
    for (auto const& i : *static_cast<dynamic_map const*>(map))
    {
        if (i.first.type() != value_type::STRING)
        {
            DOCPATCH_THROW(
                unsupported_map_key() << map_key_type_info(i.first.type()));
        }
        keys.push_back(cast<string>(i.first));
    }
    return keys;
}

value_ref
type_interface_for<dynamic_map>::find(
    void const* map, string const& key) const
{
    auto const& m = *static_cast<dynamic_map const*>(map);
    auto i = m.find(dynamic(key));
    if (i == m.end())
        return value_ref();
    return make_value_ref(i->second);
}

bool
type_interface_for<dynamic_map>::equals(void const* a, void const* b) const
{
    return *static_cast<dynamic_map const*>(a)
           == *static_cast<dynamic_map const*>(b);
}

dynamic
type_interface_for<dynamic_map>::as_dynamic(void const* object) const
{
    return dynamic(*static_cast<dynamic_map const*>(object));
}

} // namespace docpatch
