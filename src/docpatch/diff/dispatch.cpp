#include <docpatch/diff/dispatch.h>

#include <algorithm>

namespace docpatch {
namespace detail {

string
extend_path(string const& base, string const& name)
{
    return base.empty() ? name : base + "." + name;
}

bool
is_ignored_field(diff_config const& config, string const& name)
{
    auto const& ignored = config.ignore_fields;
    return std::find(ignored.begin(), ignored.end(), name) != ignored.end();
}

void
set_field(diff_context& ctx, string const& path, value_ref value)
{
    ctx.result.add_operation(
        set_operator, path, value.type->as_dynamic(value.object));
}

void
unset_field(diff_context& ctx, string const& path)
{
    ctx.result.add_operation(unset_operator, path, dynamic(""));
}

static dynamic
as_dynamic_or_nil(value_ref value)
{
    return value.is_absent() ? dynamic(nil)
                             : value.type->as_dynamic(value.object);
}

// If there's a custom comparer registered for :path, let it decide the
// outcome and return true.
static bool
apply_custom_comparer(
    diff_context& ctx,
    string const& path,
    value_ref old_value,
    value_ref new_value)
{
    auto comparer = ctx.config.custom_comparers.find(path);
    if (comparer == ctx.config.custom_comparers.end() || !comparer->second)
        return false;
    auto diff = comparer->second(
        as_dynamic_or_nil(old_value), as_dynamic_or_nil(new_value));
    if (diff)
    {
        ctx.result.add_operation(
            diff->operation,
            diff->path.empty() ? path : diff->path,
            std::move(diff->value));
    }
    return true;
}

static bool
is_numeric_kind(value_kind kind)
{
    return kind == value_kind::INTEGER || kind == value_kind::FLOAT;
}

static bool
is_dynamic_ref(value_ref ref)
{
    return ref.type && ref.type->kind() == value_kind::DYNAMIC;
}

// a value that's been added at :path
static void
add_value(diff_context& ctx, string const& path, value_ref value)
{
    if (value.type->kind() == value_kind::STRUCTURE)
    {
        auto const& type = static_cast<structure_interface const&>(*value.type);
        compare_structures(ctx, path, type, type.zero_value(), value.object);
    }
    else
    {
        set_field(ctx, path, value);
    }
}

// a value that's been removed from :path
static void
remove_value(diff_context& ctx, string const& path, value_ref value)
{
    if (value.type->kind() == value_kind::STRUCTURE)
    {
        unset_structure_fields(
            ctx,
            path,
            static_cast<structure_interface const&>(*value.type),
            value.object);
    }
    else
    {
        unset_field(ctx, path);
    }
}

void
compare_values(
    diff_context& ctx,
    string const& path,
    value_ref old_value,
    value_ref new_value)
{
    // Numbers within dynamic values may switch between integer and float
    // representations without that being a change of type.
    bool dynamic_pair = is_dynamic_ref(old_value) && is_dynamic_ref(new_value);

    old_value = resolve(old_value);
    new_value = resolve(new_value);

    if (old_value.is_absent() && new_value.is_absent())
        return;

    if (apply_custom_comparer(ctx, path, old_value, new_value))
        return;

    if (old_value.is_absent())
    {
        add_value(ctx, path, new_value);
        return;
    }
    if (new_value.is_absent())
    {
        remove_value(ctx, path, old_value);
        return;
    }

    auto kind = old_value.type->kind();

    if (old_value.type->id() != new_value.type->id())
    {
        if (dynamic_pair && is_numeric_kind(kind)
            && is_numeric_kind(new_value.type->kind()))
        {
            compare_scalars(ctx, path, old_value, new_value);
            return;
        }
        DOCPATCH_THROW(
            type_mismatch() << field_path_info(path)
                            << old_type_info(old_value.type->name())
                            << new_type_info(new_value.type->name()));
    }

    switch (kind)
    {
        case value_kind::STRUCTURE:
            compare_structures(
                ctx,
                path,
                static_cast<structure_interface const&>(*old_value.type),
                old_value.object,
                new_value.object);
            break;
        case value_kind::ARRAY:
            compare_arrays(
                ctx,
                path,
                static_cast<array_interface const&>(*old_value.type),
                old_value.object,
                new_value.object);
            break;
        case value_kind::MAP:
            compare_maps(
                ctx,
                path,
                static_cast<map_interface const&>(*old_value.type),
                old_value.object,
                new_value.object);
            break;
        case value_kind::POINTER:
            compare_pointers(
                ctx,
                path,
                static_cast<pointer_interface const&>(*old_value.type),
                old_value.object,
                new_value.object);
            break;
        case value_kind::BOOLEAN:
        case value_kind::INTEGER:
        case value_kind::FLOAT:
        case value_kind::STRING:
        case value_kind::DATETIME:
            compare_scalars(ctx, path, old_value, new_value);
            break;
        default:
            DOCPATCH_THROW(
                invalid_enum_value() << enum_id_info("value_kind")
                                     << enum_value_info(int(kind)));
    }
}

// Get the path for a field within a structure at :base, or none if the field
// isn't diffed.
static optional<string>
get_field_path(
    diff_config const& config, string const& base, field_interface const& f)
{
    if (f.is_skipped() || is_ignored_field(config, f.name)
        || is_ignored_field(config, f.external_name))
    {
        return none;
    }
    auto path = extend_path(base, f.external_name);
    if (is_ignored_field(config, path))
        return none;
    return path;
}

void
compare_structures(
    diff_context& ctx,
    string const& path,
    structure_interface const& type,
    void const* old_object,
    void const* new_object)
{
    for (auto const& f : type.fields())
    {
        auto field_path = get_field_path(ctx.config, path, f);
        if (!field_path)
            continue;
        compare_values(ctx, *field_path, f.in(old_object), f.in(new_object));
    }
}

void
unset_structure_fields(
    diff_context& ctx,
    string const& path,
    structure_interface const& type,
    void const* object)
{
    for (auto const& f : type.fields())
    {
        auto field_path = get_field_path(ctx.config, path, f);
        if (!field_path)
            continue;
        auto value = resolve(f.in(object));
        if (value.is_absent() || value.type->is_zero(value.object))
            continue;
        if (value.type->kind() == value_kind::STRUCTURE)
        {
            unset_structure_fields(
                ctx,
                *field_path,
                static_cast<structure_interface const&>(*value.type),
                value.object);
        }
        else
        {
            unset_field(ctx, *field_path);
        }
    }
}

void
compare_maps(
    diff_context& ctx,
    string const& path,
    map_interface const& type,
    void const* old_map,
    void const* new_map)
{
    std::set<string> keys;
    for (auto& key : type.keys(old_map))
        keys.insert(std::move(key));
    for (auto& key : type.keys(new_map))
        keys.insert(std::move(key));

    for (auto const& key : keys)
    {
        compare_values(
            ctx,
            extend_path(path, key),
            type.find(old_map, key),
            type.find(new_map, key));
    }
}

static bool
is_zero_scalar(value_ref value)
{
    return is_scalar_kind(value.type->kind())
           && value.type->is_zero(value.object);
}

void
compare_scalars(
    diff_context& ctx,
    string const& path,
    value_ref old_value,
    value_ref new_value)
{
    if (old_value.type->id() == new_value.type->id()
        && old_value.type->equals(old_value.object, new_value.object))
    {
        return;
    }

    if (is_zero_scalar(new_value))
    {
        switch (ctx.config.zero_values)
        {
            case zero_value_handling::AS_UNSET:
                unset_field(ctx, path);
                return;
            case zero_value_handling::IGNORE:
                return;
            case zero_value_handling::AS_SET:
                break;
            default:
                DOCPATCH_THROW(
                    invalid_enum_value()
                    << enum_id_info("zero_value_handling")
                    << enum_value_info(int(ctx.config.zero_values)));
        }
    }

    set_field(ctx, path, new_value);
}

namespace {

// Marks a pair of pointees as being compared for the lifetime of the object.
struct active_pointee_pair
{
    active_pointee_pair(
        diff_context& ctx,
        string const& path,
        void const* old_pointee,
        void const* new_pointee)
        : ctx(ctx), pair(old_pointee, new_pointee)
    {
        if (!ctx.active_pointees.insert(pair).second)
        {
            DOCPATCH_THROW(cyclic_value_graph() << field_path_info(path));
        }
    }
    ~active_pointee_pair()
    {
        ctx.active_pointees.erase(pair);
    }

    diff_context& ctx;
    std::pair<void const*, void const*> pair;
};

} // namespace

void
compare_pointers(
    diff_context& ctx,
    string const& path,
    pointer_interface const& type,
    void const* old_pointer,
    void const* new_pointer)
{
    auto old_target = type.target(old_pointer);
    auto new_target = type.target(new_pointer);
    // Pointees may themselves be dynamic, so they're resolved before deciding
    // whether they're there.
    auto old_value = resolve(old_target);
    auto new_value = resolve(new_target);

    if (old_value.is_absent() && new_value.is_absent())
        return;
    if (old_value.is_absent())
    {
        add_value(ctx, path, new_value);
        return;
    }
    if (new_value.is_absent())
    {
        remove_value(ctx, path, old_value);
        return;
    }

    // Both pointing at the same thing means nothing changed.
    if (old_target.object == new_target.object)
        return;

    active_pointee_pair active(
        ctx, path, old_target.object, new_target.object);

    if (old_value.type->kind() == value_kind::STRUCTURE
        && old_value.type->id() == new_value.type->id())
    {
        compare_structures(
            ctx,
            path,
            static_cast<structure_interface const&>(*old_value.type),
            old_value.object,
            new_value.object);
    }
    else
    {
        compare_scalars(ctx, path, old_value, new_value);
    }
}

} // namespace detail
} // namespace docpatch
