#include <docpatch/diff/dispatch.h>

#include <algorithm>

#include <docpatch/diff/array_filters.h>
#include <docpatch/utilities/logging.h>

namespace docpatch {
namespace detail {

namespace {

// the arrays being reconciled at a particular path
struct array_pair
{
    string const& path;
    array_interface const& type;
    void const* old_array;
    void const* new_array;

    size_t
    old_size() const
    {
        return type.size(old_array);
    }
    size_t
    new_size() const
    {
        return type.size(new_array);
    }

    value_ref
    old_element(size_t i) const
    {
        return type.element(old_array, i);
    }
    value_ref
    new_element(size_t i) const
    {
        return type.element(new_array, i);
    }
};

} // namespace

static bool
elements_equal(value_ref a, value_ref b)
{
    a = resolve(a);
    b = resolve(b);
    if (a.is_absent() || b.is_absent())
        return a.is_absent() && b.is_absent();
    return a.type->id() == b.type->id() && a.type->equals(a.object, b.object);
}

static dynamic
element_as_dynamic(value_ref element)
{
    return element.type->as_dynamic(element.object);
}

// Are the elements of the old array primitives? (The first element decides.)
static bool
has_primitive_elements(array_pair const& arrays)
{
    if (arrays.old_size() == 0)
        return false;
    auto first = resolve(arrays.old_element(0));
    return !first.is_absent() && is_primitive_kind(first.type->kind());
}

static void
replace_array(diff_context& ctx, array_pair const& arrays)
{
    ctx.result.add_operation(
        set_operator, arrays.path, arrays.type.as_dynamic(arrays.new_array));
}

// Push :elements onto the array, using $each if there's more than one.
static void
push_elements(diff_context& ctx, string const& path, dynamic_array elements)
{
    if (elements.size() == 1)
    {
        ctx.result.add_operation(push_operator, path, std::move(elements[0]));
    }
    else
    {
        ctx.result.add_operation(
            push_operator,
            path,
            dynamic{{each_modifier, dynamic(std::move(elements))}});
    }
}

// Push the elements of the new array beyond the end of the old one.
static void
push_tail(diff_context& ctx, array_pair const& arrays)
{
    dynamic_array tail;
    for (size_t i = arrays.old_size(); i != arrays.new_size(); ++i)
        tail.push_back(element_as_dynamic(arrays.new_element(i)));
    push_elements(ctx, arrays.path, std::move(tail));
}

// Record a positional $set of :value for the element at :index.
static void
set_element(
    diff_context& ctx,
    string const& path,
    size_t index,
    dynamic value)
{
    auto id = ctx.filter_identifiers.next();
    ctx.result.add_array_filter(make_index_filter(id, index));
    ctx.result.add_operation(
        set_operator, make_filtered_path(path, id), std::move(value));
}

static void
fall_back_to_replace(
    diff_context& ctx, array_pair const& arrays, char const* reason)
{
    get_logger()->debug(
        "replacing array at '{}' ({})", arrays.path, reason);
    replace_array(ctx, arrays);
}

// APPEND

static void
append_to_array(diff_context& ctx, array_pair const& arrays)
{
    size_t old_size = arrays.old_size();
    size_t new_size = arrays.new_size();

    if (new_size < old_size)
    {
        fall_back_to_replace(ctx, arrays, "array shrank");
        return;
    }
    for (size_t i = 0; i != old_size; ++i)
    {
        if (!elements_equal(arrays.old_element(i), arrays.new_element(i)))
        {
            fall_back_to_replace(ctx, arrays, "existing elements changed");
            return;
        }
    }
    if (new_size > old_size)
        push_tail(ctx, arrays);
}

// SMART

static void
update_array_in_place(diff_context& ctx, array_pair const& arrays)
{
    size_t old_size = arrays.old_size();
    size_t new_size = arrays.new_size();
    size_t common_size = std::min(old_size, new_size);

    std::vector<size_t> changed;
    for (size_t i = 0; i != common_size; ++i)
    {
        if (!elements_equal(arrays.old_element(i), arrays.new_element(i)))
            changed.push_back(i);
    }

    bool length_changed = old_size != new_size;

    if (!changed.empty() && length_changed)
    {
        fall_back_to_replace(ctx, arrays, "elements and length changed");
        return;
    }

    if (!changed.empty())
    {
        for (auto i : changed)
        {
            set_element(
                ctx,
                arrays.path,
                i,
                element_as_dynamic(arrays.new_element(i)));
        }
        return;
    }

    if (new_size > old_size)
        push_tail(ctx, arrays);
    else if (new_size < old_size)
        fall_back_to_replace(ctx, arrays, "array shrank");
}

static void
reconcile_arrays_smartly(diff_context& ctx, array_pair const& arrays)
{
    size_t old_size = arrays.old_size();
    size_t new_size = arrays.new_size();
    size_t size_change
        = old_size > new_size ? old_size - new_size : new_size - old_size;

    if (old_size == 0 || new_size == 0
        || size_change > std::max(old_size, new_size) / 2)
    {
        fall_back_to_replace(ctx, arrays, "length changed substantially");
        return;
    }
    if (has_primitive_elements(arrays))
    {
        replace_array(ctx, arrays);
        return;
    }
    update_array_in_place(ctx, arrays);
}

// MERGE

// Fields that identify structure elements, in order of priority.
static char const* const identifier_fields[]
    = {"ID", "Id", "Key", "Name", "UUID", "Uuid"};

// Should :old_element and :new_element be treated as the same element?
// Structures match if they agree on the first identifier field that's
// populated on either side. Everything else must be equal to match.
static bool
elements_match(value_ref old_element, value_ref new_element)
{
    auto a = resolve(old_element);
    auto b = resolve(new_element);
    if (!a.is_absent() && !b.is_absent()
        && a.type->kind() == value_kind::STRUCTURE
        && a.type->id() == b.type->id())
    {
        auto const& type = static_cast<structure_interface const&>(*a.type);
        for (auto name : identifier_fields)
        {
            auto f = type.find_field(name);
            if (!f || f->is_skipped())
                continue;
            auto x = f->in(a.object);
            auto y = f->in(b.object);
            if (x.type->is_zero(x.object) && y.type->is_zero(y.object))
                continue;
            return x.type->equals(x.object, y.object);
        }
    }
    return elements_equal(old_element, new_element);
}

static void
merge_arrays(diff_context& ctx, array_pair const& arrays)
{
    size_t old_size = arrays.old_size();
    size_t new_size = arrays.new_size();

    if (old_size == 0)
    {
        replace_array(ctx, arrays);
        return;
    }
    if (new_size == 0)
    {
        unset_field(ctx, arrays.path);
        return;
    }
    if (has_primitive_elements(arrays))
    {
        replace_array(ctx, arrays);
        return;
    }

    // Pair each new element with the first unused old element it matches.
    std::vector<bool> old_matched(old_size, false);
    std::vector<bool> new_matched(new_size, false);
    // (new index, old index) for matched pairs that differ
    std::vector<std::pair<size_t, size_t>> updates;
    for (size_t i = 0; i != new_size; ++i)
    {
        auto new_element = arrays.new_element(i);
        for (size_t j = 0; j != old_size; ++j)
        {
            if (old_matched[j])
                continue;
            auto old_element = arrays.old_element(j);
            if (elements_match(old_element, new_element))
            {
                if (!elements_equal(old_element, new_element))
                    updates.emplace_back(i, j);
                old_matched[j] = true;
                new_matched[i] = true;
                break;
            }
        }
    }

    size_t removals = std::count(old_matched.begin(), old_matched.end(), false);
    size_t additions
        = std::count(new_matched.begin(), new_matched.end(), false);

    if (!updates.empty() && additions != 0)
    {
        fall_back_to_replace(ctx, arrays, "elements updated and added");
        return;
    }
    if (removals != 0)
    {
        fall_back_to_replace(ctx, arrays, "elements removed");
        return;
    }

    if (additions != 0)
    {
        dynamic_array added;
        for (size_t i = 0; i != new_size; ++i)
        {
            if (!new_matched[i])
                added.push_back(element_as_dynamic(arrays.new_element(i)));
        }
        push_elements(ctx, arrays.path, std::move(added));
        return;
    }

    for (auto const& update : updates)
    {
        set_element(
            ctx,
            arrays.path,
            update.second,
            element_as_dynamic(arrays.new_element(update.first)));
    }
}

void
compare_arrays(
    diff_context& ctx,
    string const& path,
    array_interface const& type,
    void const* old_array,
    void const* new_array)
{
    if (type.equals(old_array, new_array))
        return;

    DOCPATCH_LOG_CALL(<< DOCPATCH_LOG_ARG(path))

    array_pair arrays{path, type, old_array, new_array};
    switch (ctx.config.arrays)
    {
        case array_strategy::REPLACE:
            replace_array(ctx, arrays);
            break;
        case array_strategy::SMART:
            reconcile_arrays_smartly(ctx, arrays);
            break;
        case array_strategy::APPEND:
            append_to_array(ctx, arrays);
            break;
        case array_strategy::MERGE:
            merge_arrays(ctx, arrays);
            break;
        default:
            DOCPATCH_THROW(
                invalid_enum_value()
                << enum_id_info("array_strategy")
                << enum_value_info(int(ctx.config.arrays)));
    }
}

} // namespace detail
} // namespace docpatch
