#include <docpatch/diff/pointer_tracker.h>

#include <fmt/format.h>

namespace docpatch {

string
describe_pointer_sharing(pointer_sharing const& sharing)
{
    return fmt::format(
        "pointer sharing detected at address {}: old field '{}' and new "
        "field '{}' point to the same memory location",
        sharing.address,
        sharing.old_path,
        sharing.new_path);
}

static string
extend_tracked_path(string const& base, string const& name)
{
    return base.empty() ? name : base + "." + name;
}

void
pointer_tracker::track(bool is_old, value_ref root)
{
    walk(is_old, string(), root);
}

void
pointer_tracker::track_pointer(
    bool is_old, string const& path, void const* address)
{
    auto& s = is_old ? old_ : new_;
    if (s.paths.emplace(address, path).second)
        s.order.push_back(address);
}

bool
pointer_tracker::is_tracked(bool is_old, void const* address) const
{
    auto const& s = is_old ? old_ : new_;
    return s.paths.find(address) != s.paths.end();
}

void
pointer_tracker::walk(bool is_old, string const& path, value_ref value)
{
    value = resolve(value);
    if (value.is_absent())
        return;

    switch (value.type->kind())
    {
        case value_kind::POINTER: {
            auto const& type
                = static_cast<pointer_interface const&>(*value.type);
            auto target = type.target(value.object);
            if (target.is_absent() || is_tracked(is_old, target.object))
                break;
            track_pointer(is_old, path, target.object);
            walk(is_old, path, target);
            break;
        }
        case value_kind::STRUCTURE: {
            auto const& type
                = static_cast<structure_interface const&>(*value.type);
            for (auto const& f : type.fields())
            {
                if (f.is_skipped())
                    continue;
                walk(
                    is_old,
                    extend_tracked_path(path, f.external_name),
                    f.in(value.object));
            }
            break;
        }
        case value_kind::ARRAY: {
            auto const& type
                = static_cast<array_interface const&>(*value.type);
            size_t n = type.size(value.object);
            for (size_t i = 0; i != n; ++i)
            {
                walk(
                    is_old,
                    fmt::format("{}[{}]", path, i),
                    type.element(value.object, i));
            }
            break;
        }
        case value_kind::MAP: {
            auto const& type = static_cast<map_interface const&>(*value.type);
            for (auto const& key : type.keys(value.object))
            {
                walk(
                    is_old,
                    extend_tracked_path(path, key),
                    type.find(value.object, key));
            }
            break;
        }
        default:
            break;
    }
}

optional<pointer_sharing>
pointer_tracker::find_sharing() const
{
    for (auto address : new_.order)
    {
        auto old_path = old_.paths.find(address);
        if (old_path != old_.paths.end())
        {
            return pointer_sharing{
                address, old_path->second, new_.paths.at(address)};
        }
    }
    return none;
}

} // namespace docpatch
