#include <docpatch/diff/patch.h>

#include <algorithm>

#include <docpatch/encodings/json.h>

namespace docpatch {

char const* const set_operator = "$set";
char const* const unset_operator = "$unset";
char const* const push_operator = "$push";
char const* const each_modifier = "$each";

bool
operator==(patch_metadata const& a, patch_metadata const& b)
{
    return a.fields_changed == b.fields_changed
           && a.operation_types == b.operation_types
           && a.total_changes == b.total_changes;
}
bool
operator!=(patch_metadata const& a, patch_metadata const& b)
{
    return !(a == b);
}

void
patch::add_operation(string const& op, string const& path, dynamic value)
{
    for (auto i = operations_.begin(); i != operations_.end();)
    {
        if (i->first != op)
        {
            i->second.erase(path);
            if (i->second.empty())
            {
                i = operations_.erase(i);
                continue;
            }
        }
        ++i;
    }
    operations_[op][path] = std::move(value);

    auto& fields = metadata_.fields_changed;
    if (std::find(fields.begin(), fields.end(), path) == fields.end())
        fields.push_back(path);
    metadata_.operation_types[path] = op;
    ++metadata_.total_changes;
}

void
patch::add_array_filter(dynamic filter)
{
    array_filters_.push_back(std::move(filter));
}

patch_info
patch::info() const
{
    return patch_info{operations_, array_filters_, metadata_};
}

std::ostream&
operator<<(std::ostream& s, patch const& p)
{
    std::vector<string> parts;
    if (!p.is_empty())
    {
        parts.push_back(
            "Operations:\n" + value_to_json(to_dynamic(p), 2));
    }
    if (p.has_array_filters())
    {
        parts.push_back(
            "ArrayFilters:\n" + value_to_json(dynamic(p.array_filters()), 2));
    }
    if (p.metadata().total_changes > 0)
    {
        parts.push_back(
            "Changes: " + std::to_string(p.metadata().total_changes)
            + " fields modified");
    }

    if (parts.empty())
        return s << "patch: <empty>";

    s << "patch:";
    for (auto const& part : parts)
        s << "\n" << part;
    return s;
}

static dynamic
operations_to_dynamic(operation_map const& operations)
{
    dynamic_map document;
    for (auto const& op : operations)
    {
        dynamic_map fields;
        for (auto const& field : op.second)
            fields[dynamic(field.first)] = field.second;
        document[dynamic(op.first)] = dynamic(std::move(fields));
    }
    return dynamic(std::move(document));
}

void
to_dynamic(dynamic* v, patch const& p)
{
    *v = operations_to_dynamic(p.operations());
}

void
to_dynamic(dynamic* v, patch_metadata const& m)
{
    dynamic_map types;
    for (auto const& i : m.operation_types)
        types[dynamic(i.first)] = dynamic(i.second);
    *v = dynamic{
        {"fieldsChanged", to_dynamic(m.fields_changed)},
        {"operationTypes", dynamic(std::move(types))},
        {"totalChanges", dynamic(m.total_changes)}};
}

void
to_dynamic(dynamic* v, patch_info const& info)
{
    dynamic_map map;
    map[dynamic("operations")] = operations_to_dynamic(info.operations);
    if (!info.array_filters.empty())
        map[dynamic("arrayFilters")] = dynamic(info.array_filters);
    map[dynamic("metadata")] = to_dynamic(info.metadata);
    *v = dynamic(std::move(map));
}

} // namespace docpatch
