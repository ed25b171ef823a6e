#ifndef DOCPATCH_DIFF_PATCH_H
#define DOCPATCH_DIFF_PATCH_H

#include <map>
#include <ostream>
#include <vector>

#include <docpatch/core/dynamic.h>

namespace docpatch {

// update operators
extern char const* const set_operator;
extern char const* const unset_operator;
extern char const* const push_operator;
// the modifier for pushing several values at once
extern char const* const each_modifier;

// operator -> field path -> value
typedef std::map<string, std::map<string, dynamic>> operation_map;

struct patch_metadata
{
    // paths in the order they were first changed
    std::vector<string> fields_changed;
    // path -> the operator last recorded for it
    std::map<string, string> operation_types;
    // the number of operations recorded (including overwrites)
    integer total_changes = 0;
};

bool
operator==(patch_metadata const& a, patch_metadata const& b);
bool
operator!=(patch_metadata const& a, patch_metadata const& b);

// patch_info is a plain snapshot of a patch, for inspection and encoding.
struct patch_info
{
    operation_map operations;
    dynamic_array array_filters;
    patch_metadata metadata;
};

// A patch is the set of update operations that transforms one value into
// another.
//
// A field path is recorded under at most one operator. Recording a path under
// one operator removes it from any others, and operator groups left empty are
// dropped.
class patch
{
 public:
    // Record :value for :path under :op.
    // An existing value for the same operator and path is overwritten.
    void
    add_operation(string const& op, string const& path, dynamic value);

    void
    add_array_filter(dynamic filter);

    operation_map const&
    operations() const
    {
        return operations_;
    }

    dynamic_array const&
    array_filters() const
    {
        return array_filters_;
    }

    patch_metadata const&
    metadata() const
    {
        return metadata_;
    }

    bool
    is_empty() const
    {
        return operations_.empty();
    }

    bool
    has_array_filters() const
    {
        return !array_filters_.empty();
    }

    patch_info
    info() const;

 private:
    operation_map operations_;
    dynamic_array array_filters_;
    patch_metadata metadata_;
};

// Write a readable summary of the patch.
std::ostream&
operator<<(std::ostream& s, patch const& p);

// Thrown when a patch without operations is encoded as an update document.
DOCPATCH_DEFINE_EXCEPTION(empty_patch)

// Get the update document for a patch (operator -> {path: value}).
void
to_dynamic(dynamic* v, patch const& p);

void
to_dynamic(dynamic* v, patch_metadata const& m);

// {operations, arrayFilters, metadata}, with arrayFilters omitted when there
// are none
void
to_dynamic(dynamic* v, patch_info const& info);

} // namespace docpatch

#endif
