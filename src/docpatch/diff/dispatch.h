#ifndef DOCPATCH_DIFF_DISPATCH_H
#define DOCPATCH_DIFF_DISPATCH_H

#include <set>
#include <utility>

#include <docpatch/diff/array_filters.h>
#include <docpatch/diff/diff.h>

// This file declares the comparators that compute_patch() is built from.
// They all record their results directly in the context's patch.

namespace docpatch {
namespace detail {

struct diff_context
{
    diff_context(diff_config const& config, patch& result)
        : config(config), result(result)
    {
    }

    diff_config const& config;
    patch& result;

    // shared by all the arrays in the patch so that filter identifiers
    // don't collide
    array_filter_identifier filter_identifiers;

    // pointee pairs currently being compared further up the stack
    std::set<std::pair<void const*, void const*>> active_pointees;
};

// Get the path of :name within :base.
string
extend_path(string const& base, string const& name);

bool
is_ignored_field(diff_config const& config, string const& name);

// Compare two values, either of which may be absent.
void
compare_values(
    diff_context& ctx,
    string const& path,
    value_ref old_value,
    value_ref new_value);

void
compare_structures(
    diff_context& ctx,
    string const& path,
    structure_interface const& type,
    void const* old_object,
    void const* new_object);

// Record $unsets for all the non-zero fields of a structure that's been
// removed.
void
unset_structure_fields(
    diff_context& ctx,
    string const& path,
    structure_interface const& type,
    void const* object);

void
compare_maps(
    diff_context& ctx,
    string const& path,
    map_interface const& type,
    void const* old_map,
    void const* new_map);

// Both values must be present and resolved.
void
compare_scalars(
    diff_context& ctx,
    string const& path,
    value_ref old_value,
    value_ref new_value);

void
compare_pointers(
    diff_context& ctx,
    string const& path,
    pointer_interface const& type,
    void const* old_pointer,
    void const* new_pointer);

// implemented in arrays.cpp
void
compare_arrays(
    diff_context& ctx,
    string const& path,
    array_interface const& type,
    void const* old_array,
    void const* new_array);

// :value must be present and resolved.
void
set_field(diff_context& ctx, string const& path, value_ref value);

void
unset_field(diff_context& ctx, string const& path);

} // namespace detail
} // namespace docpatch

#endif
