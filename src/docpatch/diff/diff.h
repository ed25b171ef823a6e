#ifndef DOCPATCH_DIFF_DIFF_H
#define DOCPATCH_DIFF_DIFF_H

#include <docpatch/core/reflection.h>
#include <docpatch/diff/config.h>
#include <docpatch/diff/patch.h>

namespace docpatch {

// Thrown when both values given to compute_patch() are absent.
DOCPATCH_DEFINE_EXCEPTION(nil_pair)

// Thrown when the old and new values at some path have different types.
DOCPATCH_DEFINE_EXCEPTION(type_mismatch)
DOCPATCH_DEFINE_ERROR_INFO(string, field_path)
DOCPATCH_DEFINE_ERROR_INFO(string, old_type)
DOCPATCH_DEFINE_ERROR_INFO(string, new_type)

// Thrown (when detection is enabled) if the old and new values share a
// pointee. :field_path_info is the path on the new side.
DOCPATCH_DEFINE_EXCEPTION(pointer_sharing_detected)
DOCPATCH_DEFINE_ERROR_INFO(string, old_field_path)
DOCPATCH_DEFINE_ERROR_INFO(uintptr_t, pointer_address)

// Compute the patch that transforms :old_value into :new_value.
//
// Either value (but not both) may be absent. Any error aborts the whole
// computation, so no partial patch is ever produced.
patch
compute_patch(
    value_ref old_value,
    value_ref new_value,
    diff_config const& config = diff_config());

// Same, but taking the values directly. nil (or nullptr) stands for an absent
// value.
template<class Old, class New>
patch
compute_patch(
    Old const& old_value,
    New const& new_value,
    diff_config const& config = diff_config())
{
    return compute_patch(
        make_value_ref(old_value), make_value_ref(new_value), config);
}

} // namespace docpatch

#endif
