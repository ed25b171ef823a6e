#ifndef DOCPATCH_DIFF_POINTER_TRACKER_H
#define DOCPATCH_DIFF_POINTER_TRACKER_H

#include <unordered_map>
#include <vector>

#include <docpatch/core/reflection.h>

namespace docpatch {

// a pointee that's reachable from both the old and the new value
struct pointer_sharing
{
    void const* address;
    string old_path;
    string new_path;
};

// Get the readable description of a sharing.
string
describe_pointer_sharing(pointer_sharing const& sharing);

// Records the pointee of every non-null pointer reachable from the old and
// new values, along with the path where it was first found.
//
// Sequence elements extend paths as path[i] and map entries as path.key.
// Each pointee is only walked once per side, so cyclic graphs terminate.
class pointer_tracker
{
 public:
    // Walk :root (which may be absent) and record its pointers.
    void
    track(bool is_old, value_ref root);

    void
    track_pointer(bool is_old, string const& path, void const* address);

    bool
    is_tracked(bool is_old, void const* address) const;

    // Find the first pointee (in new-side traversal order) that's reachable
    // from both sides.
    optional<pointer_sharing>
    find_sharing() const;

 private:
    struct side
    {
        std::unordered_map<void const*, string> paths;
        std::vector<void const*> order;
    };

    void
    walk(bool is_old, string const& path, value_ref value);

    side old_;
    side new_;
};

} // namespace docpatch

#endif
