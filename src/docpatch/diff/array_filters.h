#ifndef DOCPATCH_DIFF_ARRAY_FILTERS_H
#define DOCPATCH_DIFF_ARRAY_FILTERS_H

#include <docpatch/core/dynamic.h>

namespace docpatch {

// Produces the identifiers (elem0, elem1, ...) that tie positional updates to
// their array filters. One generator is shared by a whole diff, so
// identifiers are unique within a patch.
class array_filter_identifier
{
 public:
    string
    next();

 private:
    int counter_ = 0;
};

// Get the filter document selecting the element at :index for :identifier,
// i.e., {"<identifier>._index": index}.
dynamic
make_index_filter(string const& identifier, size_t index);

// Get the path that addresses the elements of :field_path selected by
// :identifier, i.e., "<field_path>.$[<identifier>]".
string
make_filtered_path(string const& field_path, string const& identifier);

} // namespace docpatch

#endif
