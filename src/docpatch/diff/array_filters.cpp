#include <docpatch/diff/array_filters.h>

#include <boost/numeric/conversion/cast.hpp>

#include <fmt/format.h>

namespace docpatch {

string
array_filter_identifier::next()
{
    return fmt::format("elem{}", counter_++);
}

dynamic
make_index_filter(string const& identifier, size_t index)
{
    return dynamic{
        {identifier + "._index", dynamic(boost::numeric_cast<integer>(index))}};
}

string
make_filtered_path(string const& field_path, string const& identifier)
{
    return field_path + ".$[" + identifier + "]";
}

} // namespace docpatch
