#include <docpatch/diff/config.h>

#include <sstream>

namespace docpatch {

std::ostream&
operator<<(std::ostream& s, array_strategy strategy)
{
    switch (strategy)
    {
        case array_strategy::REPLACE:
            s << "replace";
            break;
        case array_strategy::SMART:
            s << "smart";
            break;
        case array_strategy::APPEND:
            s << "append";
            break;
        case array_strategy::MERGE:
            s << "merge";
            break;
        default:
            DOCPATCH_THROW(
                invalid_enum_value() << enum_id_info("array_strategy")
                                     << enum_value_info(int(strategy)));
    }
    return s;
}

array_strategy
parse_array_strategy(string const& s)
{
    if (s == "replace")
        return array_strategy::REPLACE;
    if (s == "smart")
        return array_strategy::SMART;
    if (s == "append")
        return array_strategy::APPEND;
    if (s == "merge")
        return array_strategy::MERGE;
    DOCPATCH_THROW(
        invalid_enum_string() << enum_id_info("array_strategy")
                              << enum_string_info(s));
}

void
to_dynamic(dynamic* v, array_strategy x)
{
    std::ostringstream s;
    s << x;
    *v = s.str();
}
void
from_dynamic(array_strategy* x, dynamic const& v)
{
    *x = parse_array_strategy(cast<string>(v));
}

std::ostream&
operator<<(std::ostream& s, zero_value_handling handling)
{
    switch (handling)
    {
        case zero_value_handling::AS_UNSET:
            s << "unset";
            break;
        case zero_value_handling::AS_SET:
            s << "set";
            break;
        case zero_value_handling::IGNORE:
            s << "ignore";
            break;
        default:
            DOCPATCH_THROW(
                invalid_enum_value() << enum_id_info("zero_value_handling")
                                     << enum_value_info(int(handling)));
    }
    return s;
}

zero_value_handling
parse_zero_value_handling(string const& s)
{
    if (s == "unset")
        return zero_value_handling::AS_UNSET;
    if (s == "set")
        return zero_value_handling::AS_SET;
    if (s == "ignore")
        return zero_value_handling::IGNORE;
    DOCPATCH_THROW(
        invalid_enum_string() << enum_id_info("zero_value_handling")
                              << enum_string_info(s));
}

void
to_dynamic(dynamic* v, zero_value_handling x)
{
    std::ostringstream s;
    s << x;
    *v = s.str();
}
void
from_dynamic(zero_value_handling* x, dynamic const& v)
{
    *x = parse_zero_value_handling(cast<string>(v));
}

void
to_dynamic(dynamic* v, diff_config const& x)
{
    *v = dynamic{
        {"ignore_fields", to_dynamic(x.ignore_fields)},
        {"array_strategy", to_dynamic(x.arrays)},
        {"zero_value_handling", to_dynamic(x.zero_values)},
        {"detect_pointer_sharing", dynamic(x.detect_pointer_sharing)}};
}

void
from_dynamic(diff_config* x, dynamic const& v)
{
    auto const& map = cast<dynamic_map>(v);
    dynamic const* field;
    if (get_field(&field, map, "ignore_fields"))
        from_dynamic(&x->ignore_fields, *field);
    if (get_field(&field, map, "array_strategy"))
        from_dynamic(&x->arrays, *field);
    if (get_field(&field, map, "zero_value_handling"))
        from_dynamic(&x->zero_values, *field);
    if (get_field(&field, map, "detect_pointer_sharing"))
        from_dynamic(&x->detect_pointer_sharing, *field);
}

} // namespace docpatch
