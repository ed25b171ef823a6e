#include <docpatch/encodings/json.h>

#include <cctype>
#include <mutex>

#include <boost/numeric/conversion/cast.hpp>

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <docpatch/diff/patch.h>
#include <docpatch/utilities/text.h>

namespace docpatch {

// JSON I/O

static bool
safe_isdigit(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch));
}

// Read a JSON value into a dynamic.
static dynamic
read_json_value(simdjson::dom::element const& json)
{
    switch (json.type())
    {
        case simdjson::dom::element_type::NULL_VALUE:
        default: // to avoid warnings
            return nil;
        case simdjson::dom::element_type::BOOL:
            return bool(json);
        case simdjson::dom::element_type::INT64:
            return boost::numeric_cast<integer>(int64_t(json));
        case simdjson::dom::element_type::UINT64:
            return boost::numeric_cast<integer>(uint64_t(json));
        case simdjson::dom::element_type::DOUBLE:
            return double(json);
        case simdjson::dom::element_type::STRING: {
            // Datetimes are also encoded as JSON strings, so this checks to
            // see if the string parses as one. If so, it's assumed to be one.
            auto s = json.get_string().value();
            // First check if it looks anything like a datetime string.
            if (s.length() > 16 && safe_isdigit(s[0]) && safe_isdigit(s[1])
                && safe_isdigit(s[2]) && safe_isdigit(s[3]) && s[4] == '-')
            {
                try
                {
                    auto t = parse_ptime(string(s));
                    // Check that it can be converted back without changing
                    // its value.
                    if (to_value_string(t) == s)
                        return t;
                }
                catch (parsing_error&)
                {
                    // Not a datetime after all.
                }
            }
            return string(s);
        }
        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array source = json;
            dynamic_array array;
            array.reserve(source.size());
            for (auto const& i : source)
                array.push_back(read_json_value(i));
            return array;
        }
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object object = json;
            dynamic_map map;
            for (auto const& i : object)
                map[string(i.key)] = read_json_value(i.value);
            return map;
        }
    }
}

dynamic
parse_json_value(char const* json, size_t length)
{
    static simdjson::dom::parser the_parser;
    static std::mutex the_mutex;

    std::lock_guard<std::mutex> guard(the_mutex);

    simdjson::dom::element doc;
    try
    {
        doc = the_parser.parse(json, length);
    }
    catch (simdjson::simdjson_error& e)
    {
        DOCPATCH_THROW(
            parsing_error() << expected_format_info("JSON")
                            << parsed_text_info(string(json, json + length))
                            << parsing_error_info(e.what()));
    }
    return read_json_value(doc);
}

static nlohmann::json
to_nlohmann_json(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // to avoid warnings
            return nullptr;
        case value_type::BOOLEAN:
            return cast<bool>(v);
        case value_type::INTEGER:
            return cast<integer>(v);
        case value_type::FLOAT:
            return cast<double>(v);
        case value_type::STRING:
            return cast<string>(v);
        case value_type::DATETIME: {
            auto const& t = cast<ptime>(v);
            if (t.is_not_a_date_time())
                return nullptr;
            return to_value_string(t);
        }
        case value_type::ARRAY: {
            nlohmann::json json(nlohmann::json::value_t::array);
            for (auto const& i : cast<dynamic_array>(v))
                json.push_back(to_nlohmann_json(i));
            return json;
        }
        case value_type::MAP: {
            nlohmann::json json(nlohmann::json::value_t::object);
            for (auto const& i : cast<dynamic_map>(v))
            {
                // Object keys must be strings. Other keys are written in their
                // JSON form.
                string key = i.first.type() == value_type::STRING
                                 ? cast<string>(i.first)
                                 : to_nlohmann_json(i.first).dump();
                json[key] = to_nlohmann_json(i.second);
            }
            return json;
        }
    }
}

string
value_to_json(dynamic const& v, int indent)
{
    return to_nlohmann_json(v).dump(indent);
}

string
patch_info_to_json(patch_info const& info, int indent)
{
    return value_to_json(to_dynamic(info), indent);
}

} // namespace docpatch
