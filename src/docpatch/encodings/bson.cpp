#include <docpatch/encodings/bson.h>

#include <memory>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <bson/bson.h>

#include <docpatch/diff/patch.h>

namespace docpatch {

namespace {

struct bson_deleter
{
    void
    operator()(bson_t* b) const
    {
        bson_destroy(b);
    }
};

typedef std::unique_ptr<bson_t, bson_deleter> bson_ptr;

ptime const unix_epoch(boost::gregorian::date(1970, 1, 1));

} // namespace

static void
check_append(bool succeeded, string const& key)
{
    if (!succeeded)
    {
        DOCPATCH_THROW(
            bson_encoding_error()
            << bson_key_info(key)
            << error_message_info("document size limit exceeded"));
    }
}

static void
write_bson_document(bson_t* doc, dynamic_map const& map);

static void
append_bson_value(bson_t* doc, string const& key, dynamic const& v)
{
    char const* k = key.c_str();
    int length = boost::numeric_cast<int>(key.length());
    switch (v.type())
    {
        case value_type::NIL:
        default:
            check_append(bson_append_null(doc, k, length), key);
            break;
        case value_type::BOOLEAN:
            check_append(bson_append_bool(doc, k, length, cast<bool>(v)), key);
            break;
        case value_type::INTEGER:
            check_append(
                bson_append_int64(doc, k, length, cast<integer>(v)), key);
            break;
        case value_type::FLOAT:
            check_append(
                bson_append_double(doc, k, length, cast<double>(v)), key);
            break;
        case value_type::STRING: {
            auto const& s = cast<string>(v);
            check_append(
                bson_append_utf8(
                    doc,
                    k,
                    length,
                    s.c_str(),
                    boost::numeric_cast<int>(s.length())),
                key);
            break;
        }
        case value_type::DATETIME: {
            auto const& t = cast<ptime>(v);
            // A cleared datetime has no position in time.
            if (t.is_not_a_date_time())
            {
                check_append(bson_append_null(doc, k, length), key);
                break;
            }
            check_append(
                bson_append_date_time(
                    doc, k, length, (t - unix_epoch).total_milliseconds()),
                key);
            break;
        }
        case value_type::ARRAY: {
            bson_t child;
            check_append(bson_append_array_begin(doc, k, length, &child), key);
            auto const& array = cast<dynamic_array>(v);
            for (size_t i = 0; i != array.size(); ++i)
                append_bson_value(&child, std::to_string(i), array[i]);
            check_append(bson_append_array_end(doc, &child), key);
            break;
        }
        case value_type::MAP: {
            bson_t child;
            check_append(
                bson_append_document_begin(doc, k, length, &child), key);
            write_bson_document(&child, cast<dynamic_map>(v));
            check_append(bson_append_document_end(doc, &child), key);
            break;
        }
    }
}

static void
write_bson_document(bson_t* doc, dynamic_map const& map)
{
    for (auto const& i : map)
    {
        if (i.first.type() != value_type::STRING)
        {
            DOCPATCH_THROW(
                bson_encoding_error()
                << error_message_info("document keys must be strings"));
        }
        append_bson_value(doc, cast<string>(i.first), i.second);
    }
}

byte_vector
value_to_bson(dynamic const& document)
{
    if (document.type() != value_type::MAP)
    {
        DOCPATCH_THROW(
            bson_encoding_error()
            << error_message_info("only maps can be encoded as documents"));
    }
    bson_ptr doc(bson_new());
    write_bson_document(doc.get(), cast<dynamic_map>(document));
    auto const* data = bson_get_data(doc.get());
    return byte_vector(data, data + doc->len);
}

static dynamic
read_bson_document(bson_iter_t* iter, bool as_array);

static dynamic
read_bson_value(bson_iter_t* iter)
{
    switch (bson_iter_type(iter))
    {
        case BSON_TYPE_NULL:
            return nil;
        case BSON_TYPE_BOOL:
            return bson_iter_bool(iter);
        case BSON_TYPE_INT32:
            return integer(bson_iter_int32(iter));
        case BSON_TYPE_INT64:
            return integer(bson_iter_int64(iter));
        case BSON_TYPE_DOUBLE:
            return bson_iter_double(iter);
        case BSON_TYPE_UTF8: {
            uint32_t length;
            char const* s = bson_iter_utf8(iter, &length);
            return string(s, length);
        }
        case BSON_TYPE_DATE_TIME:
            return unix_epoch
                   + boost::posix_time::milliseconds(
                       bson_iter_date_time(iter));
        case BSON_TYPE_ARRAY:
        case BSON_TYPE_DOCUMENT: {
            bson_iter_t child;
            if (!bson_iter_recurse(iter, &child))
            {
                DOCPATCH_THROW(
                    bson_encoding_error()
                    << bson_key_info(bson_iter_key(iter))
                    << error_message_info("corrupt nested document"));
            }
            return read_bson_document(
                &child, bson_iter_type(iter) == BSON_TYPE_ARRAY);
        }
        default:
            DOCPATCH_THROW(
                bson_encoding_error()
                << bson_key_info(bson_iter_key(iter))
                << error_message_info("unsupported BSON type"));
    }
}

static dynamic
read_bson_document(bson_iter_t* iter, bool as_array)
{
    if (as_array)
    {
        dynamic_array array;
        while (bson_iter_next(iter))
            array.push_back(read_bson_value(iter));
        return array;
    }
    dynamic_map map;
    while (bson_iter_next(iter))
        map[dynamic(string(bson_iter_key(iter)))] = read_bson_value(iter);
    return map;
}

dynamic
parse_bson_document(uint8_t const* data, size_t size)
{
    bson_t doc;
    bson_iter_t iter;
    if (!bson_init_static(&doc, data, size) || !bson_iter_init(&iter, &doc))
    {
        DOCPATCH_THROW(
            bson_encoding_error() << error_message_info("invalid document"));
    }
    return read_bson_document(&iter, false);
}

byte_vector
patch_to_bson(patch const& p)
{
    if (p.is_empty())
        DOCPATCH_THROW(empty_patch());
    return value_to_bson(to_dynamic(p));
}

} // namespace docpatch
