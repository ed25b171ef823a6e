#include <docpatch/encodings/msgpack.h>

#include <cstring>
#include <sstream>

#include <docpatch/diff/patch.h>
#include <docpatch/encodings/msgpack_internals.h>
#include <docpatch/utilities/text.h>

namespace docpatch {

// Read a big-endian integer of type T from :data.
template<class T>
static int64_t
read_big_endian(char const* data)
{
    T x;
    std::memcpy(&x, data, sizeof(T));
    return boost::endian::big_to_native(x);
}

static dynamic
read_msgpack_value(msgpack::object const& object)
{
    switch (object.type)
    {
        case msgpack::type::NIL:
        default:
            return nil;
        case msgpack::type::BOOLEAN:
            return object.via.boolean;
        case msgpack::type::POSITIVE_INTEGER:
            return boost::numeric_cast<integer>(object.via.u64);
        case msgpack::type::NEGATIVE_INTEGER:
            return boost::numeric_cast<integer>(object.via.i64);
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return object.via.f64;
        case msgpack::type::STR:
            return string(object.via.str.ptr, object.via.str.size);
        case msgpack::type::BIN:
            DOCPATCH_THROW(
                parsing_error()
                << expected_format_info("MessagePack")
                << parsing_error_info("binary data is not supported"));
        case msgpack::type::ARRAY: {
            size_t size = object.via.array.size;
            dynamic_array array;
            array.reserve(size);
            for (size_t i = 0; i != size; ++i)
                array.push_back(read_msgpack_value(object.via.array.ptr[i]));
            return array;
        }
        case msgpack::type::MAP: {
            dynamic_map map;
            for (size_t i = 0; i != object.via.map.size; ++i)
            {
                auto const& pair = object.via.map.ptr[i];
                map[read_msgpack_value(pair.key)]
                    = read_msgpack_value(pair.val);
            }
            return map;
        }
        case msgpack::type::EXT: {
            if (object.via.ext.type() != msgpack_datetime_ext_type)
            {
                DOCPATCH_THROW(
                    parsing_error() << expected_format_info("MessagePack")
                                    << parsing_error_info(
                                           "unsupported extension type"));
            }
            auto const* data = object.via.ext.data();
            int64_t t;
            switch (object.via.ext.size)
            {
                case 1:
                    t = *reinterpret_cast<int8_t const*>(data);
                    break;
                case 2:
                    t = read_big_endian<int16_t>(data);
                    break;
                case 4:
                    t = read_big_endian<int32_t>(data);
                    break;
                case 8:
                    t = read_big_endian<int64_t>(data);
                    break;
                default:
                    DOCPATCH_THROW(
                        parsing_error()
                        << expected_format_info("MessagePack")
                        << parsing_error_info("invalid datetime size"));
            }
            return ptime(boost::gregorian::date(1970, 1, 1))
                   + boost::posix_time::milliseconds(t);
        }
    }
}

dynamic
parse_msgpack_value(uint8_t const* data, size_t size)
{
    msgpack::object_handle handle;
    try
    {
        handle = msgpack::unpack(reinterpret_cast<char const*>(data), size);
    }
    catch (msgpack::unpack_error& e)
    {
        DOCPATCH_THROW(
            parsing_error() << expected_format_info("MessagePack")
                            << parsing_error_info(e.what()));
    }
    return read_msgpack_value(handle.get());
}

dynamic
parse_msgpack_value(string const& msgpack)
{
    return parse_msgpack_value(
        reinterpret_cast<uint8_t const*>(msgpack.c_str()), msgpack.length());
}

string
value_to_msgpack_string(dynamic const& v)
{
    std::stringstream stream;
    msgpack::packer<std::stringstream> packer(stream);
    write_msgpack_value(packer, v);
    return stream.str();
}

byte_vector
value_to_msgpack_bytes(dynamic const& v)
{
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> packer(buffer);
    write_msgpack_value(packer, v);
    auto const* data = reinterpret_cast<uint8_t const*>(buffer.data());
    return byte_vector(data, data + buffer.size());
}

byte_vector
patch_to_msgpack(patch const& p)
{
    if (p.is_empty())
        DOCPATCH_THROW(empty_patch());
    return value_to_msgpack_bytes(to_dynamic(p));
}

} // namespace docpatch
