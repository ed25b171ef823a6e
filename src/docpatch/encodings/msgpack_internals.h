#ifndef DOCPATCH_ENCODINGS_MSGPACK_INTERNALS_H
#define DOCPATCH_ENCODINGS_MSGPACK_INTERNALS_H

// This file provides a generic implementation of msgpack encoding on dynamic
// values.
//
// It takes care of understanding dynamic values and interfacing them with
// msgpack-c, but it leaves it up to you to supply the implementation of
// msgpack-c's Buffer concept and initialize the msgpack::packer object.

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <docpatch/encodings/msgpack.h>

// Include msgpack-c, disabling any warnings that it would trigger.
#define MSGPACK_USE_CPP11
#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <msgpack.hpp>
#pragma GCC diagnostic pop
#else
#include <msgpack.hpp>
#endif

namespace docpatch {

// the MessagePack extension type used for datetimes
int8_t const msgpack_datetime_ext_type = 1;

template<class Buffer>
void
write_msgpack_value(msgpack::packer<Buffer>& packer, dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
            packer.pack_nil();
            break;
        case value_type::BOOLEAN:
            if (cast<bool>(v))
                packer.pack_true();
            else
                packer.pack_false();
            break;
        case value_type::INTEGER:
            packer.pack_int64(cast<integer>(v));
            break;
        case value_type::FLOAT:
            packer.pack_double(cast<double>(v));
            break;
        case value_type::STRING: {
            auto const& s = cast<string>(v);
            packer.pack_str(boost::numeric_cast<uint32_t>(s.length()));
            packer.pack_str_body(
                s.c_str(), boost::numeric_cast<uint32_t>(s.length()));
            break;
        }
        case value_type::DATETIME: {
            // A cleared datetime has no position in time.
            if (cast<ptime>(v).is_not_a_date_time())
            {
                packer.pack_nil();
                break;
            }
            int64_t t = (cast<ptime>(v)
                         - ptime(boost::gregorian::date(1970, 1, 1)))
                            .total_milliseconds();
            // Use the smallest possible int type to store the datetime.
            if (t >= -0x80 && t < 0x80)
            {
                int8_t x = int8_t(t);
                packer.pack_ext(1, msgpack_datetime_ext_type);
                packer.pack_ext_body(reinterpret_cast<char const*>(&x), 1);
            }
            else if (t >= -0x80'00 && t < 0x80'00)
            {
                int16_t x = int16_t(t);
                boost::endian::native_to_big_inplace(x);
                packer.pack_ext(2, msgpack_datetime_ext_type);
                packer.pack_ext_body(reinterpret_cast<char const*>(&x), 2);
            }
            else if (
                t >= -int64_t(0x80'00'00'00) && t < int64_t(0x80'00'00'00))
            {
                int32_t x = int32_t(t);
                boost::endian::native_to_big_inplace(x);
                packer.pack_ext(4, msgpack_datetime_ext_type);
                packer.pack_ext_body(reinterpret_cast<char const*>(&x), 4);
            }
            else
            {
                int64_t x = t;
                boost::endian::native_to_big_inplace(x);
                packer.pack_ext(8, msgpack_datetime_ext_type);
                packer.pack_ext_body(reinterpret_cast<char const*>(&x), 8);
            }
            break;
        }
        case value_type::ARRAY: {
            dynamic_array const& x = cast<dynamic_array>(v);
            size_t size = x.size();
            packer.pack_array(boost::numeric_cast<uint32_t>(size));
            for (size_t i = 0; i != size; ++i)
                write_msgpack_value(packer, x[i]);
            break;
        }
        case value_type::MAP: {
            dynamic_map const& x = cast<dynamic_map>(v);
            packer.pack_map(boost::numeric_cast<uint32_t>(x.size()));
            for (auto const& i : x)
            {
                write_msgpack_value(packer, i.first);
                write_msgpack_value(packer, i.second);
            }
            break;
        }
    }
}

} // namespace docpatch

#endif
