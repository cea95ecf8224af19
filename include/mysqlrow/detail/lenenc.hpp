//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_DETAIL_LENENC_HPP
#define MYSQLROW_DETAIL_LENENC_HPP

#include <mysqlrow/detail/deserialization_context.hpp>

#include <boost/endian/conversion.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>

namespace mysqlrow {
namespace detail {

// First bytes with a special meaning in length-encoded integers.
// Anything below lenenc_null is the length itself.
constexpr std::uint8_t lenenc_null = 0xfb;
constexpr std::uint8_t lenenc_int2 = 0xfc;
constexpr std::uint8_t lenenc_int3 = 0xfd;
constexpr std::uint8_t lenenc_int8 = 0xfe;

// Computes the number of bytes taken by the length-encoded field (integer prefix plus
// the payload it announces) starting at ctx.first(). Doesn't advance ctx and doesn't
// check that the payload is there: callers do that before using the size.
inline deserialize_errc lenenc_total_size(const deserialization_context& ctx, std::size_t& output)
{
    if (ctx.empty())
        return deserialize_errc::incomplete_message;

    const std::uint8_t first_byte = ctx.peek();
    const std::uint8_t* len_first = ctx.first() + 1;

    if (first_byte < lenenc_null)
    {
        output = 1u + first_byte;
    }
    else if (first_byte == lenenc_null)
    {
        output = 1u;
    }
    else if (first_byte == lenenc_int2)
    {
        if (!ctx.enough_size(3))
            return deserialize_errc::incomplete_message;
        output = 3u + boost::endian::load_little_u16(len_first);
    }
    else if (first_byte == lenenc_int3)
    {
        if (!ctx.enough_size(4))
            return deserialize_errc::incomplete_message;
        output = 4u + static_cast<std::size_t>(boost::endian::load_little_u24(len_first));
    }
    else if (first_byte == lenenc_int8)
    {
        if (!ctx.enough_size(9))
            return deserialize_errc::incomplete_message;
        std::uint64_t len = boost::endian::load_little_u64(len_first);
        if (len > (std::numeric_limits<std::size_t>::max)() - 9u)
            return deserialize_errc::protocol_value_error;
        output = 9u + static_cast<std::size_t>(len);
    }
    else
    {
        // 0xff is used by error packets and never starts a length-encoded integer
        return deserialize_errc::protocol_value_error;
    }
    return deserialize_errc::ok;
}

}  // namespace detail
}  // namespace mysqlrow

#endif
