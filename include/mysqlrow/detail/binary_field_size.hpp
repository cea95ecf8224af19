//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_DETAIL_BINARY_FIELD_SIZE_HPP
#define MYSQLROW_DETAIL_BINARY_FIELD_SIZE_HPP

#include <mysqlrow/protocol_field_type.hpp>

#include <mysqlrow/detail/deserialization_context.hpp>
#include <mysqlrow/detail/lenenc.hpp>

#include <cstddef>

namespace mysqlrow {
namespace detail {

// Sizes of the fixed-size values in the binary protocol
namespace binc {

constexpr std::size_t int1_sz = 1;
constexpr std::size_t int2_sz = 2;
constexpr std::size_t int4_sz = 4;
constexpr std::size_t int8_sz = 8;
constexpr std::size_t float_sz = 4;
constexpr std::size_t double_sz = 8;

// DATE is always sent as a length byte (4) followed by year (2), month (1) and day (1)
constexpr std::size_t date_sz = 5;

}  // namespace binc

// How the size of a binary value is determined
enum class binary_size_kind
{
    fixed,         // a constant number of bytes
    length_byte,   // one byte holding the number of bytes that follow (temporal types)
    lenenc,        // a length-encoded string
    unsupported
};

struct binary_size_rule
{
    binary_size_kind kind;
    std::size_t fixed_size;  // only meaningful for binary_size_kind::fixed
};

inline binary_size_rule get_binary_size_rule(protocol_field_type type) noexcept
{
    switch (type)
    {
    case protocol_field_type::tiny: return {binary_size_kind::fixed, binc::int1_sz};
    case protocol_field_type::short_:
    case protocol_field_type::year: return {binary_size_kind::fixed, binc::int2_sz};
    case protocol_field_type::int24:
    case protocol_field_type::long_: return {binary_size_kind::fixed, binc::int4_sz};
    case protocol_field_type::longlong: return {binary_size_kind::fixed, binc::int8_sz};
    case protocol_field_type::float_: return {binary_size_kind::fixed, binc::float_sz};
    case protocol_field_type::double_: return {binary_size_kind::fixed, binc::double_sz};
    case protocol_field_type::date: return {binary_size_kind::fixed, binc::date_sz};
    case protocol_field_type::time:
    case protocol_field_type::timestamp:
    case protocol_field_type::datetime: return {binary_size_kind::length_byte, 0};
    case protocol_field_type::decimal:
    case protocol_field_type::newdecimal:
    case protocol_field_type::varchar:
    case protocol_field_type::bit:
    case protocol_field_type::json:
    case protocol_field_type::enum_:
    case protocol_field_type::set:
    case protocol_field_type::tiny_blob:
    case protocol_field_type::medium_blob:
    case protocol_field_type::long_blob:
    case protocol_field_type::blob:
    case protocol_field_type::var_string:
    case protocol_field_type::string:
    case protocol_field_type::geometry: return {binary_size_kind::lenenc, 0};
    default: return {binary_size_kind::unsupported, 0};
    }
}

// Computes the number of bytes taken by a binary value of the given type,
// starting at ctx.first(). Doesn't advance ctx. The returned size may exceed ctx.size().
inline deserialize_errc binary_field_size(
    protocol_field_type type,
    const deserialization_context& ctx,
    std::size_t& output
)
{
    const binary_size_rule rule = get_binary_size_rule(type);
    switch (rule.kind)
    {
    case binary_size_kind::fixed: output = rule.fixed_size; return deserialize_errc::ok;
    case binary_size_kind::length_byte:
        if (ctx.empty())
            return deserialize_errc::incomplete_message;
        output = 1u + ctx.peek();
        return deserialize_errc::ok;
    case binary_size_kind::lenenc: return lenenc_total_size(ctx, output);
    default: return deserialize_errc::unsupported_column_type;
    }
}

}  // namespace detail
}  // namespace mysqlrow

#endif
