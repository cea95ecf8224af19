//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_IMPL_DECODE_ROW_IPP
#define MYSQLROW_IMPL_DECODE_ROW_IPP

#pragma once

#include <mysqlrow/client_errc.hpp>
#include <mysqlrow/decode_row.hpp>
#include <mysqlrow/diagnostics.hpp>
#include <mysqlrow/error_code.hpp>
#include <mysqlrow/protocol_field_type.hpp>
#include <mysqlrow/raw_row.hpp>
#include <mysqlrow/throw_on_error.hpp>

#include <mysqlrow/detail/binary_field_size.hpp>
#include <mysqlrow/detail/deserialization_context.hpp>
#include <mysqlrow/detail/lenenc.hpp>
#include <mysqlrow/detail/null_bitmap.hpp>

#include <boost/optional/optional.hpp>

#include <cstddef>
#include <cstdint>
#include <ios>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace mysqlrow {
namespace detail {

using range_vector = std::vector<boost::optional<value_range>>;

inline error_code set_diagnostics(error_code ec, const std::string& what, diagnostics& diag)
{
    diagnostics_access::assign_client(diag, what + ": " + ec.message());
    return ec;
}

inline error_code column_error(
    deserialize_errc err,
    std::size_t column,
    protocol_field_type type,
    diagnostics& diag
)
{
    std::ostringstream oss;
    oss << "Decoding column " << column << " (" << type << ')';
    return set_diagnostics(to_error_code(err), oss.str(), diag);
}

inline error_code check_extra_bytes(
    const deserialization_context& ctx,
    const row_decode_params& params,
    diagnostics& diag
)
{
    if (params.reject_extra_bytes && !ctx.empty())
    {
        return set_diagnostics(
            client_errc::extra_bytes,
            std::to_string(ctx.size()) + " bytes found after the last column",
            diag
        );
    }
    return error_code();
}

// Records the value of size bytes at the current position, advancing ctx
inline deserialize_errc record_value(
    deserialization_context& ctx,
    const std::uint8_t* buffer_first,
    std::size_t size,
    range_vector& values
)
{
    if (!ctx.enough_size(size))
        return deserialize_errc::incomplete_message;
    const auto start = static_cast<std::size_t>(ctx.first() - buffer_first);
    values.push_back(value_range{start, start + size});
    ctx.advance(size);
    return deserialize_errc::ok;
}

inline void finish_row(
    const std::uint8_t* buffer_first,
    const deserialization_context& ctx,
    range_vector&& values,
    raw_row& output,
    diagnostics& diag
)
{
    raw_row_access::assign(output, std::vector<std::uint8_t>(buffer_first, ctx.last()), std::move(values));
    diag.clear();
}

}  // namespace detail
}  // namespace mysqlrow

mysqlrow::error_code mysqlrow::decode_text_row(
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    raw_row& output,
    diagnostics& diag,
    const row_decode_params& params
)
{
    detail::deserialization_context ctx(payload);
    const std::uint8_t* buffer_first = ctx.first();
    detail::range_vector values;
    values.reserve(types.size());

    for (std::size_t i = 0; i < types.size(); ++i)
    {
        // A 0xfb prefix in place of a length-encoded string means NULL
        if (!ctx.empty() && ctx.peek() == detail::lenenc_null)
        {
            values.push_back(boost::none);
            ctx.advance(1);
            continue;
        }

        std::size_t size = 0;
        auto err = detail::lenenc_total_size(ctx, size);
        if (err == detail::deserialize_errc::ok)
            err = detail::record_value(ctx, buffer_first, size, values);
        if (err != detail::deserialize_errc::ok)
            return detail::column_error(err, i, types[i], diag);
    }

    auto ec = detail::check_extra_bytes(ctx, params, diag);
    if (ec)
        return ec;

    detail::finish_row(buffer_first, ctx, std::move(values), output, diag);
    return error_code();
}

mysqlrow::error_code mysqlrow::decode_binary_row(
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    raw_row& output,
    diagnostics& diag,
    const row_decode_params& params
)
{
    detail::deserialization_context ctx(payload);

    // Packet header. Always zero for rows: anything else is an OK/EOF or error packet
    // that the caller should have handled
    if (ctx.empty())
        return detail::set_diagnostics(client_errc::incomplete_message, "Reading the binary row header", diag);
    const std::uint8_t header = ctx.peek();
    if (header != 0)
    {
        std::ostringstream oss;
        oss << "Binary row header: expected 0x00, got 0x" << std::hex << static_cast<unsigned>(header);
        return detail::set_diagnostics(client_errc::protocol_value_error, oss.str(), diag);
    }
    ctx.advance(1);

    // Null bitmap
    const detail::null_bitmap_parser null_bitmap(types.size());
    if (!ctx.enough_size(null_bitmap.byte_count()))
    {
        return detail::set_diagnostics(
            client_errc::incomplete_message,
            "Reading the NULL bitmap (" + std::to_string(null_bitmap.byte_count()) + " bytes)",
            diag
        );
    }
    const std::uint8_t* null_bitmap_first = ctx.first();
    ctx.advance(null_bitmap.byte_count());

    // Actual values. Offsets are relative to the first byte after the bitmap
    const std::uint8_t* buffer_first = ctx.first();
    detail::range_vector values;
    values.reserve(types.size());

    for (std::size_t i = 0; i < types.size(); ++i)
    {
        if (null_bitmap.is_null(null_bitmap_first, i))
        {
            values.push_back(boost::none);
            continue;
        }

        std::size_t size = 0;
        auto err = detail::binary_field_size(types[i], ctx, size);
        if (err == detail::deserialize_errc::ok)
            err = detail::record_value(ctx, buffer_first, size, values);
        if (err != detail::deserialize_errc::ok)
            return detail::column_error(err, i, types[i], diag);
    }

    auto ec = detail::check_extra_bytes(ctx, params, diag);
    if (ec)
        return ec;

    detail::finish_row(buffer_first, ctx, std::move(values), output, diag);
    return error_code();
}

mysqlrow::error_code mysqlrow::decode_row(
    resultset_encoding encoding,
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    raw_row& output,
    diagnostics& diag,
    const row_decode_params& params
)
{
    return encoding == resultset_encoding::text ? decode_text_row(payload, types, output, diag, params)
                                                : decode_binary_row(payload, types, output, diag, params);
}

mysqlrow::raw_row mysqlrow::decode_text_row(
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    const row_decode_params& params
)
{
    raw_row res;
    diagnostics diag;
    auto ec = decode_text_row(payload, types, res, diag, params);
    throw_on_error(ec, diag);
    return res;
}

mysqlrow::raw_row mysqlrow::decode_binary_row(
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    const row_decode_params& params
)
{
    raw_row res;
    diagnostics diag;
    auto ec = decode_binary_row(payload, types, res, diag, params);
    throw_on_error(ec, diag);
    return res;
}

mysqlrow::raw_row mysqlrow::decode_row(
    resultset_encoding encoding,
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    const row_decode_params& params
)
{
    raw_row res;
    diagnostics diag;
    auto ec = decode_row(encoding, payload, types, res, diag, params);
    throw_on_error(ec, diag);
    return res;
}

#endif
