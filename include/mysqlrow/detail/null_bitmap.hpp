//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_DETAIL_NULL_BITMAP_HPP
#define MYSQLROW_DETAIL_NULL_BITMAP_HPP

#include <boost/assert.hpp>

#include <cstddef>
#include <cstdint>

namespace mysqlrow {
namespace detail {

// When parsing binary rows, we need to add this offset to
// field positions to get the actual field index to use -
// the first two positions are reserved
constexpr std::size_t binary_row_null_bitmap_offset = 2;

// Helper to parse the null bitmap contained in binary rows
class null_bitmap_parser
{
    std::size_t num_fields_;

public:
    constexpr null_bitmap_parser(std::size_t num_fields) noexcept : num_fields_{num_fields} {}
    constexpr std::size_t num_fields() const noexcept { return num_fields_; }
    constexpr std::size_t byte_count() const noexcept
    {
        return (num_fields_ + 7 + binary_row_null_bitmap_offset) / 8;
    }

    // first must point to at least byte_count() bytes
    bool is_null(const std::uint8_t* first, std::size_t field_pos) const noexcept
    {
        BOOST_ASSERT(field_pos < num_fields_);

        std::size_t byte_pos = (field_pos + binary_row_null_bitmap_offset) / 8;
        std::size_t bit_pos = (field_pos + binary_row_null_bitmap_offset) % 8;
        return first[byte_pos] & (1 << bit_pos);
    }
};

}  // namespace detail
}  // namespace mysqlrow

#endif
