//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_DETAIL_DESERIALIZATION_CONTEXT_HPP
#define MYSQLROW_DETAIL_DESERIALIZATION_CONTEXT_HPP

#include <mysqlrow/client_errc.hpp>
#include <mysqlrow/error_code.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/assert.hpp>

#include <cstddef>
#include <cstdint>

namespace mysqlrow {
namespace detail {

// We operate with this enum directly in the deserialization routines for efficiency, then transform it to an
// actual error code
enum class deserialize_errc
{
    ok = 0,
    incomplete_message = 1,
    protocol_value_error,
    unsupported_column_type,
};

inline error_code to_error_code(deserialize_errc v)
{
    switch (v)
    {
    case deserialize_errc::ok: return error_code();
    case deserialize_errc::incomplete_message: return error_code(client_errc::incomplete_message);
    case deserialize_errc::protocol_value_error: return error_code(client_errc::protocol_value_error);
    case deserialize_errc::unsupported_column_type: return error_code(client_errc::unsupported_column_type);
    default: BOOST_ASSERT(false); return error_code();  // LCOV_EXCL_LINE
    }
}

// A cursor over a buffer we don't own. Callers must check enough_size()
// before reading or advancing
class deserialization_context
{
    const std::uint8_t* first_;
    const std::uint8_t* last_;

public:
    deserialization_context(const std::uint8_t* first, const std::uint8_t* last) noexcept
        : first_(first), last_(last)
    {
        BOOST_ASSERT(last_ >= first_);
    }
    explicit deserialization_context(boost::asio::const_buffer data) noexcept
        : first_(static_cast<const std::uint8_t*>(data.data())), last_(first_ + data.size())
    {
    }
    const std::uint8_t* first() const noexcept { return first_; }
    const std::uint8_t* last() const noexcept { return last_; }
    std::size_t size() const noexcept { return static_cast<std::size_t>(last_ - first_); }
    bool empty() const noexcept { return first_ == last_; }
    void advance(std::size_t sz) noexcept
    {
        BOOST_ASSERT(enough_size(sz));
        first_ += sz;
    }
    bool enough_size(std::size_t required_size) const noexcept { return size() >= required_size; }

    // The byte at the current position plus offset. Requires enough_size(offset + 1)
    std::uint8_t peek(std::size_t offset = 0) const noexcept
    {
        BOOST_ASSERT(offset < size());
        return first_[offset];
    }
};

}  // namespace detail
}  // namespace mysqlrow

#endif
