//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_RAW_ROW_HPP
#define MYSQLROW_RAW_ROW_HPP

#include <boost/asio/buffer.hpp>
#include <boost/optional/optional.hpp>
#include <boost/utility/string_view.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace mysqlrow {

namespace detail {
struct raw_row_access;
}

/**
 * \brief A half-open range of byte positions `[start, end)` within a \ref raw_row buffer.
 * \details Ranges don't own anything. They are only meaningful together with the row they
 * were obtained from.
 */
struct value_range
{
    /// Position of the first byte.
    std::size_t start;

    /// One past the position of the last byte.
    std::size_t end;

    /// The number of bytes in the range.
    std::size_t size() const noexcept { return end - start; }
};

/// Compares two ranges for equality.
inline bool operator==(const value_range& lhs, const value_range& rhs) noexcept
{
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

/// Compares two ranges for inequality.
inline bool operator!=(const value_range& lhs, const value_range& rhs) noexcept { return !(lhs == rhs); }

/**
 * \brief An owning, immutable row with the undecoded bytes of each column.
 * \details
 * Objects of this type are created by \ref decode_row and its text and binary
 * counterparts. A raw_row holds a single buffer with the bytes it was decoded from,
 * and one range per column pointing into it. Accessing a column yields a view
 * into that buffer and never allocates.
 * \n
 * A column value contains the bytes exactly as sent by the server:
 * \li For length-encoded values (all text protocol values, and strings and blobs in the binary
 *     protocol), the range includes the length prefix.
 * \li For binary DATETIME, TIMESTAMP and TIME values, the range includes the length byte.
 * \li For other binary values, the range contains the fixed-size value.
 * \n
 * SQL NULL values have no range. They're returned as an empty `boost::optional`, which
 * is different from a present, zero-length value.
 * \n
 * Views returned by this class are valid as long as the row is alive and hasn't been
 * assigned to. Moving a raw_row doesn't invalidate views.
 */
class raw_row
{
public:
    /// Constructs an empty row, with zero columns.
    raw_row() = default;

    /// Returns the number of columns in the row.
    std::size_t size() const noexcept { return values_.size(); }

    /// Returns true if the row has zero columns.
    bool empty() const noexcept { return values_.empty(); }

    /**
     * \brief Returns the bytes of the i-th column, or an empty optional if the column is NULL.
     * \throws std::out_of_range If `i >= this->size()`.
     */
    boost::optional<boost::string_view> at(std::size_t i) const { return to_view(values_.at(i)); }

    /**
     * \brief Unchecked access to the i-th column.
     * \details Preconditions: `i < this->size()`.
     */
    boost::optional<boost::string_view> operator[](std::size_t i) const noexcept { return to_view(values_[i]); }

    /**
     * \brief Returns whether the i-th column is SQL NULL.
     * \throws std::out_of_range If `i >= this->size()`.
     */
    bool is_null(std::size_t i) const { return !values_.at(i).has_value(); }

    /**
     * \brief Returns the position of the i-th column within \ref buffer, or an empty optional if NULL.
     * \throws std::out_of_range If `i >= this->size()`.
     */
    const boost::optional<value_range>& range(std::size_t i) const { return values_.at(i); }

    /**
     * \brief Returns the bytes owned by this row.
     * \details For binary rows, this excludes the packet header and the NULL bitmap.
     * For text rows, this is the entire message.
     */
    boost::asio::const_buffer buffer() const noexcept
    {
        return boost::asio::const_buffer(buffer_.data(), buffer_.size());
    }

private:
    std::vector<std::uint8_t> buffer_;
    std::vector<boost::optional<value_range>> values_;

    boost::optional<boost::string_view> to_view(const boost::optional<value_range>& r) const noexcept
    {
        if (!r)
            return boost::none;
        return boost::string_view(reinterpret_cast<const char*>(buffer_.data()) + r->start, r->size());
    }

    friend struct detail::raw_row_access;
    friend bool operator==(const raw_row& lhs, const raw_row& rhs) noexcept;
};

/**
 * \brief Compares two rows for equality.
 * \details Rows are equal if their buffers contain the same bytes and their columns have
 * the same ranges and null-ness.
 */
inline bool operator==(const raw_row& lhs, const raw_row& rhs) noexcept
{
    return lhs.buffer_ == rhs.buffer_ && lhs.values_ == rhs.values_;
}

/// Compares two rows for inequality.
inline bool operator!=(const raw_row& lhs, const raw_row& rhs) noexcept { return !(lhs == rhs); }

namespace detail {

struct raw_row_access
{
    static void assign(
        raw_row& to,
        std::vector<std::uint8_t>&& buffer,
        std::vector<boost::optional<value_range>>&& values
    ) noexcept
    {
        to.buffer_ = std::move(buffer);
        to.values_ = std::move(values);
    }
};

}  // namespace detail
}  // namespace mysqlrow

#endif
