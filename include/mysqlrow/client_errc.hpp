//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_CLIENT_ERRC_HPP
#define MYSQLROW_CLIENT_ERRC_HPP

#include <mysqlrow/error_code.hpp>

#include <mysqlrow/detail/config.hpp>

#include <boost/system/error_code.hpp>

#include <iosfwd>

namespace mysqlrow {

/**
 * \brief Error codes produced while decoding rows.
 * \details All of them indicate a malformed or unexpected message. None of them
 * can be recovered by decoding the same bytes again.
 */
enum class client_errc : int
{
    /**
     * \brief An incomplete message was received from the server. A length prefix, the null
     * bitmap or a column value extends past the end of the payload.
     */
    incomplete_message = 1,

    /**
     * \brief An unexpected value was found in a server-received message (e.g. a binary
     * row header other than 0x00).
     */
    protocol_value_error,

    /// Unexpected extra bytes at the end of a message were received.
    extra_bytes,

    /// A column has a protocol field type whose binary size is not known to this library.
    unsupported_column_type,
};

/// Returns the error category associated to \ref client_errc.
MYSQLROW_DECL
const boost::system::error_category& get_client_category() noexcept;

/// Creates an \ref error_code from a \ref client_errc.
inline error_code make_error_code(client_errc error)
{
    return error_code(static_cast<int>(error), get_client_category());
}

/// Streams a \ref client_errc, using its description.
MYSQLROW_DECL
std::ostream& operator<<(std::ostream& os, client_errc v);

}  // namespace mysqlrow

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::mysqlrow::client_errc>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

#ifdef MYSQLROW_HEADER_ONLY
#include <mysqlrow/impl/error_categories.ipp>
#endif

#endif
