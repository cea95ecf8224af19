//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_DECODE_ROW_HPP
#define MYSQLROW_DECODE_ROW_HPP

#include <mysqlrow/diagnostics.hpp>
#include <mysqlrow/error_code.hpp>
#include <mysqlrow/protocol_field_type.hpp>
#include <mysqlrow/raw_row.hpp>
#include <mysqlrow/resultset_encoding.hpp>
#include <mysqlrow/row_decode_params.hpp>

#include <mysqlrow/detail/config.hpp>

#include <boost/asio/buffer.hpp>

#include <vector>

namespace mysqlrow {

/**
 * \brief Decodes a row sent using the text protocol.
 * \details
 * `payload` should contain a row message, without the 4-byte frame header.
 * `types` should contain the protocol type of each column in the resultset, in order.
 * The entire payload is copied into `output`, and each column is assigned the range
 * containing its length-encoded value. A `0xfb` length prefix denotes a NULL value.
 * \n
 * On success, `output` is replaced by the decoded row and `diag` is cleared.
 * On failure, `output` is not modified and `diag` describes the column that failed.
 *
 * \par Errors
 * \li \ref client_errc::incomplete_message if a value extends past the end of `payload`.
 * \li \ref client_errc::protocol_value_error if a length prefix is invalid.
 * \li \ref client_errc::extra_bytes if `params.reject_extra_bytes` is set and there are bytes
 *     after the last column.
 */
MYSQLROW_DECL
error_code decode_text_row(
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    raw_row& output,
    diagnostics& diag,
    const row_decode_params& params = {}
);

/// \copydoc decode_text_row
/// \throws error_with_diagnostics on error.
MYSQLROW_DECL
raw_row decode_text_row(
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    const row_decode_params& params = {}
);

/**
 * \brief Decodes a row sent using the binary protocol.
 * \details
 * `payload` should contain a row message, without the 4-byte frame header.
 * `types` should contain the protocol type of each column in the resultset, in order.
 * The header byte and the NULL bitmap are validated and skipped. The rest of the message
 * is copied into `output`, and each non-NULL column is assigned a range whose size
 * depends on its type.
 * \n
 * On success, `output` is replaced by the decoded row and `diag` is cleared.
 * On failure, `output` is not modified and `diag` describes the column that failed.
 *
 * \par Errors
 * \li \ref client_errc::protocol_value_error if the header byte is not `0x00`, or a length
 *     prefix is invalid.
 * \li \ref client_errc::incomplete_message if the header, the NULL bitmap or a value extends
 *     past the end of `payload`.
 * \li \ref client_errc::unsupported_column_type if a non-NULL column has a type whose binary
 *     size is unknown.
 * \li \ref client_errc::extra_bytes if `params.reject_extra_bytes` is set and there are bytes
 *     after the last column.
 */
MYSQLROW_DECL
error_code decode_binary_row(
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    raw_row& output,
    diagnostics& diag,
    const row_decode_params& params = {}
);

/// \copydoc decode_binary_row
/// \throws error_with_diagnostics on error.
MYSQLROW_DECL
raw_row decode_binary_row(
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    const row_decode_params& params = {}
);

/**
 * \brief Decodes a row, using the text or binary protocol as specified by `encoding`.
 * \details Equivalent to calling \ref decode_text_row or \ref decode_binary_row.
 */
MYSQLROW_DECL
error_code decode_row(
    resultset_encoding encoding,
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    raw_row& output,
    diagnostics& diag,
    const row_decode_params& params = {}
);

/// \copydoc decode_row
/// \throws error_with_diagnostics on error.
MYSQLROW_DECL
raw_row decode_row(
    resultset_encoding encoding,
    boost::asio::const_buffer payload,
    const std::vector<protocol_field_type>& types,
    const row_decode_params& params = {}
);

}  // namespace mysqlrow

#ifdef MYSQLROW_HEADER_ONLY
#include <mysqlrow/impl/decode_row.ipp>
#endif

#endif
