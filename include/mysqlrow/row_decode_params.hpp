//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_ROW_DECODE_PARAMS_HPP
#define MYSQLROW_ROW_DECODE_PARAMS_HPP

namespace mysqlrow {

/**
 * \brief Configuration parameters for the row decoding functions.
 * \details The default-constructed object is valid and matches the server behavior
 * observed in practice.
 */
struct row_decode_params
{
    /**
     * \brief Whether to fail with \ref client_errc::extra_bytes if bytes remain
     * after the last column.
     * \details When `false`, trailing bytes are kept in the row buffer but are not
     * part of any column.
     */
    bool reject_extra_bytes{false};
};

}  // namespace mysqlrow

#endif
