//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_RESULTSET_ENCODING_HPP
#define MYSQLROW_RESULTSET_ENCODING_HPP

namespace mysqlrow {

/**
 * \brief The encoding used by the rows of a resultset.
 * \details Text queries (COM_QUERY) yield text rows. Executing a prepared
 * statement (COM_STMT_EXECUTE) yields binary rows.
 */
enum class resultset_encoding
{
    text,
    binary
};

}  // namespace mysqlrow

#endif
