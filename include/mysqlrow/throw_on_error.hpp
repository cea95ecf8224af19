//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_THROW_ON_ERROR_HPP
#define MYSQLROW_THROW_ON_ERROR_HPP

#include <mysqlrow/diagnostics.hpp>
#include <mysqlrow/error_code.hpp>
#include <mysqlrow/error_with_diagnostics.hpp>

#include <boost/throw_exception.hpp>

namespace mysqlrow {

/**
 * \brief Throws an exception in case of error, including diagnostic information.
 * \details If err indicates a failure (`err.failed() == true`), throws an exception
 * of type \ref error_with_diagnostics, built from `err` and `diag`.
 * Otherwise, does nothing.
 */
inline void throw_on_error(error_code err, const diagnostics& diag = {})
{
    if (err)
    {
        ::boost::throw_exception(error_with_diagnostics(err, diag));
    }
}

}  // namespace mysqlrow

#endif
