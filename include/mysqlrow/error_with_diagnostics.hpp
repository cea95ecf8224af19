//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_ERROR_WITH_DIAGNOSTICS_HPP
#define MYSQLROW_ERROR_WITH_DIAGNOSTICS_HPP

#include <mysqlrow/diagnostics.hpp>
#include <mysqlrow/error_code.hpp>

#include <boost/system/system_error.hpp>

#include <string>

namespace mysqlrow {

/**
 * \brief A system_error with an embedded diagnostics object.
 * \details Thrown by the throwing overloads of the row decoding functions.
 */
class error_with_diagnostics : public boost::system::system_error
{
    diagnostics diag_;

    static boost::system::system_error create_base(const error_code& err, const diagnostics& diag)
    {
        return diag.client_message().empty() ? boost::system::system_error(err)
                                             : boost::system::system_error(err, diag.client_message().to_string());
    }

public:
    /// Initializing constructor.
    error_with_diagnostics(const error_code& err, const diagnostics& diag)
        : boost::system::system_error(create_base(err, diag)), diag_(diag)
    {
    }

    /**
     * \brief Retrieves the diagnostics associated with this error.
     * \details The returned reference is valid as long as `*this` is alive.
     */
    const diagnostics& get_diagnostics() const noexcept { return diag_; }
};

}  // namespace mysqlrow

#endif
