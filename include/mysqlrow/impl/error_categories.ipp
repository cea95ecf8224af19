//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_IMPL_ERROR_CATEGORIES_IPP
#define MYSQLROW_IMPL_ERROR_CATEGORIES_IPP

#pragma once

#include <mysqlrow/client_errc.hpp>

#include <ostream>
#include <string>

namespace mysqlrow {
namespace detail {

inline const char* error_to_string(client_errc error) noexcept
{
    switch (error)
    {
    case client_errc::incomplete_message: return "An incomplete message was received from the server";
    case client_errc::protocol_value_error:
        return "An unexpected value was found in a server-received message";
    case client_errc::extra_bytes: return "Unexpected extra bytes at the end of a message were received";
    case client_errc::unsupported_column_type:
        return "A column has a protocol field type that can't be decoded in the binary protocol";
    default: return "<unknown mysqlrow client error>";
    }
}

class client_category_t final : public boost::system::error_category
{
public:
    const char* name() const noexcept override { return "mysqlrow.client"; }
    std::string message(int ev) const override { return error_to_string(static_cast<client_errc>(ev)); }
};

}  // namespace detail
}  // namespace mysqlrow

const boost::system::error_category& mysqlrow::get_client_category() noexcept
{
    static detail::client_category_t res;
    return res;
}

std::ostream& mysqlrow::operator<<(std::ostream& os, client_errc v)
{
    return os << detail::error_to_string(v);
}

#endif
