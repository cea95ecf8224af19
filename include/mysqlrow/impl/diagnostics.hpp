//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_IMPL_DIAGNOSTICS_HPP
#define MYSQLROW_IMPL_DIAGNOSTICS_HPP

#pragma once

#include <mysqlrow/diagnostics.hpp>

#include <string>
#include <utility>

struct mysqlrow::detail::diagnostics_access
{
    static void assign_client(diagnostics& obj, std::string from) { obj.msg_ = std::move(from); }
};

#endif
