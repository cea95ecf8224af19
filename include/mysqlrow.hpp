//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_HPP
#define MYSQLROW_HPP

#include <mysqlrow/client_errc.hpp>
#include <mysqlrow/decode_row.hpp>
#include <mysqlrow/diagnostics.hpp>
#include <mysqlrow/error_code.hpp>
#include <mysqlrow/error_with_diagnostics.hpp>
#include <mysqlrow/protocol_field_type.hpp>
#include <mysqlrow/raw_row.hpp>
#include <mysqlrow/resultset_encoding.hpp>
#include <mysqlrow/row_decode_params.hpp>
#include <mysqlrow/throw_on_error.hpp>

#endif
