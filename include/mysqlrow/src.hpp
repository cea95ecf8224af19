//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_SRC_HPP
#define MYSQLROW_SRC_HPP

// This file is meant to be included once, in the translation unit of
// the program, with MYSQLROW_HEADER_ONLY undefined

#include <mysqlrow/detail/config.hpp>

#ifdef MYSQLROW_HEADER_ONLY
#error Including <mysqlrow/src.hpp> is only required in separate compilation mode. \
    Either remove the MYSQLROW_HEADER_ONLY definition or don't include this file.
#endif

#include <mysqlrow/impl/decode_row.ipp>
#include <mysqlrow/impl/error_categories.ipp>
#include <mysqlrow/impl/protocol_field_type.ipp>

#endif
