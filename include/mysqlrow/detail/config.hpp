//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_DETAIL_CONFIG_HPP
#define MYSQLROW_DETAIL_CONFIG_HPP

#include <boost/config.hpp>

// clang-format off

// C++14 conformance
#if BOOST_CXX_VERSION >= 201402L
    #define MYSQLROW_CXX14
#endif

// Header-only or separate compilation. In separate compilation mode,
// exactly one translation unit must include <mysqlrow/src.hpp>
#ifdef MYSQLROW_HEADER_ONLY
    #define MYSQLROW_DECL inline
#else
    #define MYSQLROW_DECL
#endif

// clang-format on

#endif
