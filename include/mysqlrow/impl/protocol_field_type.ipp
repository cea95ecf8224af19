//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_IMPL_PROTOCOL_FIELD_TYPE_IPP
#define MYSQLROW_IMPL_PROTOCOL_FIELD_TYPE_IPP

#pragma once

#include <mysqlrow/protocol_field_type.hpp>

#include <ostream>

const char* mysqlrow::to_string(protocol_field_type t) noexcept
{
    switch (t)
    {
    case protocol_field_type::decimal: return "protocol_field_type::decimal";
    case protocol_field_type::tiny: return "protocol_field_type::tiny";
    case protocol_field_type::short_: return "protocol_field_type::short_";
    case protocol_field_type::long_: return "protocol_field_type::long_";
    case protocol_field_type::float_: return "protocol_field_type::float_";
    case protocol_field_type::double_: return "protocol_field_type::double_";
    case protocol_field_type::null: return "protocol_field_type::null";
    case protocol_field_type::timestamp: return "protocol_field_type::timestamp";
    case protocol_field_type::longlong: return "protocol_field_type::longlong";
    case protocol_field_type::int24: return "protocol_field_type::int24";
    case protocol_field_type::date: return "protocol_field_type::date";
    case protocol_field_type::time: return "protocol_field_type::time";
    case protocol_field_type::datetime: return "protocol_field_type::datetime";
    case protocol_field_type::year: return "protocol_field_type::year";
    case protocol_field_type::varchar: return "protocol_field_type::varchar";
    case protocol_field_type::bit: return "protocol_field_type::bit";
    case protocol_field_type::json: return "protocol_field_type::json";
    case protocol_field_type::newdecimal: return "protocol_field_type::newdecimal";
    case protocol_field_type::enum_: return "protocol_field_type::enum_";
    case protocol_field_type::set: return "protocol_field_type::set";
    case protocol_field_type::tiny_blob: return "protocol_field_type::tiny_blob";
    case protocol_field_type::medium_blob: return "protocol_field_type::medium_blob";
    case protocol_field_type::long_blob: return "protocol_field_type::long_blob";
    case protocol_field_type::blob: return "protocol_field_type::blob";
    case protocol_field_type::var_string: return "protocol_field_type::var_string";
    case protocol_field_type::string: return "protocol_field_type::string";
    case protocol_field_type::geometry: return "protocol_field_type::geometry";
    default: return "<unknown protocol_field_type>";
    }
}

std::ostream& mysqlrow::operator<<(std::ostream& os, protocol_field_type t) { return os << to_string(t); }

#endif
