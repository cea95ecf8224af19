//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLROW_DIAGNOSTICS_HPP
#define MYSQLROW_DIAGNOSTICS_HPP

#include <boost/utility/string_view.hpp>

#include <string>

namespace mysqlrow {

namespace detail {
struct diagnostics_access;
}

/**
 * \brief Contains additional information about errors.
 * \details
 * Decoding functions fill this object with a message describing which column failed
 * and why. The message is generated by this library, never by the server, so it
 * is safe to log. It is empty when no additional information is available.
 */
class diagnostics
{
public:
    /// Constructs a diagnostics object with an empty message.
    diagnostics() = default;

    /**
     * \brief Gets the error message generated by the library.
     * \details The returned view is valid as long as `*this` is alive and hasn't been
     * assigned to or cleared.
     */
    boost::string_view client_message() const noexcept { return msg_; }

    /// Clears the message.
    void clear() noexcept { msg_.clear(); }

private:
    std::string msg_;

    friend bool operator==(const diagnostics& lhs, const diagnostics& rhs) noexcept;
    friend struct detail::diagnostics_access;
};

/// Compares two diagnostics objects.
inline bool operator==(const diagnostics& lhs, const diagnostics& rhs) noexcept { return lhs.msg_ == rhs.msg_; }

/// Compares two diagnostics objects.
inline bool operator!=(const diagnostics& lhs, const diagnostics& rhs) noexcept { return !(lhs == rhs); }

}  // namespace mysqlrow

#include <mysqlrow/impl/diagnostics.hpp>

#endif
