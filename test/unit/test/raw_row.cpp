//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlrow/raw_row.hpp>

#include <boost/optional/optional.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/utility/string_view.hpp>

#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include "test_common/assert_buffer_equals.hpp"
#include "test_common/printing.hpp"

using namespace mysqlrow;

namespace {

BOOST_AUTO_TEST_SUITE(test_raw_row)

// Three columns: "abc" (with its length prefix), NULL, and a zero-length value
raw_row create_row()
{
    raw_row res;
    detail::raw_row_access::assign(
        res,
        {0x03, 0x61, 0x62, 0x63, 0x00},
        {value_range{0, 4}, boost::none, value_range{4, 4}}
    );
    return res;
}

BOOST_AUTO_TEST_CASE(default_ctor)
{
    raw_row r;
    BOOST_TEST(r.size() == 0u);
    BOOST_TEST(r.empty());
    BOOST_TEST(r.buffer().size() == 0u);
    BOOST_CHECK_THROW(r.at(0), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(accessors)
{
    auto r = create_row();

    BOOST_TEST(r.size() == 3u);
    BOOST_TEST(!r.empty());

    // Present value
    BOOST_TEST_REQUIRE(r.at(0).has_value());
    BOOST_TEST(*r.at(0) == "\x03" "abc");
    BOOST_TEST(*r[0] == "\x03" "abc");
    BOOST_TEST(!r.is_null(0));
    BOOST_TEST((r.range(0) == value_range{0, 4}));

    // NULL
    BOOST_TEST(!r.at(1).has_value());
    BOOST_TEST(!r[1].has_value());
    BOOST_TEST(r.is_null(1));
    BOOST_TEST(r.range(1) == boost::optional<value_range>());

    // Zero-length values are not NULL
    BOOST_TEST_REQUIRE(r.at(2).has_value());
    BOOST_TEST(r.at(2)->empty());
    BOOST_TEST(!r.is_null(2));
    BOOST_TEST(r.range(2)->size() == 0u);

    MYSQLROW_ASSERT_BUFFER_EQUALS(r.buffer(), (std::vector<std::uint8_t>{0x03, 0x61, 0x62, 0x63, 0x00}));
}

BOOST_AUTO_TEST_CASE(out_of_range)
{
    auto r = create_row();
    BOOST_CHECK_THROW(r.at(3), std::out_of_range);
    BOOST_CHECK_THROW(r.is_null(3), std::out_of_range);
    BOOST_CHECK_THROW(r.range(10), std::out_of_range);
}

// Views point into the row's own buffer
BOOST_AUTO_TEST_CASE(views_point_into_buffer)
{
    auto r = create_row();
    const char* first = static_cast<const char*>(r.buffer().data());
    BOOST_TEST(static_cast<const void*>(r.at(0)->data()) == static_cast<const void*>(first));
    BOOST_TEST(static_cast<const void*>(r.at(2)->data()) == static_cast<const void*>(first + 4));
}

BOOST_AUTO_TEST_CASE(copy)
{
    auto r = create_row();
    raw_row r2(r);

    BOOST_TEST(r2 == r);
    BOOST_TEST(r2.buffer().data() != r.buffer().data());
    BOOST_TEST(*r2.at(0) == "\x03" "abc");
}

// Moving keeps views valid
BOOST_AUTO_TEST_CASE(move)
{
    auto r = create_row();
    auto view = *r.at(0);

    raw_row r2(std::move(r));

    BOOST_TEST(r2.size() == 3u);
    BOOST_TEST(static_cast<const void*>(r2.at(0)->data()) == static_cast<const void*>(view.data()));
    BOOST_TEST(view == "\x03" "abc");
}

BOOST_AUTO_TEST_CASE(operator_equals)
{
    auto r = create_row();

    // Same contents
    BOOST_TEST(r == create_row());
    BOOST_TEST(!(r != create_row()));

    // Empty rows
    BOOST_TEST(raw_row() == raw_row());
    BOOST_TEST(r != raw_row());

    // Different buffer
    raw_row other;
    detail::raw_row_access::assign(
        other,
        {0x03, 0x61, 0x62, 0x64, 0x00},
        {value_range{0, 4}, boost::none, value_range{4, 4}}
    );
    BOOST_TEST(r != other);

    // Different null-ness
    detail::raw_row_access::assign(
        other,
        {0x03, 0x61, 0x62, 0x63, 0x00},
        {value_range{0, 4}, value_range{4, 4}, value_range{4, 4}}
    );
    BOOST_TEST(r != other);

    // Different ranges
    detail::raw_row_access::assign(
        other,
        {0x03, 0x61, 0x62, 0x63, 0x00},
        {value_range{0, 4}, boost::none, value_range{4, 5}}
    );
    BOOST_TEST(r != other);
}

BOOST_AUTO_TEST_CASE(value_range_)
{
    value_range r{2, 7};
    BOOST_TEST(r.size() == 5u);
    BOOST_TEST((r == value_range{2, 7}));
    BOOST_TEST((r != value_range{2, 6}));
    BOOST_TEST((r != value_range{1, 7}));
}

BOOST_AUTO_TEST_SUITE_END()

}  // namespace
