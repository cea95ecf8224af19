//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlrow/decode_row.hpp>
#include <mysqlrow/error_with_diagnostics.hpp>
#include <mysqlrow/protocol_field_type.hpp>
#include <mysqlrow/raw_row.hpp>
#include <mysqlrow/resultset_encoding.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/utility/string_view.hpp>

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * This example decodes a single row message, as captured from the network,
 * and prints the bytes of each column.
 *
 * Usage: decode_row <text|binary> <hex-payload> <type>...
 *
 * The payload must not include the 4-byte frame header. Types are the numeric
 * protocol field types of each column (as they appear in column definitions),
 * in decimal or hexadecimal (e.g. 3 or 0xfd). For example:
 *
 *   decode_row binary 0000047275737401000000 0xfd 0x03
 */

static std::vector<std::uint8_t> parse_hex(const std::string& input)
{
    if (input.size() % 2 != 0)
        throw std::invalid_argument("The payload should have an even number of hex digits");

    std::vector<std::uint8_t> res;
    res.reserve(input.size() / 2);
    for (std::size_t i = 0; i < input.size(); i += 2)
    {
        std::size_t processed = 0;
        auto value = std::stoul(input.substr(i, 2), &processed, 16);
        if (processed != 2)
            throw std::invalid_argument("Invalid hex digit in payload: " + input.substr(i, 2));
        res.push_back(static_cast<std::uint8_t>(value));
    }
    return res;
}

static mysqlrow::protocol_field_type parse_type(const std::string& input)
{
    std::size_t processed = 0;
    auto value = std::stoul(input, &processed, 0);
    if (processed != input.size() || value > 0xff)
        throw std::invalid_argument("Invalid protocol field type: " + input);
    return static_cast<mysqlrow::protocol_field_type>(value);
}

static void print_bytes(boost::string_view value)
{
    std::ios_base::fmtflags flags(std::cout.flags());
    std::cout << std::hex << std::setfill('0');
    for (char c : value)
        std::cout << std::setw(2) << static_cast<unsigned>(static_cast<unsigned char>(c)) << ' ';
    std::cout.flags(flags);
}

void main_impl(int argc, char** argv)
{
    if (argc < 3)
    {
        std::cerr << "Usage: " << argv[0] << " <text|binary> <hex-payload> <type>...\n";
        exit(1);
    }

    // Protocol
    std::string encoding_str = argv[1];
    mysqlrow::resultset_encoding encoding;
    if (encoding_str == "text")
        encoding = mysqlrow::resultset_encoding::text;
    else if (encoding_str == "binary")
        encoding = mysqlrow::resultset_encoding::binary;
    else
        throw std::invalid_argument("Invalid encoding: " + encoding_str);

    // Payload and column types
    std::vector<std::uint8_t> payload = parse_hex(argv[2]);
    std::vector<mysqlrow::protocol_field_type> types;
    for (int i = 3; i < argc; ++i)
        types.push_back(parse_type(argv[i]));

    // Decode. This throws mysqlrow::error_with_diagnostics on error
    mysqlrow::raw_row row = mysqlrow::decode_row(encoding, boost::asio::buffer(payload), types);

    // Print the results
    for (std::size_t i = 0; i < row.size(); ++i)
    {
        std::cout << i << " (" << types[i] << "): ";
        auto value = row.at(i);
        if (value)
            print_bytes(*value);
        else
            std::cout << "NULL";
        std::cout << '\n';
    }
}

int main(int argc, char** argv)
{
    try
    {
        main_impl(argc, argv);
    }
    catch (const mysqlrow::error_with_diagnostics& err)
    {
        // Some errors include additional diagnostics, like the column that failed to decode
        std::cerr << "Error: " << err.what() << '\n'
                  << "Error code: " << err.code() << '\n'
                  << "Client message: " << err.get_diagnostics().client_message() << std::endl;
        return 1;
    }
    catch (const std::exception& err)
    {
        std::cerr << "Error: " << err.what() << std::endl;
        return 1;
    }
}
