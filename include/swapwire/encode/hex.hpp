#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <swapwire/encode/error.hpp>

namespace swapwire::encode {

// Lowercase digits with a leading "0x"
std::string to_hex( std::span< const std::byte > s );

/**
 * Parses a hex payload. The "0x" prefix is optional and ASCII whitespace
 * between byte pairs is skipped, so dumps such as "01 40 42 0f" can be
 * pasted as they are. Whitespace inside a pair is an invalid digit.
 */
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

} // namespace swapwire::encode
