#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include <swapwire/encode/error.hpp>

namespace swapwire::protocol {

constexpr std::size_t identifier_length = 32;

/**
 * A raw 32-byte account address or public key.
 */
using identifier = std::array< std::byte, identifier_length >;

std::string to_base58( const identifier& id );
encode::result< identifier > identifier_from_base58( std::string_view sv ) noexcept;

} // namespace swapwire::protocol
