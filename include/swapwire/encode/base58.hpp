#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <swapwire/encode/error.hpp>

namespace swapwire::encode {

std::string to_base58( std::span< const std::byte > s );
result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept;

/**
 * Decodes a base58 key that must be exactly key_length bytes long.
 * Fails with invalid_key_length otherwise.
 */
result< std::vector< std::byte > > from_base58( std::string_view sv, std::size_t key_length ) noexcept;

} // namespace swapwire::encode
