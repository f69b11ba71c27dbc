#pragma once

#include <expected>
#include <system_error>

namespace swapwire::encode {

// Failures parsing payloads and keys given as text
enum class encode_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_hex_digit,
  odd_hex_length,
  invalid_base58_digit,
  invalid_key_length
};

const std::error_category& encode_category() noexcept;

std::error_code make_error_code( encode_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace swapwire::encode

template<>
struct std::is_error_code_enum< swapwire::encode::encode_errc >: public std::true_type
{};
