#pragma once

#include <expected>
#include <system_error>

namespace swapwire::codec {

enum class codec_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  missing_discriminant,
  unknown_discriminant,
  truncated_input,
  malformed_payload,
  buffer_too_small,
  invalid_flag_byte,
  unsupported_version,
  unknown_curve_type
};

const std::error_category& codec_category() noexcept;

std::error_code make_error_code( codec_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace swapwire::codec

template<>
struct std::is_error_code_enum< swapwire::codec::codec_errc >: public std::true_type
{};
