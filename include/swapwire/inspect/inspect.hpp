#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace swapwire::inspect {

enum class payload_kind : std::uint8_t
{
  instruction,
  farm_instruction,
  pool,
  config
};

template< typename T >
using result = std::expected< T, std::error_code >;

/**
 * Parses a payload kind as written on the command line: "instruction",
 * "farm-instruction", "pool" or "config".
 *
 * Returns std::errc::invalid_argument for any other name.
 */
result< payload_kind > parse_kind( std::string_view name ) noexcept;

/**
 * Decodes bytes as the given kind and renders them one field per line.
 *
 * AMM instructions and accounts pass through the program's entry checks,
 * so their failures are program errors. Farm instructions report the
 * codec error directly.
 */
result< std::vector< std::string > > describe( payload_kind kind, std::span< const std::byte > bytes );

} // namespace swapwire::inspect
