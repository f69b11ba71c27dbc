#pragma once

#include <expected>
#include <system_error>

namespace swapwire::program {

// Rejections reported by the on-chain program for a whole call
enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok,
  invalid_instruction_data,
  invalid_account_data,
  uninitialized_account
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace swapwire::program

template<>
struct std::is_error_code_enum< swapwire::program::program_errc >: public std::true_type
{};
