#pragma once

#include <span>

#include <swapwire/program/error.hpp>
#include <swapwire/protocol/instruction.hpp>
#include <swapwire/state/program_config.hpp>
#include <swapwire/state/versioned_pool_state.hpp>

// Entry checks run by the program before any instruction logic. Codec errors
// are collapsed into the coarse rejections the runtime reports for a call.

namespace swapwire::program {

result< protocol::instruction > unpack_instruction( std::span< const std::byte > data ) noexcept;
result< state::versioned_pool_state > unpack_pool( std::span< const std::byte > data ) noexcept;
result< state::program_config > unpack_config( std::span< const std::byte > data ) noexcept;

} // namespace swapwire::program
