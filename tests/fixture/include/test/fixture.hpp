#pragma once

#include <cstdint>
#include <initializer_list>
#include <vector>

#include <swapwire/protocol/identifier.hpp>
#include <swapwire/state/pool_state.hpp>
#include <swapwire/state/program_config.hpp>

namespace test {

// Identifier whose bytes run seed, seed + 1, ... so that distinct seeds give
// distinct, recognisable patterns.
swapwire::protocol::identifier make_identifier( std::uint8_t seed );

std::vector< std::byte > make_bytes( std::initializer_list< std::uint8_t > values );

std::vector< std::byte > le_bytes( std::uint64_t value );

swapwire::state::pool_state make_pool_state();
swapwire::state::program_config make_program_config();

} // namespace test
