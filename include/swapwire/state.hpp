#pragma once

#include <swapwire/state/fee_schedule.hpp>
#include <swapwire/state/layout.hpp>
#include <swapwire/state/pool_state.hpp>
#include <swapwire/state/program_config.hpp>
#include <swapwire/state/swap_curve.hpp>
#include <swapwire/state/versioned_pool_state.hpp>
