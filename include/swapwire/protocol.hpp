#pragma once

#include <swapwire/protocol/builder.hpp>
#include <swapwire/protocol/call.hpp>
#include <swapwire/protocol/identifier.hpp>
#include <swapwire/protocol/instruction.hpp>
