#pragma once

#include <swapwire/farm/builder.hpp>
#include <swapwire/farm/instruction.hpp>
