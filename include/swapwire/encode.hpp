#pragma once

#include <swapwire/encode/base58.hpp>
#include <swapwire/encode/error.hpp>
#include <swapwire/encode/hex.hpp>
