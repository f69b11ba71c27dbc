#pragma once

#include <swapwire/program/error.hpp>
#include <swapwire/program/unpack.hpp>
