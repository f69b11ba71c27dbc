#pragma once

#include <swapwire/codec/error.hpp>
#include <swapwire/codec/primitive.hpp>
