#pragma once

#include <swapwire/log/log.hpp>
