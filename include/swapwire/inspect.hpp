#pragma once

#include <swapwire/inspect/inspect.hpp>
