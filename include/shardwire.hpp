#pragma once

/*
===============================================================================
Shardwire - Public API Entry Point
===============================================================================

Everything an application needs lives in the shardwire::core namespace.
===============================================================================
*/

#include <shardwire/core.hpp>
