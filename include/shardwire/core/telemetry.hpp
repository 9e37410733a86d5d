#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(SHARDWIRE_ENABLE_TELEMETRY_L1)
    #define SW_TL1(expr) expr
#else
    #define SW_TL1(expr) ((void)0)
#endif
