#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

namespace raster_ql {

// Runtime logging control via environment variable
inline bool IsDebugLoggingEnabled() {
    static const bool enabled = [] {
        const char* env = std::getenv("RASTER_QL_DEBUG");
        return env != nullptr && std::string(env) == "1";
    }();
    return enabled;
}

} // namespace raster_ql

// Compile-time logging macros
// Usage:
//   RASTER_QL_LOG_SCAN("Reading " << layer_id.ToString() << " from " << uri);
//   RASTER_QL_LOG_FILTER("Ignoring predicate " << predicate.ToString());
//
// Control:
//   Compile-time: cmake -DRASTER_QL_ENABLE_DEBUG_LOGGING=ON
//   Runtime: export RASTER_QL_DEBUG=1

#ifdef RASTER_QL_ENABLE_DEBUG_LOGGING

#define RASTER_QL_LOG(category, message) \
    do { \
        if (::raster_ql::IsDebugLoggingEnabled()) { \
            std::cerr << "[" << category << "] " << message << "\n" << std::flush; \
        } \
    } while (0)

#else

#define RASTER_QL_LOG(category, message) \
    do { } while (0)

#endif

// Category-specific logging macros
#define RASTER_QL_LOG_RESOLVE(message) RASTER_QL_LOG("RESOLVE", message)
#define RASTER_QL_LOG_SCHEMA(message)  RASTER_QL_LOG("SCHEMA", message)
#define RASTER_QL_LOG_FILTER(message)  RASTER_QL_LOG("FILTER", message)
#define RASTER_QL_LOG_SCAN(message)    RASTER_QL_LOG("SCAN", message)
#define RASTER_QL_LOG_STORE(message)   RASTER_QL_LOG("STORE", message)
