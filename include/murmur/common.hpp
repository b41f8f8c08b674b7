#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// Murmur Version
#define MURMUR_VERSION_MAJOR 0
#define MURMUR_VERSION_MINOR 1
#define MURMUR_VERSION_PATCH 0
#define MURMUR_VERSION_STRING "0.1.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef MURMUR_PLATFORM_WINDOWS
        #define MURMUR_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef MURMUR_PLATFORM_LINUX
        #define MURMUR_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef MURMUR_PLATFORM_MACOS
        #define MURMUR_PLATFORM_MACOS
    #endif
#endif

// Utility macros
#define MURMUR_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define MURMUR_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define MURMUR_DISALLOW_COPY_AND_MOVE(TypeName) \
    MURMUR_DISALLOW_COPY(TypeName); \
    MURMUR_DISALLOW_MOVE(TypeName)

// Constants
namespace murmur {
namespace constants {

// Network constants
constexpr uint16_t DEFAULT_PORT = 8888;
constexpr uint16_t DEFAULT_TOR_SOCKS_PORT = 9050;
constexpr size_t DEFAULT_MAX_PEERS = 50;

// Periodic task intervals (milliseconds)
constexpr uint64_t DEFAULT_DISCOVERY_INTERVAL_MS = 30000;   // 30 seconds
constexpr uint64_t DEFAULT_SYNC_INTERVAL_MS = 30000;        // 30 seconds
constexpr uint64_t DEFAULT_HEARTBEAT_INTERVAL_MS = 60000;   // 60 seconds
constexpr uint64_t DEFAULT_CONNECTION_TIMEOUT_MS = 10000;   // 10 seconds

// Advertisements
constexpr uint64_t ADVERTISEMENT_MAX_AGE_MS = 60 * 60 * 1000;  // 1 hour
constexpr size_t SCAN_HISTORY_CAPACITY = 10;
constexpr const char* ADVERTISEMENT_URI_SCHEME = "murmur";

// Node id reported when the transport cannot tell us who we are
constexpr const char* UNKNOWN_NODE_ID = "unknown";

} // namespace constants
} // namespace murmur

// Core types
namespace murmur {

// Unix epoch milliseconds
using Timestamp = uint64_t;

} // namespace murmur
