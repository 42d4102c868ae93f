#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace modbridge {

// ============================================================================
// Core Types
// ============================================================================

using EntityId = std::uint64_t;
using ComponentId = std::string;
using Bytes = std::vector<std::uint8_t>;
using ModuleHandle = std::uint32_t;

static constexpr ModuleHandle kInvalidModule = 0;

// Version of the capability surface exposed to guests (host.*, app:*, commands:*).
static constexpr int kInterfaceVersion = 1;

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

// ============================================================================
// Well-known schedule phases
// ============================================================================

namespace phases {
    // Runs once per module after every successful load or reload.
    inline constexpr const char* kStartup = "startup";
    inline constexpr const char* kPreUpdate = "pre_update";
    inline constexpr const char* kUpdate = "update";
    inline constexpr const char* kPostUpdate = "post_update";
    inline constexpr const char* kFixedPreUpdate = "fixed_pre_update";
    inline constexpr const char* kFixedUpdate = "fixed_update";
    inline constexpr const char* kFixedPostUpdate = "fixed_post_update";
} // namespace phases

} // namespace modbridge
