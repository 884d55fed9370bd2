#ifndef MUXBUS_DETAIL_CONFIG_HPP
#define MUXBUS_DETAIL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <chrono>
#include <optional>

namespace muxbus {

// Client construction error codes
enum class ClientError {
    Success,
    UnknownAdapter,
    UnknownEncoder,
    InvalidConfig,
    AllocationFailed
};

[[nodiscard]] inline constexpr const char* ToString(ClientError error) noexcept {
    switch (error) {
        case ClientError::Success:          return "Success";
        case ClientError::UnknownAdapter:   return "UnknownAdapter";
        case ClientError::UnknownEncoder:   return "UnknownEncoder";
        case ClientError::InvalidConfig:    return "InvalidConfig";
        case ClientError::AllocationFailed: return "AllocationFailed";
    }
    return "Unknown";
}

// Per-channel bundler overrides. Unset fields inherit the client defaults.
struct BundlerOverrides {
    std::optional<std::chrono::milliseconds> every;
    std::optional<size_t> max_packets;
};

// Bundler (batching) parameters
struct BundlerConfig {
    std::chrono::milliseconds every{16};   // Flush interval after the first queued packet
    size_t max_packets = 2048;             // Queue length that forces an immediate flush

    // Layer per-channel overrides on top of these values
    [[nodiscard]] BundlerConfig Merge(const BundlerOverrides& overrides) const noexcept {
        BundlerConfig merged = *this;
        if (overrides.every) {
            merged.every = *overrides.every;
        }
        if (overrides.max_packets) {
            merged.max_packets = *overrides.max_packets;
        }
        return merged;
    }

    // Normalize configuration to valid values
    [[nodiscard]] BundlerConfig Normalize() const noexcept {
        BundlerConfig normalized = *this;
        normalized.every = std::clamp(
            every, std::chrono::milliseconds(1), std::chrono::milliseconds(60'000));
        normalized.max_packets = std::clamp(max_packets, size_t(1), size_t(1'048'576));
        return normalized;
    }

    // Validate configuration
    [[nodiscard]] bool IsValid() const noexcept {
        if (every < std::chrono::milliseconds(1) || every > std::chrono::milliseconds(60'000)) {
            return false;
        }
        if (max_packets < 1 || max_packets > 1'048'576) {
            return false;
        }
        return true;
    }
};

} // namespace muxbus

#endif // MUXBUS_DETAIL_CONFIG_HPP
