#ifndef MUXBUS_DETAIL_WIRE_HELPERS_HPP
#define MUXBUS_DETAIL_WIRE_HELPERS_HPP

#include <cstdint>
#include <cstddef>
#include <limits>
#include <span>
#include <vector>

namespace muxbus::detail {

/**
 * @brief Inline utilities for the length-prefixed binary frame layout.
 *
 * Layout (all integers little-endian):
 * @code
 * u16 name_length | name bytes | u32 packet_count | (u32 length | bytes)*
 * @endcode
 *
 * Writers append to a byte vector; readers walk a span through a cursor
 * and report failure instead of reading past the end.
 */

// ============================================================================
// Constants
// ============================================================================

/**
 * @brief Size of the channel name length prefix in bytes.
 */
constexpr size_t NAME_PREFIX_BYTES = 2;

/**
 * @brief Size of packet count and packet length prefixes in bytes.
 */
constexpr size_t SIZE_PREFIX_BYTES = 4;

/**
 * @brief Longest channel name the layout can carry.
 */
constexpr size_t MAX_NAME_LENGTH = std::numeric_limits<uint16_t>::max();

/**
 * @brief Largest packet (and largest packet count) the layout can carry.
 */
constexpr size_t MAX_FIELD_VALUE = std::numeric_limits<uint32_t>::max();

// ============================================================================
// Validation Utilities
// ============================================================================

/**
 * @brief Check that `needed` bytes remain after `offset`.
 *
 * Written to avoid overflow in `offset + needed`.
 */
[[nodiscard]] inline constexpr bool HasBytes(
    size_t total,
    size_t offset,
    size_t needed) noexcept
{
    return offset <= total && needed <= total - offset;
}

// ============================================================================
// Write Utilities
// ============================================================================

inline void AppendU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

inline void AppendU32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

// ============================================================================
// Read Utilities
// ============================================================================

/**
 * @brief Read a little-endian u16 at `offset` and advance it.
 *
 * @return false (offset unchanged) if fewer than 2 bytes remain
 */
[[nodiscard]] inline bool ReadU16(
    std::span<const uint8_t> bytes,
    size_t& offset,
    uint16_t& value) noexcept
{
    if (!HasBytes(bytes.size(), offset, NAME_PREFIX_BYTES)) {
        return false;
    }
    value = static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
    offset += NAME_PREFIX_BYTES;
    return true;
}

/**
 * @brief Read a little-endian u32 at `offset` and advance it.
 *
 * @return false (offset unchanged) if fewer than 4 bytes remain
 */
[[nodiscard]] inline bool ReadU32(
    std::span<const uint8_t> bytes,
    size_t& offset,
    uint32_t& value) noexcept
{
    if (!HasBytes(bytes.size(), offset, SIZE_PREFIX_BYTES)) {
        return false;
    }
    value = 0;
    for (size_t i = 0; i < SIZE_PREFIX_BYTES; ++i) {
        value |= static_cast<uint32_t>(bytes[offset + i]) << (8 * i);
    }
    offset += SIZE_PREFIX_BYTES;
    return true;
}

} // namespace muxbus::detail

#endif // MUXBUS_DETAIL_WIRE_HELPERS_HPP
