#ifndef MUXBUS_FRAME_HPP
#define MUXBUS_FRAME_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace muxbus {

// Opaque payload carried on a channel
using Packet = std::vector<uint8_t>;

/**
 * @brief Logical wire unit: one channel name and its ordered packets.
 *
 * Encoders turn a Frame into bytes and back. The order of `packets` is the
 * order handlers observe on the receiving side.
 */
struct Frame {
    std::string channel;
    std::vector<Packet> packets;

    bool operator==(const Frame&) const = default;
};

// Copy text into a packet (convenience for string payloads)
[[nodiscard]] inline Packet MakePacket(std::string_view text) {
    return Packet(text.begin(), text.end());
}

} // namespace muxbus

#endif // MUXBUS_FRAME_HPP
