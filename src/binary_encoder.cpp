#include "muxbus/encoders/binary_encoder.hpp"
#include "muxbus/detail/wire_helpers.hpp"

namespace muxbus {

std::vector<uint8_t> BinaryEncoder::Encode(const Frame& frame) const {
    // 1. Check that every length fits its prefix
    if (frame.channel.size() > detail::MAX_NAME_LENGTH ||
        frame.packets.size() > detail::MAX_FIELD_VALUE) {
        return {};
    }

    size_t total = detail::NAME_PREFIX_BYTES + frame.channel.size() + detail::SIZE_PREFIX_BYTES;
    for (const Packet& packet : frame.packets) {
        if (packet.size() > detail::MAX_FIELD_VALUE) {
            return {};
        }
        total += detail::SIZE_PREFIX_BYTES + packet.size();
    }

    // 2. Header: name then packet count
    std::vector<uint8_t> out;
    out.reserve(total);
    detail::AppendU16(out, static_cast<uint16_t>(frame.channel.size()));
    out.insert(out.end(), frame.channel.begin(), frame.channel.end());
    detail::AppendU32(out, static_cast<uint32_t>(frame.packets.size()));

    // 3. Body: length-prefixed packets in order
    for (const Packet& packet : frame.packets) {
        detail::AppendU32(out, static_cast<uint32_t>(packet.size()));
        out.insert(out.end(), packet.begin(), packet.end());
    }

    return out;
}

std::optional<Frame> BinaryEncoder::Decode(std::span<const uint8_t> bytes) const {
    size_t offset = 0;

    uint16_t name_length = 0;
    if (!detail::ReadU16(bytes, offset, name_length) ||
        !detail::HasBytes(bytes.size(), offset, name_length)) {
        return std::nullopt;
    }

    Frame frame;
    frame.channel.assign(reinterpret_cast<const char*>(bytes.data() + offset), name_length);
    offset += name_length;

    uint32_t count = 0;
    if (!detail::ReadU32(bytes, offset, count)) {
        return std::nullopt;
    }

    // Each packet needs at least its prefix; reject counts the input cannot hold
    // before reserving
    if (count > (bytes.size() - offset) / detail::SIZE_PREFIX_BYTES) {
        return std::nullopt;
    }
    frame.packets.reserve(count);

    for (uint32_t i = 0; i < count; ++i) {
        uint32_t length = 0;
        if (!detail::ReadU32(bytes, offset, length) ||
            !detail::HasBytes(bytes.size(), offset, length)) {
            return std::nullopt;
        }
        const auto payload = bytes.subspan(offset, length);
        frame.packets.emplace_back(payload.begin(), payload.end());
        offset += length;
    }

    if (offset != bytes.size()) {
        return std::nullopt;  // Trailing bytes
    }

    return frame;
}

} // namespace muxbus
