#ifndef MUXBUS_ENCODERS_BINARY_ENCODER_HPP
#define MUXBUS_ENCODERS_BINARY_ENCODER_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "muxbus/encoder.hpp"

namespace muxbus {

// Length-prefixed little-endian codec (see detail/wire_helpers.hpp).
// Registered as "binary".
class BinaryEncoder final : public Encoder {
public:
    // Empty result if the name exceeds 65535 bytes or a packet/count
    // exceeds 2^32 - 1
    [[nodiscard]] std::vector<uint8_t> Encode(const Frame& frame) const override;

    // nullopt on truncation, oversized length fields or trailing bytes
    [[nodiscard]] std::optional<Frame> Decode(std::span<const uint8_t> bytes) const override;
};

} // namespace muxbus

#endif // MUXBUS_ENCODERS_BINARY_ENCODER_HPP
