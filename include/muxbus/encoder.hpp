#ifndef MUXBUS_ENCODER_HPP
#define MUXBUS_ENCODER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
#include "muxbus/frame.hpp"

namespace muxbus {

/**
 * @brief Codec contract: Frame <-> wire bytes.
 *
 * @par Error Conditions
 * - Encode() returns an empty buffer if the frame cannot be represented.
 * - Decode() returns nullopt for malformed input. It must not throw on bad
 *   bytes; callers treat nullopt as "nothing to deliver".
 *
 * @par Thread Safety
 * Implementations must be callable concurrently; clients share the
 * registered instance.
 */
class Encoder {
public:
    virtual ~Encoder() = default;

    [[nodiscard]] virtual std::vector<uint8_t> Encode(const Frame& frame) const = 0;

    [[nodiscard]] virtual std::optional<Frame> Decode(std::span<const uint8_t> bytes) const = 0;
};

/**
 * @brief Process-wide table of codecs, keyed by name.
 *
 * The "binary" codec is registered on first access. Clients resolve their
 * encoder once, in Client::Create(); later registry changes do not affect
 * existing clients.
 *
 * @par Thread Safety
 * All methods are thread-safe (shared_mutex: readers share, writers
 * exclusive).
 */
class EncoderRegistry {
public:
    // Singleton (intentionally leaked, see AdapterRegistry::Instance())
    [[nodiscard]] static EncoderRegistry& Instance() noexcept;

    // Register or replace. Returns false for an empty name or null encoder.
    bool Register(std::string_view name, std::shared_ptr<Encoder> encoder);

    bool Unregister(std::string_view name) noexcept;

    // nullptr if no codec is registered under `name`
    [[nodiscard]] std::shared_ptr<Encoder> Resolve(std::string_view name) const noexcept;

    [[nodiscard]] bool Has(std::string_view name) const noexcept;

private:
    EncoderRegistry();
    ~EncoderRegistry();

    EncoderRegistry(const EncoderRegistry&) = delete;
    EncoderRegistry& operator=(const EncoderRegistry&) = delete;

    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace muxbus

#endif // MUXBUS_ENCODER_HPP
