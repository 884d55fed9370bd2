#ifndef MUXBUS_ADAPTER_HPP
#define MUXBUS_ADAPTER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace muxbus {

// Forward declarations
class Client;

/**
 * @brief Opaque transport endpoint.
 *
 * Each adapter derives its own socket type; the core only stores and
 * hands back the pointer.
 */
class Socket {
public:
    virtual ~Socket() = default;
};

// Socket-level failure reported through the client's error signal
struct TransportError {
    std::error_code code;
    std::string message;
};

/**
 * @brief Transport contract.
 *
 * Transport specifics (stream framing, datagram delivery, local hand-off)
 * stay inside the adapter; the core never branches on transport kind.
 *
 * - CreateSocket(): adopt `existing` (server-spawned clients) or open a new
 *   connection for `client`. May return nullptr when no connection can be
 *   made; report the cause with client.HandleError().
 * - Send(): fire-and-forget. No acknowledgment, no backpressure. A null or
 *   closed socket drops the bytes.
 * - Disconnect(): tear down the client's current socket. Idempotent.
 * - Stop(): release listening resources, then call `done` exactly once.
 */
class Adapter {
public:
    using StopCallback = std::function<void()>;

    virtual ~Adapter() = default;

    [[nodiscard]] virtual std::shared_ptr<Socket> CreateSocket(
        Client& client,
        std::shared_ptr<Socket> existing) = 0;

    virtual void Send(const std::shared_ptr<Socket>& socket, std::span<const uint8_t> bytes) = 0;

    virtual void Disconnect(Client& client) = 0;

    virtual void Stop(StopCallback done) = 0;
};

/**
 * @brief Process-wide table of transports, keyed by name.
 *
 * The "inproc" adapter is registered on first access.
 *
 * @par Thread Safety
 * All methods are thread-safe (shared_mutex).
 */
class AdapterRegistry {
public:
    /**
     * @brief Get singleton instance (thread-safe lazy initialization).
     *
     * Intentionally leaked: clients and sockets may still reference
     * registered adapters during static destruction.
     */
    [[nodiscard]] static AdapterRegistry& Instance() noexcept;

    // Register or replace. Returns false for an empty name or null adapter.
    bool Register(std::string_view name, std::shared_ptr<Adapter> adapter);

    bool Unregister(std::string_view name) noexcept;

    // nullptr if no adapter is registered under `name`
    [[nodiscard]] std::shared_ptr<Adapter> Resolve(std::string_view name) const noexcept;

    [[nodiscard]] bool Has(std::string_view name) const noexcept;

    /**
     * @brief Stop every registered adapter.
     *
     * Calls Adapter::Stop() on each distinct adapter and invokes `done`
     * once, after the last one has completed. Meant for the owner of the
     * process lifecycle (e.g. after a termination signal has been observed
     * on the main thread).
     */
    void StopAll(std::function<void()> done);

private:
    AdapterRegistry();
    ~AdapterRegistry();

    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;

    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace muxbus

#endif // MUXBUS_ADAPTER_HPP
