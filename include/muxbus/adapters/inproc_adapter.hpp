#ifndef MUXBUS_ADAPTERS_INPROC_ADAPTER_HPP
#define MUXBUS_ADAPTERS_INPROC_ADAPTER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <unordered_map>
#include "muxbus/adapter.hpp"

namespace muxbus {

/**
 * @brief In-process transport. Registered as "inproc".
 *
 * A server calls Listen(port, on_accept); a client whose config names that
 * port gets a linked socket pair on CreateSocket(). `on_accept` receives the
 * server-side socket, usually to adopt it in a server-spawned client:
 *
 * @code
 * auto inproc = muxbus::InprocAdapter::Default();
 * auto tick = std::make_shared<muxbus::Tick>();
 * std::vector<std::unique_ptr<muxbus::Client>> sessions;
 *
 * inproc->Listen(4000, [&](std::shared_ptr<muxbus::Socket> socket) {
 *     auto [error, session] = muxbus::Client::Create({.port = 4000, .tick = tick}, socket);
 *     if (error == muxbus::ClientError::Success) {
 *         sessions.push_back(std::move(session));
 *     }
 * });
 * @endcode
 *
 * @par Delivery
 * Send() hands the caller's bytes straight to the peer client's
 * HandleRequest() on the calling thread (no copy, no queue).
 *
 * @par Disconnect
 * Unlinks the pair and calls HandleDisconnect() on both owners. A second
 * call, or a call on an unlinked socket, does nothing. Before returning it
 * waits for deliveries into either owner running on other threads, so a
 * client may be destroyed while its peer is sending to it. A handler must
 * not block on a thread that is disconnecting its own client.
 */
class InprocAdapter final : public Adapter {
public:
    using AcceptHandler = std::function<void(std::shared_ptr<Socket>)>;

    // Process-wide instance registered under "inproc"
    [[nodiscard]] static std::shared_ptr<InprocAdapter> Default();

    // Returns false if `port` already has a listener
    bool Listen(uint16_t port, AcceptHandler on_accept);

    bool Unlisten(uint16_t port) noexcept;

    [[nodiscard]] bool IsListening(uint16_t port) const noexcept;

    [[nodiscard]] std::shared_ptr<Socket> CreateSocket(
        Client& client,
        std::shared_ptr<Socket> existing) override;

    void Send(const std::shared_ptr<Socket>& socket, std::span<const uint8_t> bytes) override;

    void Disconnect(Client& client) override;

    // Drops every listener. Established pairs stay linked.
    void Stop(StopCallback done) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<uint16_t, AcceptHandler> listeners_;
};

} // namespace muxbus

#endif // MUXBUS_ADAPTERS_INPROC_ADAPTER_HPP
