#ifndef MUXBUS_CLIENT_HPP
#define MUXBUS_CLIENT_HPP

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "muxbus/adapter.hpp"
#include "muxbus/channel.hpp"
#include "muxbus/detail/config.hpp"
#include "muxbus/encoder.hpp"
#include "muxbus/frame.hpp"
#include "muxbus/scheduler.hpp"

namespace muxbus {

// Client configuration. Defaults are the built-in layer; per-channel
// BundlerOverrides sit on top of `bundler`.
struct ClientConfig {
    std::string hostname = "0.0.0.0";
    uint16_t port = 3000;
    std::string adapter = "inproc";          // AdapterRegistry name
    std::string encoder = "binary";          // EncoderRegistry name
    BundlerConfig bundler;
    bool stats = false;                      // Log {packets, bytes} per transmitted frame
    std::chrono::milliseconds socket_timeout{30'000};

    // Timer source for bundlers. nullptr: the client owns a ThreadScheduler.
    std::shared_ptr<Scheduler> scheduler;

    // Server pulse. Set for server-spawned clients; takes precedence over
    // `scheduler`.
    std::shared_ptr<Tick> tick;

    // Subscriptions applied at construction, before the socket is attached
    std::vector<std::pair<std::string, Channel::HandlerPtr>> channels;

    [[nodiscard]] bool IsValid() const noexcept {
        return !hostname.empty() && !adapter.empty() && !encoder.empty() && bundler.IsValid();
    }
};

/**
 * @brief One logical connection multiplexing named channels over a socket.
 *
 * @par Outbound
 * Send()/SendOnce() queue on the named channel; its bundler later hands
 * the batch to Emit(), which encodes it and passes the bytes to the
 * adapter. SendNow() skips the queue.
 *
 * @par Inbound
 * The adapter calls HandleRequest() with raw bytes; the decoded frame is
 * routed to the channel of the same name. Undecodable frames and frames for
 * unknown channels are dropped (counted in Stats::frames_dropped).
 *
 * @par Error Conditions
 * Only construction can fail (see Create()). Send-family calls always
 * return the client; transport and protocol failures surface through the
 * error listeners, the log and the statistics, never as exceptions.
 *
 * @par Thread Safety
 * All public methods are thread-safe. A client may be destroyed from one of
 * its own channel handlers, including on its bundler thread; the delivery
 * that invoked the handler unwinds without touching the client again.
 * Destroying it from a connect or disconnect listener is not supported.
 */
class Client {
public:
    using Handler = Channel::Handler;
    using HandlerPtr = Channel::HandlerPtr;
    using ListenerId = uint64_t;
    using ConnectListener = std::function<void(const std::shared_ptr<Socket>&)>;
    using DisconnectListener = std::function<void()>;
    using ErrorListener = std::function<void(const TransportError&)>;

    // Statistics (relaxed atomics)
    struct Stats {
        uint64_t frames_sent;
        uint64_t packets_sent;
        uint64_t bytes_sent;
        uint64_t frames_received;
        uint64_t packets_received;
        uint64_t frames_dropped;   // Undecodable or addressed to an unknown channel
    };

    /**
     * @brief Create a client and attach its socket.
     *
     * Validates the (normalized) configuration and resolves the adapter and
     * encoder before any channel or socket work happens.
     *
     * @param config Client configuration (bundler settings auto-normalized)
     * @param socket Existing socket to adopt (server side), or nullptr to
     *               let the adapter open a connection
     * @return Pair of (error code, client). The client is null on failure.
     *
     * @par Error Conditions
     * - UnknownAdapter: `config.adapter` is not registered
     * - UnknownEncoder: `config.encoder` is not registered
     * - InvalidConfig: empty hostname/adapter/encoder
     * - AllocationFailed: memory allocation failed
     *
     * @par Example
     * @code
     * auto [error, client] = muxbus::Client::Create({.port = 4000});
     * if (error != muxbus::ClientError::Success) {
     *     return;
     * }
     * client->Subscribe("chat", muxbus::MakeHandler([](const muxbus::Packet& p) {
     *     // ...
     * }));
     * client->Send("chat", muxbus::MakePacket("hello"));
     * @endcode
     */
    [[nodiscard]] static std::pair<ClientError, std::unique_ptr<Client>> Create(
        ClientConfig config = {},
        std::shared_ptr<Socket> socket = nullptr);

    // Destroy()s, then waits for in-flight bundler flushes
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Create channel `name` if absent (options layered over config.bundler,
    // ignored if the channel exists) and attach `handler` if non-null
    Client& Subscribe(std::string_view name, HandlerPtr handler = nullptr,
                      const BundlerOverrides& options = {});

    // Detach `handler`. No-op for unknown channels.
    Client& Unsubscribe(std::string_view name, const HandlerPtr& handler);

    // Disconnect the current socket (if any), then create or adopt one
    Client& Use(std::shared_ptr<Socket> socket = nullptr);

    Client& Send(std::string_view name, Packet payload);
    Client& SendOnce(std::string_view name, Packet payload);
    Client& SendNow(std::string_view name, Packet payload);

    // Disconnect, drop the socket and cancel every bundler. Queues are kept.
    void Destroy();

    // ===== Adapter callbacks =====
    void HandleError(const TransportError& error) noexcept;
    void HandleConnect(std::shared_ptr<Socket> socket);
    void HandleDisconnect();
    void HandleRequest(std::span<const uint8_t> bytes);

    // Encode and transmit one batch. Called by channel bundlers. Returns
    // false, leaving `packets` untouched, when no socket is attached; a
    // throwing encoder or adapter loses the batch and is reported through
    // HandleError().
    bool Emit(const std::string& channel, std::vector<Packet>&& packets);

    // ===== Lifecycle listeners =====
    ListenerId OnConnect(ConnectListener listener);
    ListenerId OnDisconnect(DisconnectListener listener);
    ListenerId OnError(ErrorListener listener);
    bool RemoveListener(ListenerId id) noexcept;

    // ===== Query state =====
    [[nodiscard]] const std::string& Id() const noexcept;
    [[nodiscard]] const ClientConfig& Config() const noexcept;
    [[nodiscard]] bool IsFromServer() const noexcept;
    [[nodiscard]] std::shared_ptr<Socket> GetSocket() const;
    [[nodiscard]] bool IsConnected() const noexcept;
    [[nodiscard]] Channel* GetChannel(std::string_view name) const noexcept;
    [[nodiscard]] size_t ChannelCount() const noexcept;
    [[nodiscard]] Stats GetStats() const noexcept;

private:
    Client(ClientConfig config, std::shared_ptr<Adapter> adapter, std::shared_ptr<Encoder> encoder);

    struct Impl;
    std::shared_ptr<Impl> pimpl_;
};

} // namespace muxbus

#endif // MUXBUS_CLIENT_HPP
