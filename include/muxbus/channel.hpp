#ifndef MUXBUS_CHANNEL_HPP
#define MUXBUS_CHANNEL_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include "muxbus/detail/config.hpp"
#include "muxbus/frame.hpp"

namespace muxbus {

// Forward declarations
class Client;
class Scheduler;

/**
 * @brief Named packet queue with timer-driven batching and handler fan-out.
 *
 * Channels are created and owned by a Client (Client::Subscribe()); the
 * pointer returned by Client::GetChannel() is valid for the client's
 * lifetime.
 *
 * @par Bundler
 * The first Send()/SendOnce() on an idle channel arms a one-shot timer of
 * `Options().every`. When it expires the whole pending queue is handed to
 * the client as one frame. If the client has no socket at that moment, or
 * loses it before the frame is encoded, the batch stays queued ahead of newer
 * packets and the bundler goes idle until Client::HandleConnect().
 *
 * @par Thread Safety
 * All methods are thread-safe. Each channel serializes its own state with
 * its own mutex; no lock is held while handlers or the client run.
 *
 * @par Backpressure
 * None. A producer outpacing the transport (or sending while disconnected)
 * grows the pending queue without bound.
 */
class Channel {
public:
    using Handler = std::function<void(const Packet&)>;
    // Handlers are identified by pointer for removal
    using HandlerPtr = std::shared_ptr<const Handler>;

    Channel(std::string name, BundlerConfig options, Client& client, Scheduler& scheduler);

    // Cancels the bundler and waits for a flush running on another thread
    ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    [[nodiscard]] const std::string& Name() const noexcept;
    [[nodiscard]] const BundlerConfig& Options() const noexcept;

    // Adding the same handler twice delivers twice
    void AddHandler(HandlerPtr handler);

    // Removes one registration. Returns false if `handler` was not registered.
    bool RemoveHandler(const HandlerPtr& handler) noexcept;

    // Append to the pending queue (FIFO) and arm the bundler if idle
    void Send(Packet payload);

    // Replace the pending queue with `payload` (latest value wins)
    void SendOnce(Packet payload);

    // Emit `payload` as its own frame now; the pending queue is untouched
    void SendNow(Packet payload);

    // Arm the bundler unless already armed
    void StartBundler();

    // Cancel the bundler without flushing; the queue is kept
    void ResetBundler() noexcept;

    // Deliver each packet, in order, to every handler. A throwing handler
    // is logged and skipped.
    void HandleData(std::span<const Packet> packets);

    // Query state (snapshots)
    [[nodiscard]] size_t PendingCount() const noexcept;
    [[nodiscard]] size_t HandlerCount() const noexcept;
    [[nodiscard]] bool IsBundlerArmed() const noexcept;

private:
    struct Impl;
    std::shared_ptr<Impl> pimpl_;
};

// Wrap a callable as a removable handler
[[nodiscard]] inline Channel::HandlerPtr MakeHandler(Channel::Handler handler) {
    return std::make_shared<const Channel::Handler>(std::move(handler));
}

} // namespace muxbus

#endif // MUXBUS_CHANNEL_HPP
