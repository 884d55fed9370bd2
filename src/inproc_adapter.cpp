#include "muxbus/adapters/inproc_adapter.hpp"
#include "muxbus/client.hpp"
#include "muxbus/log.hpp"
#include <algorithm>
#include <condition_variable>
#include <string>
#include <vector>

namespace muxbus {

namespace {

// One end of a linked pair
class InprocSocket final : public Socket {
public:
    std::mutex mutex;
    std::condition_variable idle;   // `calls` dropped
    Client* owner = nullptr;
    std::weak_ptr<InprocSocket> peer;
    size_t calls = 0;               // Callbacks into `owner` in progress
};

// Sockets whose owner this thread is calling into, innermost last
thread_local std::vector<const InprocSocket*> t_calling;

// Pins a socket's owner for the duration of one callback
class OwnerCall {
public:
    // PRECONDITION: socket->mutex held
    explicit OwnerCall(std::shared_ptr<InprocSocket> socket)
        : socket_(std::move(socket))
    {
        ++socket_->calls;
        t_calling.push_back(socket_.get());
    }

    ~OwnerCall() {
        t_calling.pop_back();
        {
            std::lock_guard lock(socket_->mutex);
            --socket_->calls;
        }
        socket_->idle.notify_all();
    }

    OwnerCall(const OwnerCall&) = delete;
    OwnerCall& operator=(const OwnerCall&) = delete;

private:
    std::shared_ptr<InprocSocket> socket_;
};

// Clear the owner and wait out callbacks into it made by other threads.
// Returns the previous owner.
Client* Release(InprocSocket& socket, std::unique_lock<std::mutex>& lock) {
    Client* owner = socket.owner;
    socket.owner = nullptr;
    const auto own = static_cast<size_t>(std::count(t_calling.begin(), t_calling.end(), &socket));
    socket.idle.wait(lock, [&socket, own]() { return socket.calls <= own; });
    return owner;
}

} // namespace

std::shared_ptr<InprocAdapter> InprocAdapter::Default() {
    static std::shared_ptr<InprocAdapter>* instance =
        new std::shared_ptr<InprocAdapter>(std::make_shared<InprocAdapter>());
    return *instance;
}

bool InprocAdapter::Listen(uint16_t port, AcceptHandler on_accept) {
    if (!on_accept) {
        return false;
    }
    std::lock_guard lock(mutex_);
    const bool inserted = listeners_.emplace(port, std::move(on_accept)).second;
    if (inserted) {
        Logger()->debug("inproc listening on port {}", port);
    }
    return inserted;
}

bool InprocAdapter::Unlisten(uint16_t port) noexcept {
    std::lock_guard lock(mutex_);
    return listeners_.erase(port) > 0;
}

bool InprocAdapter::IsListening(uint16_t port) const noexcept {
    std::lock_guard lock(mutex_);
    return listeners_.contains(port);
}

std::shared_ptr<Socket> InprocAdapter::CreateSocket(Client& client, std::shared_ptr<Socket> existing) {
    // Server side: adopt the accepted end
    if (existing) {
        auto adopted = std::dynamic_pointer_cast<InprocSocket>(existing);
        if (!adopted) {
            client.HandleError({std::make_error_code(std::errc::invalid_argument),
                                "inproc: cannot adopt a socket from another adapter"});
            return nullptr;
        }
        std::lock_guard lock(adopted->mutex);
        adopted->owner = &client;
        return adopted;
    }

    // Client side: connect to the listener on the configured port
    const uint16_t port = client.Config().port;
    AcceptHandler accept;
    {
        std::lock_guard lock(mutex_);
        auto it = listeners_.find(port);
        if (it != listeners_.end()) {
            accept = it->second;
        }
    }
    if (!accept) {
        client.HandleError({std::make_error_code(std::errc::connection_refused),
                            "inproc: nothing listening on port " + std::to_string(port)});
        return nullptr;
    }

    auto local = std::make_shared<InprocSocket>();
    auto remote = std::make_shared<InprocSocket>();
    local->owner = &client;
    local->peer = remote;
    remote->peer = local;

    accept(remote);
    client.HandleConnect(local);
    return local;
}

void InprocAdapter::Send(const std::shared_ptr<Socket>& socket, std::span<const uint8_t> bytes) {
    auto local = std::dynamic_pointer_cast<InprocSocket>(socket);
    if (!local) {
        return;
    }

    std::shared_ptr<InprocSocket> remote;
    {
        std::lock_guard lock(local->mutex);
        remote = local->peer.lock();
    }
    if (!remote) {
        return;
    }

    Client* target = nullptr;
    std::unique_ptr<OwnerCall> call;
    {
        std::lock_guard lock(remote->mutex);
        target = remote->owner;
        if (!target) {
            return;
        }
        call = std::make_unique<OwnerCall>(remote);
    }
    target->HandleRequest(bytes);
}

void InprocAdapter::Disconnect(Client& client) {
    auto local = std::dynamic_pointer_cast<InprocSocket>(client.GetSocket());
    if (!local) {
        return;
    }

    // From here on nothing new reaches `client` through this socket
    std::shared_ptr<InprocSocket> remote;
    {
        std::unique_lock lock(local->mutex);
        remote = local->peer.lock();
        local->peer.reset();
        Release(*local, lock);
    }
    if (!remote) {
        return;  // Already unlinked
    }

    Client* peer_owner = nullptr;
    std::unique_ptr<OwnerCall> call;
    {
        std::unique_lock lock(remote->mutex);
        remote->peer.reset();
        peer_owner = Release(*remote, lock);
        if (peer_owner) {
            call = std::make_unique<OwnerCall>(remote);
        }
    }

    client.HandleDisconnect();
    if (peer_owner) {
        peer_owner->HandleDisconnect();
    }
}

void InprocAdapter::Stop(StopCallback done) {
    {
        std::lock_guard lock(mutex_);
        listeners_.clear();
    }
    Logger()->debug("inproc adapter stopped");
    if (done) {
        done();
    }
}

} // namespace muxbus
