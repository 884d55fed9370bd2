#include "muxbus/client.hpp"
#include "muxbus/encoder.hpp"
#include "muxbus/log.hpp"
#include <atomic>
#include <exception>
#include <map>
#include <mutex>
#include <new>
#include <random>
#include <shared_mutex>
#include <system_error>
#include <unordered_map>

namespace muxbus {

namespace {

// 20 random bytes, hex-encoded
std::string GenerateId() {
    static constexpr char HEX[] = "0123456789abcdef";
    std::random_device device;
    std::uniform_int_distribution<unsigned> byte(0, 255);

    std::string id;
    id.reserve(40);
    for (int i = 0; i < 20; ++i) {
        const unsigned value = byte(device);
        id.push_back(HEX[value >> 4]);
        id.push_back(HEX[value & 0x0F]);
    }
    return id;
}

// Call every listener in `listeners`; a throwing listener is logged and skipped
template<typename Listener, typename... Args>
void Notify(const std::vector<Listener>& listeners, const char* event, const Args&... args) noexcept {
    for (const Listener& listener : listeners) {
        try {
            listener(args...);
        } catch (const std::exception& e) {
            Logger()->error("{} listener threw: {}", event, e.what());
        } catch (...) {
            Logger()->error("{} listener threw a non-standard exception", event);
        }
    }
}

} // namespace

struct Client::Impl {
    ClientConfig config_;
    const std::string id_;
    const bool from_server_;

    // Resolved once in Create()
    std::shared_ptr<Adapter> adapter_;
    std::shared_ptr<Encoder> encoder_;

    // Must outlive channels_ (channel destructors cancel on it)
    std::shared_ptr<Scheduler> scheduler_;

    mutable std::mutex socket_mutex_;
    std::shared_ptr<Socket> socket_;

    std::mutex listeners_mutex_;
    ListenerId next_listener_ = 1;
    std::map<ListenerId, ConnectListener> connect_listeners_;
    std::map<ListenerId, DisconnectListener> disconnect_listeners_;
    std::map<ListenerId, ErrorListener> error_listeners_;

    // Statistics (relaxed ordering)
    std::atomic<uint64_t> frames_sent_{0};
    std::atomic<uint64_t> packets_sent_{0};
    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> frames_received_{0};
    std::atomic<uint64_t> packets_received_{0};
    std::atomic<uint64_t> frames_dropped_{0};

    // Declared last: destroyed first, while everything above is intact
    mutable std::shared_mutex channels_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Channel>> channels_;

    Impl(ClientConfig config, std::shared_ptr<Adapter> adapter, std::shared_ptr<Encoder> encoder)
        : config_(std::move(config))
        , id_(GenerateId())
        , from_server_(config_.tick != nullptr)
        , adapter_(std::move(adapter))
        , encoder_(std::move(encoder))
    {
        if (config_.tick) {
            scheduler_ = config_.tick;
        } else if (config_.scheduler) {
            scheduler_ = config_.scheduler;
        } else {
            scheduler_ = std::make_shared<ThreadScheduler>();
        }
    }

    const char* Side() const noexcept {
        return from_server_ ? "server" : "client";
    }

    // Existing channel or nullptr
    Channel* Find(std::string_view name) const noexcept {
        std::shared_lock lock(channels_mutex_);
        auto it = channels_.find(std::string(name));
        return it == channels_.end() ? nullptr : it->second.get();
    }

    // Existing channel, or a new one with `options` layered over the defaults
    Channel& Acquire(Client& owner, std::string_view name, const BundlerOverrides& options) {
        if (Channel* existing = Find(name)) {
            return *existing;
        }

        std::unique_lock lock(channels_mutex_);
        std::string key(name);
        auto it = channels_.find(key);
        if (it == channels_.end()) {
            Logger()->debug("new {} connection {}://{}:{}/{}",
                            Side(), config_.adapter, config_.hostname, config_.port, key);
            auto channel = std::make_unique<Channel>(
                key, config_.bundler.Merge(options).Normalize(), owner, *scheduler_);
            it = channels_.emplace(std::move(key), std::move(channel)).first;
        }
        return *it->second;
    }

    // Stable for the client's lifetime: channels are never erased
    std::vector<Channel*> Channels() const {
        std::shared_lock lock(channels_mutex_);
        std::vector<Channel*> result;
        result.reserve(channels_.size());
        for (const auto& [name, channel] : channels_) {
            result.push_back(channel.get());
        }
        return result;
    }

    void ReportError(const TransportError& error) noexcept {
        Logger()->error("{} transport error: {} ({})", Side(), error.message, error.code.message());
        try {
            Notify(Listeners(error_listeners_), "error", error);
        } catch (const std::exception& e) {
            Logger()->error("error notification failed: {}", e.what());
        }
    }

    template<typename Listener>
    std::vector<Listener> Listeners(const std::map<ListenerId, Listener>& table) {
        std::lock_guard lock(listeners_mutex_);
        std::vector<Listener> result;
        result.reserve(table.size());
        for (const auto& [id, listener] : table) {
            result.push_back(listener);
        }
        return result;
    }

    template<typename Listener>
    ListenerId AddListener(std::map<ListenerId, Listener>& table, Listener listener) {
        std::lock_guard lock(listeners_mutex_);
        const ListenerId id = next_listener_++;
        table.emplace(id, std::move(listener));
        return id;
    }
};

std::pair<ClientError, std::unique_ptr<Client>> Client::Create(
    ClientConfig config,
    std::shared_ptr<Socket> socket)
{
    // 1. Normalize, then validate
    config.bundler = config.bundler.Normalize();
    if (!config.IsValid()) {
        Logger()->error("invalid client configuration");
        return {ClientError::InvalidConfig, nullptr};
    }

    // 2. Resolve collaborators before touching sockets or channels
    auto adapter = AdapterRegistry::Instance().Resolve(config.adapter);
    if (!adapter) {
        Logger()->error("no adapter \"{}\" found", config.adapter);
        return {ClientError::UnknownAdapter, nullptr};
    }

    auto encoder = EncoderRegistry::Instance().Resolve(config.encoder);
    if (!encoder) {
        Logger()->error("no encoder \"{}\" found", config.encoder);
        return {ClientError::UnknownEncoder, nullptr};
    }

    // 3. Build, then attach the socket once the object is complete
    try {
        std::unique_ptr<Client> client(new Client(std::move(config), std::move(adapter), std::move(encoder)));
        client->Use(std::move(socket));
        return {ClientError::Success, std::move(client)};
    } catch (const std::bad_alloc&) {
        return {ClientError::AllocationFailed, nullptr};
    }
}

Client::Client(ClientConfig config, std::shared_ptr<Adapter> adapter, std::shared_ptr<Encoder> encoder)
    : pimpl_(std::make_shared<Impl>(std::move(config), std::move(adapter), std::move(encoder)))
{
    auto initial = std::move(pimpl_->config_.channels);
    pimpl_->config_.channels.clear();
    for (auto& [name, handler] : initial) {
        Subscribe(name, std::move(handler));
    }
}

Client::~Client() {
    Destroy();

    // Tear channels down while the rest of Impl is intact; each waits for
    // its in-flight flush, which may still call Emit()
    std::unordered_map<std::string, std::unique_ptr<Channel>> channels;
    {
        std::unique_lock lock(pimpl_->channels_mutex_);
        channels.swap(pimpl_->channels_);
    }
    channels.clear();
}

Client& Client::Subscribe(std::string_view name, HandlerPtr handler, const BundlerOverrides& options) {
    Channel& channel = pimpl_->Acquire(*this, name, options);
    if (handler) {
        channel.AddHandler(std::move(handler));
    }
    return *this;
}

Client& Client::Unsubscribe(std::string_view name, const HandlerPtr& handler) {
    if (Channel* channel = pimpl_->Find(name)) {
        channel->RemoveHandler(handler);
    }
    return *this;
}

Client& Client::Use(std::shared_ptr<Socket> socket) {
    if (IsConnected()) {
        Logger()->debug("disconnecting current socket");
        pimpl_->adapter_->Disconnect(*this);
    }

    auto created = pimpl_->adapter_->CreateSocket(*this, std::move(socket));
    {
        std::lock_guard lock(pimpl_->socket_mutex_);
        pimpl_->socket_ = std::move(created);
    }
    return *this;
}

Client& Client::Send(std::string_view name, Packet payload) {
    pimpl_->Acquire(*this, name, {}).Send(std::move(payload));
    return *this;
}

Client& Client::SendOnce(std::string_view name, Packet payload) {
    pimpl_->Acquire(*this, name, {}).SendOnce(std::move(payload));
    return *this;
}

Client& Client::SendNow(std::string_view name, Packet payload) {
    pimpl_->Acquire(*this, name, {}).SendNow(std::move(payload));
    return *this;
}

void Client::Destroy() {
    pimpl_->adapter_->Disconnect(*this);
    {
        std::lock_guard lock(pimpl_->socket_mutex_);
        pimpl_->socket_.reset();
    }
    for (Channel* channel : pimpl_->Channels()) {
        channel->ResetBundler();
    }
}

void Client::HandleError(const TransportError& error) noexcept {
    pimpl_->ReportError(error);
}

void Client::HandleConnect(std::shared_ptr<Socket> socket) {
    if (socket) {
        std::lock_guard lock(pimpl_->socket_mutex_);
        pimpl_->socket_ = socket;
    }
    Logger()->info("{} connection established", pimpl_->Side());
    Notify(pimpl_->Listeners(pimpl_->connect_listeners_), "connect", socket);

    // Resume bundlers stalled while disconnected
    for (Channel* channel : pimpl_->Channels()) {
        if (channel->PendingCount() > 0) {
            channel->StartBundler();
        }
    }
}

void Client::HandleDisconnect() {
    Logger()->warn("{} connection lost", pimpl_->Side());
    Notify(pimpl_->Listeners(pimpl_->disconnect_listeners_), "disconnect");
    std::lock_guard lock(pimpl_->socket_mutex_);
    pimpl_->socket_.reset();
}

void Client::HandleRequest(std::span<const uint8_t> bytes) {
    auto frame = pimpl_->encoder_->Decode(bytes);
    if (!frame) {
        pimpl_->frames_dropped_.fetch_add(1, std::memory_order_relaxed);
        Logger()->debug("dropped undecodable frame ({} bytes)", bytes.size());
        return;
    }

    Channel* channel = pimpl_->Find(frame->channel);
    if (!channel) {
        pimpl_->frames_dropped_.fetch_add(1, std::memory_order_relaxed);
        Logger()->debug("dropped frame for unknown channel \"{}\"", frame->channel);
        return;
    }

    pimpl_->frames_received_.fetch_add(1, std::memory_order_relaxed);
    pimpl_->packets_received_.fetch_add(frame->packets.size(), std::memory_order_relaxed);
    channel->HandleData(frame->packets);
}

bool Client::Emit(const std::string& channel, std::vector<Packet>&& packets) {
    // A handler reached through Send() may destroy this client
    const std::shared_ptr<Impl> impl = pimpl_;

    std::shared_ptr<Socket> socket;
    {
        std::lock_guard lock(impl->socket_mutex_);
        socket = impl->socket_;
    }
    if (!socket) {
        return false;
    }

    const size_t count = packets.size();
    std::vector<uint8_t> bytes;
    try {
        bytes = impl->encoder_->Encode(Frame{channel, std::move(packets)});
        if (bytes.empty()) {
            Logger()->warn("encoder \"{}\" could not encode {} packet(s) on \"{}\"",
                           impl->config_.encoder, count, channel);
            return true;
        }
        impl->adapter_->Send(socket, bytes);
    } catch (const std::exception& e) {
        impl->ReportError({std::make_error_code(std::errc::io_error), e.what()});
        return true;
    } catch (...) {
        impl->ReportError({std::make_error_code(std::errc::io_error), "non-standard exception while sending"});
        return true;
    }

    impl->frames_sent_.fetch_add(1, std::memory_order_relaxed);
    impl->packets_sent_.fetch_add(count, std::memory_order_relaxed);
    impl->bytes_sent_.fetch_add(bytes.size(), std::memory_order_relaxed);

    if (impl->config_.stats) {
        StatsLogger()->info("{{\"packets\":{},\"bytes\":{}}}", count, bytes.size());
    }
    return true;
}

Client::ListenerId Client::OnConnect(ConnectListener listener) {
    return pimpl_->AddListener(pimpl_->connect_listeners_, std::move(listener));
}

Client::ListenerId Client::OnDisconnect(DisconnectListener listener) {
    return pimpl_->AddListener(pimpl_->disconnect_listeners_, std::move(listener));
}

Client::ListenerId Client::OnError(ErrorListener listener) {
    return pimpl_->AddListener(pimpl_->error_listeners_, std::move(listener));
}

bool Client::RemoveListener(ListenerId id) noexcept {
    std::lock_guard lock(pimpl_->listeners_mutex_);
    return pimpl_->connect_listeners_.erase(id) > 0
        || pimpl_->disconnect_listeners_.erase(id) > 0
        || pimpl_->error_listeners_.erase(id) > 0;
}

const std::string& Client::Id() const noexcept {
    return pimpl_->id_;
}

const ClientConfig& Client::Config() const noexcept {
    return pimpl_->config_;
}

bool Client::IsFromServer() const noexcept {
    return pimpl_->from_server_;
}

std::shared_ptr<Socket> Client::GetSocket() const {
    std::lock_guard lock(pimpl_->socket_mutex_);
    return pimpl_->socket_;
}

bool Client::IsConnected() const noexcept {
    std::lock_guard lock(pimpl_->socket_mutex_);
    return pimpl_->socket_ != nullptr;
}

Channel* Client::GetChannel(std::string_view name) const noexcept {
    return pimpl_->Find(name);
}

size_t Client::ChannelCount() const noexcept {
    std::shared_lock lock(pimpl_->channels_mutex_);
    return pimpl_->channels_.size();
}

Client::Stats Client::GetStats() const noexcept {
    return Stats{
        .frames_sent = pimpl_->frames_sent_.load(std::memory_order_relaxed),
        .packets_sent = pimpl_->packets_sent_.load(std::memory_order_relaxed),
        .bytes_sent = pimpl_->bytes_sent_.load(std::memory_order_relaxed),
        .frames_received = pimpl_->frames_received_.load(std::memory_order_relaxed),
        .packets_received = pimpl_->packets_received_.load(std::memory_order_relaxed),
        .frames_dropped = pimpl_->frames_dropped_.load(std::memory_order_relaxed)
    };
}

} // namespace muxbus
