#include "muxbus/channel.hpp"
#include "muxbus/client.hpp"
#include "muxbus/log.hpp"
#include "muxbus/scheduler.hpp"
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <iterator>
#include <mutex>
#include <vector>

namespace muxbus {

namespace {

// Channel whose timer flush is running on this thread (if any)
thread_local const void* t_flushing = nullptr;

} // namespace

struct Channel::Impl : std::enable_shared_from_this<Channel::Impl> {
    const std::string name_;
    const BundlerConfig options_;
    Client& client_;
    Scheduler& scheduler_;

    mutable std::mutex mutex_;
    std::condition_variable drained_;
    std::vector<Packet> packets_;
    std::vector<HandlerPtr> handlers_;

    // Bundler state. `generation_` changes on every arm and reset; a timer
    // callback carrying an older generation is stale and does nothing.
    bool armed_ = false;
    uint64_t generation_ = 0;
    TimerId timer_ = INVALID_TIMER_ID;
    size_t flushing_ = 0;

    // Bumped by SendOnce(); a batch taken under an older value is superseded
    uint64_t replaced_ = 0;

    Impl(std::string name, BundlerConfig options, Client& client, Scheduler& scheduler)
        : name_(std::move(name))
        , options_(options)
        , client_(client)
        , scheduler_(scheduler)
    {
    }

    // PRECONDITION: mutex_ held, !armed_
    void ArmLocked();

    // PRECONDITION: mutex_ held. Returns the timer to cancel once unlocked.
    [[nodiscard]] TimerId DisarmLocked() noexcept;

    // Put back a batch Emit() found no socket for, ahead of newer packets
    void Requeue(std::vector<Packet> batch, uint64_t replaced);

    void OnTimer(uint64_t generation);
    void WaitForFlush() noexcept;
};

void Channel::Impl::ArmLocked() {
    armed_ = true;
    const uint64_t generation = ++generation_;
    std::weak_ptr<Impl> weak = weak_from_this();
    timer_ = scheduler_.ScheduleAfter(options_.every, [weak, generation]() {
        if (auto self = weak.lock()) {
            self->OnTimer(generation);
        }
    });
}

TimerId Channel::Impl::DisarmLocked() noexcept {
    armed_ = false;
    ++generation_;
    const TimerId timer = timer_;
    timer_ = INVALID_TIMER_ID;
    return timer;
}

void Channel::Impl::Requeue(std::vector<Packet> batch, uint64_t replaced) {
    std::lock_guard lock(mutex_);
    if (replaced != replaced_) {
        return;  // A SendOnce() replaced the queue meanwhile
    }
    packets_.insert(packets_.begin(),
                    std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));

    // Reconnected between Emit() and here: HandleConnect() may have missed us
    if (!armed_ && client_.IsConnected()) {
        ArmLocked();
    }
}

void Channel::Impl::OnTimer(uint64_t generation) {
    std::vector<Packet> batch;
    uint64_t replaced = 0;
    {
        std::lock_guard lock(mutex_);
        if (!armed_ || generation != generation_) {
            return;  // Reset or re-armed since scheduling
        }
        armed_ = false;
        timer_ = INVALID_TIMER_ID;

        // No socket: keep the queue for Client::HandleConnect()
        if (packets_.empty() || !client_.IsConnected()) {
            return;
        }
        batch.swap(packets_);
        replaced = replaced_;
        ++flushing_;
    }

    // Marks the flush finished even if Emit() throws
    struct FlushScope {
        Impl& impl;
        const void* previous;

        explicit FlushScope(Impl& owner) : impl(owner), previous(t_flushing) {
            t_flushing = &owner;
        }
        ~FlushScope() {
            t_flushing = previous;
            {
                std::lock_guard lock(impl.mutex_);
                --impl.flushing_;
            }
            impl.drained_.notify_all();
        }
    } scope(*this);

    if (!client_.Emit(name_, std::move(batch))) {
        Requeue(std::move(batch), replaced);
    }
}

void Channel::Impl::WaitForFlush() noexcept {
    if (t_flushing == this) {
        return;  // Torn down from inside our own flush
    }
    std::unique_lock lock(mutex_);
    drained_.wait(lock, [this]() { return flushing_ == 0; });
}

Channel::Channel(std::string name, BundlerConfig options, Client& client, Scheduler& scheduler)
    : pimpl_(std::make_shared<Impl>(std::move(name), options, client, scheduler))
{
}

Channel::~Channel() {
    ResetBundler();
    pimpl_->WaitForFlush();
}

const std::string& Channel::Name() const noexcept {
    return pimpl_->name_;
}

const BundlerConfig& Channel::Options() const noexcept {
    return pimpl_->options_;
}

void Channel::AddHandler(HandlerPtr handler) {
    if (!handler) {
        return;
    }
    std::lock_guard lock(pimpl_->mutex_);
    pimpl_->handlers_.push_back(std::move(handler));
}

bool Channel::RemoveHandler(const HandlerPtr& handler) noexcept {
    std::lock_guard lock(pimpl_->mutex_);
    auto& handlers = pimpl_->handlers_;
    auto it = std::find(handlers.begin(), handlers.end(), handler);
    if (it == handlers.end()) {
        return false;
    }
    handlers.erase(it);
    return true;
}

void Channel::Send(Packet payload) {
    std::vector<Packet> batch;
    uint64_t replaced = 0;
    TimerId stale = INVALID_TIMER_ID;
    {
        std::lock_guard lock(pimpl_->mutex_);
        pimpl_->packets_.push_back(std::move(payload));

        if (pimpl_->packets_.size() >= pimpl_->options_.max_packets && pimpl_->client_.IsConnected()) {
            // Full batch: flush now instead of waiting for the timer
            stale = pimpl_->DisarmLocked();
            batch.swap(pimpl_->packets_);
            replaced = pimpl_->replaced_;
        } else if (!pimpl_->armed_) {
            pimpl_->ArmLocked();
        }
    }

    if (stale != INVALID_TIMER_ID) {
        pimpl_->scheduler_.Cancel(stale);
    }
    if (!batch.empty()) {
        const std::shared_ptr<Impl> impl = pimpl_;
        if (!impl->client_.Emit(impl->name_, std::move(batch))) {
            impl->Requeue(std::move(batch), replaced);
        }
    }
}

void Channel::SendOnce(Packet payload) {
    std::lock_guard lock(pimpl_->mutex_);
    pimpl_->packets_.clear();
    pimpl_->packets_.push_back(std::move(payload));
    ++pimpl_->replaced_;
    if (!pimpl_->armed_) {
        pimpl_->ArmLocked();
    }
}

void Channel::SendNow(Packet payload) {
    std::vector<Packet> batch;
    batch.push_back(std::move(payload));
    if (!pimpl_->client_.Emit(pimpl_->name_, std::move(batch))) {
        Logger()->debug("no socket, dropping immediate packet on \"{}\"", pimpl_->name_);
    }
}

void Channel::StartBundler() {
    std::lock_guard lock(pimpl_->mutex_);
    if (!pimpl_->armed_) {
        pimpl_->ArmLocked();
    }
}

void Channel::ResetBundler() noexcept {
    TimerId timer = INVALID_TIMER_ID;
    {
        std::lock_guard lock(pimpl_->mutex_);
        timer = pimpl_->DisarmLocked();
    }
    // Outside the lock: Cancel() may wait for a callback that needs it
    if (timer != INVALID_TIMER_ID) {
        pimpl_->scheduler_.Cancel(timer);
    }
}

void Channel::HandleData(std::span<const Packet> packets) {
    // A handler may destroy the owning client, and this channel with it
    const std::shared_ptr<Impl> impl = pimpl_;

    // Snapshot so handlers may (un)subscribe while being called
    std::vector<HandlerPtr> handlers;
    {
        std::lock_guard lock(impl->mutex_);
        handlers = impl->handlers_;
    }

    for (const Packet& packet : packets) {
        for (const HandlerPtr& handler : handlers) {
            try {
                (*handler)(packet);
            } catch (const std::exception& e) {
                Logger()->error("handler on channel \"{}\" threw: {}", impl->name_, e.what());
            } catch (...) {
                Logger()->error("handler on channel \"{}\" threw a non-standard exception",
                                impl->name_);
            }
        }
    }
}

size_t Channel::PendingCount() const noexcept {
    std::lock_guard lock(pimpl_->mutex_);
    return pimpl_->packets_.size();
}

size_t Channel::HandlerCount() const noexcept {
    std::lock_guard lock(pimpl_->mutex_);
    return pimpl_->handlers_.size();
}

bool Channel::IsBundlerArmed() const noexcept {
    std::lock_guard lock(pimpl_->mutex_);
    return pimpl_->armed_;
}

} // namespace muxbus
