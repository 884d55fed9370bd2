#include "muxbus/adapter.hpp"
#include "muxbus/encoder.hpp"
#include "muxbus/log.hpp"
#include "muxbus/adapters/inproc_adapter.hpp"
#include "muxbus/encoders/binary_encoder.hpp"
#include <atomic>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace muxbus {

namespace {

// Name -> implementation table shared by both registries
template<typename T>
class NamedTable {
public:
    bool Register(std::string_view kind, std::string_view name, std::shared_ptr<T> entry) {
        if (name.empty() || !entry) {
            return false;
        }

        std::unique_lock lock(mutex_);
        auto [it, inserted] = entries_.insert_or_assign(std::string(name), std::move(entry));
        Logger()->debug("{} \"{}\" {}", kind, it->first, inserted ? "registered" : "replaced");
        return true;
    }

    bool Unregister(std::string_view name) noexcept {
        std::unique_lock lock(mutex_);
        return entries_.erase(std::string(name)) > 0;
    }

    std::shared_ptr<T> Resolve(std::string_view name) const noexcept {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(std::string(name));
        return it == entries_.end() ? nullptr : it->second;
    }

    bool Has(std::string_view name) const noexcept {
        std::shared_lock lock(mutex_);
        return entries_.contains(std::string(name));
    }

    // Distinct entries (one implementation may sit under several names)
    std::vector<std::shared_ptr<T>> Snapshot() const {
        std::shared_lock lock(mutex_);
        std::unordered_set<T*> seen;
        std::vector<std::shared_ptr<T>> result;
        for (const auto& [name, entry] : entries_) {
            if (seen.insert(entry.get()).second) {
                result.push_back(entry);
            }
        }
        return result;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<T>> entries_;
};

} // namespace

// ============================================================================
// AdapterRegistry
// ============================================================================

struct AdapterRegistry::Impl {
    NamedTable<Adapter> table_;
};

AdapterRegistry::AdapterRegistry()
    : pimpl_(std::make_unique<Impl>())
{
    pimpl_->table_.Register("adapter", "inproc", InprocAdapter::Default());
}

AdapterRegistry::~AdapterRegistry() = default;

AdapterRegistry& AdapterRegistry::Instance() noexcept {
    // Never destroyed: sockets and clients living in static storage may
    // still call into registered adapters during static destruction.
    static AdapterRegistry* instance = new AdapterRegistry();
    return *instance;
}

bool AdapterRegistry::Register(std::string_view name, std::shared_ptr<Adapter> adapter) {
    return pimpl_->table_.Register("adapter", name, std::move(adapter));
}

bool AdapterRegistry::Unregister(std::string_view name) noexcept {
    return pimpl_->table_.Unregister(name);
}

std::shared_ptr<Adapter> AdapterRegistry::Resolve(std::string_view name) const noexcept {
    return pimpl_->table_.Resolve(name);
}

bool AdapterRegistry::Has(std::string_view name) const noexcept {
    return pimpl_->table_.Has(name);
}

void AdapterRegistry::StopAll(std::function<void()> done) {
    const auto adapters = pimpl_->table_.Snapshot();
    if (adapters.empty()) {
        if (done) {
            done();
        }
        return;
    }

    // Last adapter to report back fires `done`
    auto remaining = std::make_shared<std::atomic<size_t>>(adapters.size());
    auto finish = std::make_shared<std::function<void()>>(std::move(done));

    for (const auto& adapter : adapters) {
        adapter->Stop([remaining, finish]() {
            if (remaining->fetch_sub(1, std::memory_order_acq_rel) == 1 && *finish) {
                (*finish)();
            }
        });
    }
}

// ============================================================================
// EncoderRegistry
// ============================================================================

struct EncoderRegistry::Impl {
    NamedTable<Encoder> table_;
};

EncoderRegistry::EncoderRegistry()
    : pimpl_(std::make_unique<Impl>())
{
    pimpl_->table_.Register("encoder", "binary", std::make_shared<BinaryEncoder>());
}

EncoderRegistry::~EncoderRegistry() = default;

EncoderRegistry& EncoderRegistry::Instance() noexcept {
    static EncoderRegistry* instance = new EncoderRegistry();
    return *instance;
}

bool EncoderRegistry::Register(std::string_view name, std::shared_ptr<Encoder> encoder) {
    return pimpl_->table_.Register("encoder", name, std::move(encoder));
}

bool EncoderRegistry::Unregister(std::string_view name) noexcept {
    return pimpl_->table_.Unregister(name);
}

std::shared_ptr<Encoder> EncoderRegistry::Resolve(std::string_view name) const noexcept {
    return pimpl_->table_.Resolve(name);
}

bool EncoderRegistry::Has(std::string_view name) const noexcept {
    return pimpl_->table_.Has(name);
}

} // namespace muxbus
