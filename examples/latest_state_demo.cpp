// examples/latest_state_demo.cpp
/**
 * @file latest_state_demo.cpp
 * @brief Demonstrates Send() vs SendOnce() for a fast-changing value
 *
 * A position is updated 100 times faster than the bundler flushes.
 * - Send(): every update is queued and delivered (FIFO, one frame per flush)
 * - SendOnce(): each update replaces the pending one; only the latest value
 *   per flush reaches the peer
 *
 * Deterministic: bundlers run on a ManualScheduler, so "time" only moves
 * when the demo advances it.
 */

#include <muxbus/muxbus.hpp>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr uint16_t PORT = 4100;

struct Receiver {
    size_t packets = 0;
    std::string last;
};

// Connect a client to the listener on PORT, counting what the peer receives
std::unique_ptr<muxbus::Client> Connect(std::shared_ptr<muxbus::ManualScheduler> scheduler) {
    muxbus::ClientConfig config;
    config.port = PORT;
    config.bundler.every = std::chrono::milliseconds(100);
    config.scheduler = std::move(scheduler);

    auto [error, client] = muxbus::Client::Create(config);
    if (error != muxbus::ClientError::Success || !client->IsConnected()) {
        std::cerr << "Error: could not connect (" << muxbus::ToString(error) << ")\n";
        return nullptr;
    }
    return std::move(client);
}

void Report(const char* label, const Receiver& receiver, const muxbus::Client& client) {
    const auto stats = client.GetStats();
    std::cout << label << ": peer received " << receiver.packets << " packets in "
              << stats.frames_sent << " frames (" << stats.bytes_sent << " bytes), last = "
              << receiver.last << "\n";
}

} // namespace

int main() {
    std::cout << "=== MuxBus Latest-State Demo ===\n\n";

    // Server: one session per connection, each reporting into `receiver`
    Receiver receiver;
    std::unique_ptr<muxbus::Client> session;
    auto inproc = muxbus::InprocAdapter::Default();
    const bool listening = inproc->Listen(PORT, [&](std::shared_ptr<muxbus::Socket> socket) {
        muxbus::ClientConfig config;
        config.port = PORT;
        config.tick = std::make_shared<muxbus::Tick>();
        config.channels.emplace_back("position", muxbus::MakeHandler([&](const muxbus::Packet& packet) {
            ++receiver.packets;
            receiver.last.assign(packet.begin(), packet.end());
        }));

        auto [error, created] = muxbus::Client::Create(config, std::move(socket));
        if (error == muxbus::ClientError::Success) {
            session = std::move(created);
        }
    });
    if (!listening) {
        std::cerr << "Error: port " << PORT << " already in use\n";
        return 1;
    }

    auto scheduler = std::make_shared<muxbus::ManualScheduler>();

    // Scenario 1: queue every update
    {
        receiver = {};
        auto client = Connect(scheduler);
        if (!client) {
            return 1;
        }
        for (int step = 0; step < 1000; ++step) {
            client->Send("position", muxbus::MakePacket("x=" + std::to_string(step)));
            scheduler->AdvanceBy(std::chrono::milliseconds(1));
        }
        scheduler->AdvanceBy(std::chrono::milliseconds(100));
        Report("Send()    ", receiver, *client);
    }

    // Scenario 2: keep only the latest update
    {
        receiver = {};
        auto client = Connect(scheduler);
        if (!client) {
            return 1;
        }
        for (int step = 0; step < 1000; ++step) {
            client->SendOnce("position", muxbus::MakePacket("x=" + std::to_string(step)));
            scheduler->AdvanceBy(std::chrono::milliseconds(1));
        }
        scheduler->AdvanceBy(std::chrono::milliseconds(100));
        Report("SendOnce()", receiver, *client);
    }

    std::cout << "\nSendOnce() trades intermediate values for bandwidth; the final\n"
              << "state is identical.\n";

    inproc->Unlisten(PORT);
    session.reset();

    std::cout << "\n=== Demo completed ===\n";
    return 0;
}
