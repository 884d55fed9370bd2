// examples/basic_usage.cpp
/**
 * @file basic_usage.cpp
 * @brief Simple demonstration of MuxBus core features
 *
 * This example shows:
 * - Listening for inproc connections and adopting them server-side
 * - Creating a client with error handling
 * - Subscribing handlers to named channels
 * - Bundled sends, immediate sends and server replies on a Tick
 * - Clean shutdown
 */

#include <muxbus/muxbus.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::string Text(const muxbus::Packet& packet) {
    return std::string(packet.begin(), packet.end());
}

} // namespace

int main() {
    std::cout << "=== MuxBus Basic Usage Example ===\n\n";
    constexpr uint16_t PORT = 4000;

    // Step 1: Start a server on the in-process transport
    // Every accepted connection becomes a server-side client flushed by `tick`
    auto tick = std::make_shared<muxbus::Tick>();
    std::vector<std::unique_ptr<muxbus::Client>> sessions;

    auto inproc = muxbus::InprocAdapter::Default();
    const bool listening = inproc->Listen(PORT, [&](std::shared_ptr<muxbus::Socket> socket) {
        muxbus::ClientConfig config;
        config.port = PORT;
        config.tick = tick;

        auto [error, session] = muxbus::Client::Create(config, std::move(socket));
        if (error != muxbus::ClientError::Success) {
            std::cerr << "Server: could not adopt connection: " << muxbus::ToString(error) << "\n";
            return;
        }

        muxbus::Client* raw = session.get();
        session->Subscribe("chat", muxbus::MakeHandler([raw](const muxbus::Packet& packet) {
            std::cout << "  [server] chat: " << Text(packet) << "\n";
            raw->Send("echo", packet);
        }));
        sessions.push_back(std::move(session));
    });
    if (!listening) {
        std::cerr << "Error: port " << PORT << " already in use\n";
        return 1;
    }
    std::cout << "Step 1: Server listening on inproc port " << PORT << "\n";

    // Step 2: Create a client
    muxbus::ClientConfig config;
    config.port = PORT;
    config.bundler.every = std::chrono::milliseconds(20);

    auto [error, client] = muxbus::Client::Create(config);

    // Step 3: Handle potential errors
    if (error != muxbus::ClientError::Success) {
        switch (error) {
            case muxbus::ClientError::UnknownAdapter:
                std::cerr << "Error: adapter '" << config.adapter << "' is not registered\n";
                break;
            case muxbus::ClientError::UnknownEncoder:
                std::cerr << "Error: encoder '" << config.encoder << "' is not registered\n";
                break;
            case muxbus::ClientError::InvalidConfig:
                std::cerr << "Error: Invalid configuration\n";
                break;
            default:
                std::cerr << "Error: " << muxbus::ToString(error) << "\n";
        }
        return 1;
    }
    std::cout << "Step 2-3: Client " << client->Id().substr(0, 8) << "... connected\n\n";

    // Step 4: Subscribe to the server's echoes
    client->Subscribe("echo", muxbus::MakeHandler([](const muxbus::Packet& packet) {
        std::cout << "  [client] echo: " << Text(packet) << "\n";
    }));

    // Step 5: Bundled sends leave together after 20ms
    std::cout << "Step 5: Sending three chat lines (one frame)\n";
    client->Send("chat", muxbus::MakePacket("hello"))
          .Send("chat", muxbus::MakePacket("from"))
          .Send("chat", muxbus::MakePacket("muxbus"));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // Step 6: SendNow skips the bundler
    std::cout << "\nStep 6: Sending one urgent line\n";
    client->SendNow("chat", muxbus::MakePacket("urgent"));

    // Step 7: The server flushes its echoes on its own pulse
    std::cout << "\nStep 7: Server pulse\n";
    const size_t flushed = tick->Pulse();
    std::cout << "  flushed " << flushed << " channel(s)\n";

    // Step 8: Statistics
    const auto stats = client->GetStats();
    std::cout << "\nStep 8: Client sent " << stats.packets_sent << " packets in "
              << stats.frames_sent << " frames (" << stats.bytes_sent << " bytes), received "
              << stats.packets_received << " packets\n";

    // Step 9: Clean shutdown
    inproc->Unlisten(PORT);
    client.reset();
    sessions.clear();
    std::cout << "\nStep 9: Shut down\n";

    std::cout << "\n=== Example completed successfully ===\n";
    return 0;
}
