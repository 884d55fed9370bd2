// tests/integration/test_end_to_end.cpp
#include <gtest/gtest.h>
#include <muxbus/muxbus.hpp>
#include "test_support.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using muxbus::Client;
using muxbus::ClientConfig;
using muxbus::ClientError;
using muxbus::MakePacket;
using muxbus::testing::Collect;

namespace {

// Accepts inproc connections on one port and keeps a server-side client
// per connection, all flushed by a shared Tick
class InprocServer {
public:
    explicit InprocServer(uint16_t port) : port_(port) {}

    ~InprocServer() {
        muxbus::InprocAdapter::Default()->Unlisten(port_);
    }

    // Handlers attached to every session at construction
    void Route(std::string channel, muxbus::Channel::HandlerPtr handler) {
        routes_.emplace_back(std::move(channel), std::move(handler));
    }

    bool Start() {
        return muxbus::InprocAdapter::Default()->Listen(port_, [this](std::shared_ptr<muxbus::Socket> socket) {
            ClientConfig config;
            config.port = port_;
            config.tick = tick;
            config.channels = routes_;

            auto [error, session] = Client::Create(config, std::move(socket));
            ASSERT_EQ(error, ClientError::Success);
            session->OnDisconnect([this]() { ++disconnects; });
            sessions.push_back(std::move(session));
        });
    }

    std::shared_ptr<muxbus::Tick> tick = std::make_shared<muxbus::Tick>();
    std::vector<std::unique_ptr<Client>> sessions;
    int disconnects = 0;

private:
    uint16_t port_;
    std::vector<std::pair<std::string, muxbus::Channel::HandlerPtr>> routes_;
};

ClientConfig ClientOn(uint16_t port, std::shared_ptr<muxbus::Scheduler> scheduler) {
    ClientConfig config;
    config.port = port;
    config.bundler.every = 50ms;
    config.scheduler = std::move(scheduler);
    return config;
}

} // namespace

// Two sends within one 50ms interval arrive as a single ordered delivery
TEST(IntegrationTest, BundledScoresArriveTogether) {
    auto scores = std::make_shared<std::vector<std::string>>();
    InprocServer server(41001);
    server.Route("scores", Collect(scores));
    ASSERT_TRUE(server.Start());

    auto scheduler = std::make_shared<muxbus::ManualScheduler>();
    auto [error, client] = Client::Create(ClientOn(41001, scheduler));
    ASSERT_EQ(error, ClientError::Success);
    ASSERT_TRUE(client->IsConnected());
    ASSERT_EQ(server.sessions.size(), 1u);
    EXPECT_TRUE(server.sessions[0]->IsFromServer());

    client->Send("scores", MakePacket("{\"a\":1}"));
    scheduler->AdvanceBy(10ms);
    client->Send("scores", MakePacket("{\"a\":2}"));

    scheduler->AdvanceBy(39ms);
    EXPECT_TRUE(scores->empty());

    scheduler->AdvanceBy(1ms);
    EXPECT_EQ(*scores, (std::vector<std::string>{"{\"a\":1}", "{\"a\":2}"}));
    EXPECT_EQ(server.sessions[0]->GetStats().frames_received, 1u);

    // Nothing further is delivered later
    scheduler->AdvanceBy(1000ms);
    EXPECT_EQ(scores->size(), 2u);
}

// Server-side replies flush on the server's pulse
TEST(IntegrationTest, ServerRepliesOnTick) {
    InprocServer server(41002);
    ASSERT_TRUE(server.Start());

    auto replies = std::make_shared<std::vector<std::string>>();
    auto scheduler = std::make_shared<muxbus::ManualScheduler>();
    auto [error, client] = Client::Create(ClientOn(41002, scheduler));
    ASSERT_EQ(error, ClientError::Success);
    client->Subscribe("reply", Collect(replies));
    ASSERT_EQ(server.sessions.size(), 1u);

    auto& session = *server.sessions[0];
    session.SendOnce("reply", MakePacket("stale")).SendOnce("reply", MakePacket("fresh"));
    EXPECT_TRUE(replies->empty());

    EXPECT_EQ(server.tick->Pulse(), 1u);
    EXPECT_EQ(*replies, (std::vector<std::string>{"fresh"}));
}

// Several clients on one server share its pulse
TEST(IntegrationTest, ManyClientsOneTick) {
    InprocServer server(41003);
    ASSERT_TRUE(server.Start());

    auto scheduler = std::make_shared<muxbus::ManualScheduler>();
    std::vector<std::unique_ptr<Client>> clients;
    std::vector<std::shared_ptr<std::vector<std::string>>> inboxes;
    for (int i = 0; i < 4; ++i) {
        auto [error, client] = Client::Create(ClientOn(41003, scheduler));
        ASSERT_EQ(error, ClientError::Success);
        inboxes.push_back(std::make_shared<std::vector<std::string>>());
        client->Subscribe("news", Collect(inboxes.back()));
        clients.push_back(std::move(client));
    }
    ASSERT_EQ(server.sessions.size(), 4u);

    for (auto& session : server.sessions) {
        session->Send("news", MakePacket("headline"));
    }
    EXPECT_EQ(server.tick->Pending(), 4u);
    EXPECT_EQ(server.tick->Pulse(), 4u);

    for (const auto& inbox : inboxes) {
        EXPECT_EQ(*inbox, (std::vector<std::string>{"headline"}));
    }
}

// Destroying the client disconnects both ends
TEST(IntegrationTest, DestroyDisconnectsPeer) {
    InprocServer server(41004);
    ASSERT_TRUE(server.Start());

    auto scheduler = std::make_shared<muxbus::ManualScheduler>();
    auto [error, client] = Client::Create(ClientOn(41004, scheduler));
    ASSERT_EQ(error, ClientError::Success);
    ASSERT_EQ(server.sessions.size(), 1u);

    int client_disconnects = 0;
    client->OnDisconnect([&]() { ++client_disconnects; });

    client->Destroy();
    EXPECT_FALSE(client->IsConnected());
    EXPECT_FALSE(server.sessions[0]->IsConnected());
    EXPECT_EQ(client_disconnects, 1);
    EXPECT_EQ(server.disconnects, 1);

    // Idempotent
    client->Destroy();
    EXPECT_EQ(client_disconnects, 1);
    EXPECT_EQ(server.disconnects, 1);
}

// Destroying a session waits for a delivery into it running on the
// sender's thread
TEST(IntegrationTest, DestroyWaitsForInFlightDelivery) {
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    std::atomic<bool> finished{false};

    InprocServer server(41007);
    server.Route("slow", muxbus::MakeHandler([&](const muxbus::Packet&) {
        entered = true;
        while (!release) {
            std::this_thread::sleep_for(1ms);
        }
        finished = true;
    }));
    ASSERT_TRUE(server.Start());

    auto scheduler = std::make_shared<muxbus::ManualScheduler>();
    auto [error, created] = Client::Create(ClientOn(41007, scheduler));
    ASSERT_EQ(error, ClientError::Success);
    ASSERT_EQ(server.sessions.size(), 1u);
    std::unique_ptr<Client> client = std::move(created);

    std::thread sender([&client]() { client->SendNow("slow", MakePacket("x")); });

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!entered && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(entered);

    std::atomic<bool> destroyed{false};
    std::thread destroyer([&server, &destroyed]() {
        server.sessions[0].reset();
        destroyed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(destroyed);

    release = true;
    destroyer.join();
    sender.join();

    EXPECT_TRUE(destroyed);
    EXPECT_TRUE(finished);
    EXPECT_FALSE(client->IsConnected());
    EXPECT_EQ(server.disconnects, 1);
}

// Reconnecting through Use() opens a fresh session and resumes the queue
TEST(IntegrationTest, ReconnectResumesQueue) {
    auto scores = std::make_shared<std::vector<std::string>>();
    InprocServer server(41005);
    server.Route("scores", Collect(scores));
    ASSERT_TRUE(server.Start());

    auto scheduler = std::make_shared<muxbus::ManualScheduler>();
    auto [error, client] = Client::Create(ClientOn(41005, scheduler));
    ASSERT_EQ(error, ClientError::Success);

    server.sessions[0]->Destroy();
    EXPECT_FALSE(client->IsConnected());

    client->Send("scores", MakePacket("1")).Send("scores", MakePacket("2"));
    scheduler->AdvanceBy(50ms);
    EXPECT_TRUE(scores->empty());

    client->Use();
    ASSERT_TRUE(client->IsConnected());
    ASSERT_EQ(server.sessions.size(), 2u);

    scheduler->AdvanceBy(50ms);
    EXPECT_EQ(*scores, (std::vector<std::string>{"1", "2"}));
}

// No listener: construction succeeds but the client stays disconnected
TEST(IntegrationTest, ConnectionRefused) {
    auto scheduler = std::make_shared<muxbus::ManualScheduler>();
    auto [error, client] = Client::Create(ClientOn(41999, scheduler));
    ASSERT_EQ(error, ClientError::Success);
    EXPECT_FALSE(client->IsConnected());

    int errors = 0;
    client->OnError([&](const muxbus::TransportError& e) {
        EXPECT_EQ(e.code, std::make_error_code(std::errc::connection_refused));
        ++errors;
    });
    client->Use();
    EXPECT_EQ(errors, 1);
    EXPECT_FALSE(client->IsConnected());
}

// A second listener on the same port is refused
TEST(IntegrationTest, ListenTwice) {
    InprocServer first(41006);
    ASSERT_TRUE(first.Start());

    InprocServer second(41006);
    EXPECT_FALSE(second.Start());
    EXPECT_TRUE(muxbus::InprocAdapter::Default()->IsListening(41006));
}
