// bench/throughput_latency.cpp
// MuxBus Performance Benchmarks
//
// Codec throughput, bundling cost per packet, and end-to-end inproc
// latency of an unbundled send.

#include <benchmark/benchmark.h>
#include <muxbus/muxbus.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace {

// Transport that discards everything it is given
class NullAdapter final : public muxbus::Adapter {
public:
    std::shared_ptr<muxbus::Socket> CreateSocket(muxbus::Client&, std::shared_ptr<muxbus::Socket> existing) override {
        return existing ? existing : std::make_shared<muxbus::Socket>();
    }
    void Send(const std::shared_ptr<muxbus::Socket>&, std::span<const uint8_t> bytes) override {
        benchmark::DoNotOptimize(bytes.data());
    }
    void Disconnect(muxbus::Client&) override {}
    void Stop(StopCallback done) override {
        if (done) {
            done();
        }
    }
};

const bool null_adapter_registered =
    muxbus::AdapterRegistry::Instance().Register("bench-null", std::make_shared<NullAdapter>());

} // namespace

// Encode: one frame of 64 packets, varying packet size
static void BM_Encode(benchmark::State& state) {
    muxbus::BinaryEncoder codec;
    const size_t packet_size = state.range(0);
    muxbus::Frame frame{"bench", std::vector<muxbus::Packet>(64, muxbus::Packet(packet_size, 0xAB))};

    for (auto _ : state) {
        auto bytes = codec.Encode(frame);
        benchmark::DoNotOptimize(bytes.data());
    }

    state.SetBytesProcessed(state.iterations() * 64 * packet_size);
}
BENCHMARK(BM_Encode)->Arg(16)->Arg(256)->Arg(4096);

// Decode: same frames as BM_Encode
static void BM_Decode(benchmark::State& state) {
    muxbus::BinaryEncoder codec;
    const size_t packet_size = state.range(0);
    const auto bytes = codec.Encode(
        muxbus::Frame{"bench", std::vector<muxbus::Packet>(64, muxbus::Packet(packet_size, 0xAB))});

    for (auto _ : state) {
        auto frame = codec.Decode(bytes);
        benchmark::DoNotOptimize(frame);
    }

    state.SetBytesProcessed(state.iterations() * bytes.size());
}
BENCHMARK(BM_Decode)->Arg(16)->Arg(256)->Arg(4096);

// Bundling: queue `batch` packets, then flush them as one frame
static void BM_BundledSend(benchmark::State& state) {
    if (!null_adapter_registered) {
        state.SkipWithError("Failed to register null adapter");
        return;
    }

    auto scheduler = std::make_shared<muxbus::ManualScheduler>();
    muxbus::ClientConfig config;
    config.adapter = "bench-null";
    config.bundler.every = std::chrono::milliseconds(1);
    config.bundler.max_packets = 1'048'576;
    config.scheduler = scheduler;

    auto [error, client] = muxbus::Client::Create(config);
    if (error != muxbus::ClientError::Success) {
        state.SkipWithError("Failed to create client");
        return;
    }

    const int64_t batch = state.range(0);
    const muxbus::Packet payload(64, 0xAB);

    for (auto _ : state) {
        for (int64_t i = 0; i < batch; ++i) {
            client->Send("bench", payload);
        }
        scheduler->AdvanceBy(std::chrono::milliseconds(1));
    }

    state.SetItemsProcessed(state.iterations() * batch);
    state.counters["frames"] = static_cast<double>(client->GetStats().frames_sent);
}
BENCHMARK(BM_BundledSend)->Arg(1)->Arg(16)->Arg(256);

// Latency: SendNow() over inproc, measured until the peer's handler runs
static void BM_InprocSendNowLatency(benchmark::State& state) {
    constexpr uint16_t PORT = 43001;
    auto inproc = muxbus::InprocAdapter::Default();

    std::atomic<size_t> delivered{0};
    std::unique_ptr<muxbus::Client> session;
    const bool listening = inproc->Listen(PORT, [&](std::shared_ptr<muxbus::Socket> socket) {
        muxbus::ClientConfig config;
        config.port = PORT;
        config.tick = std::make_shared<muxbus::Tick>();
        config.channels.emplace_back("ping", muxbus::MakeHandler([&](const muxbus::Packet&) {
            delivered.fetch_add(1, std::memory_order_relaxed);
        }));
        auto [error, created] = muxbus::Client::Create(config, std::move(socket));
        if (error == muxbus::ClientError::Success) {
            session = std::move(created);
        }
    });
    if (!listening) {
        state.SkipWithError("Port already in use");
        return;
    }

    muxbus::ClientConfig config;
    config.port = PORT;
    config.scheduler = std::make_shared<muxbus::ManualScheduler>();
    auto [error, client] = muxbus::Client::Create(config);
    if (error != muxbus::ClientError::Success || !session) {
        inproc->Unlisten(PORT);
        state.SkipWithError("Failed to connect");
        return;
    }

    const muxbus::Packet payload(state.range(0), 0xCD);
    for (auto _ : state) {
        client->SendNow("ping", payload);
    }

    state.counters["delivered"] = static_cast<double>(delivered.load());
    inproc->Unlisten(PORT);
    client.reset();
    session.reset();
}
BENCHMARK(BM_InprocSendNowLatency)->Arg(64)->Arg(1024);

BENCHMARK_MAIN();
