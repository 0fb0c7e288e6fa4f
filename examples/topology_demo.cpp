// topology_demo.cpp -- Config-driven multi-channel topology.
// Loads the channel layout from an INI / JSON / YAML file (falls back to a
// built-in layout), runs one producer per channel and two consumers, then
// freezes, unfreezes and removes channels while traffic flows.
//
// Usage: topology_demo [topology.ini|.json|.yaml]

#include "mch/builder.hpp"
#include "mch/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#ifndef MCH_TOPOLOGY_DEFAULT_PATH
#define MCH_TOPOLOGY_DEFAULT_PATH "examples/topology.ini"
#endif

// Message definitions -------------------------------------------------------

struct Event {
  uint32_t source;
  uint32_t seq;
};

using Set = mch::ChannelSet<Event, int>;

static constexpr uint32_t kMaxChannels = 16U;
static constexpr uint32_t kMessagesPerProducer = 2000U;

// Atomic counters -----------------------------------------------------------

static std::atomic<uint32_t> g_sent[kMaxChannels];
static std::atomic<uint32_t> g_recv[kMaxChannels];
static std::atomic<uint32_t> g_rejected[kMaxChannels];

static Set DefaultTopology() {
  mch::RegistryConfig cfg;
  cfg.name = "topology";
  cfg.seed = 1U;
  return mch::ChannelSetBuilder<Event, int>()
      .WithConfig(cfg)
      .Add({"control", 10, 1U, 4U, false})
      .Add({"telemetry_a", 5, 1U, 64U, false})
      .Add({"telemetry_b", 5, 3U, 64U, false})
      .Add({"bulk", 1, 1U, {}, false})
      .Add({"spare", 1, 1U, {}, true})
      .Build();
}

static void SleepMs(int ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

int main(int argc, char* argv[]) {
  const char* path = (argc > 1) ? argv[1] : MCH_TOPOLOGY_DEFAULT_PATH;

  auto loaded = mch::LoadChannelSetFile<Event, int>(path);
  if (!loaded) {
    MCH_LOG_WARN("topology", "using built-in layout (%s: %s)", path,
                 mch::ConfigErrorToString(loaded.get_error()));
  }
  Set set = loaded ? std::move(loaded).value() : DefaultTopology();

  const size_t channel_count = set.senders.size();
  if (channel_count == 0U || channel_count > kMaxChannels) {
    MCH_LOG_ERROR("topology", "need 1..%u channels, got %zu",
                  static_cast<unsigned>(kMaxChannels), channel_count);
    return 1;
  }
  MCH_LOG_INFO("topology", "%zu channel(s) on %zu priority level(s)",
               channel_count, set.receiver.PriorityLevelCount());

  mch::CancelToken stop = set.receiver.MakeCancelToken();

  // Consumers: stop only when cancelled.
  std::vector<std::thread> consumers;
  for (int c = 0; c < 2; ++c) {
    consumers.emplace_back([rx = set.receiver, stop]() mutable {
      for (;;) {
        auto r = rx.Receive(stop);
        if (!r) break;
        g_recv[r.value().source].fetch_add(1, std::memory_order_relaxed);
      }
    });
  }

  // Producers: one per channel, give up when the channel goes away.
  std::vector<std::thread> producers;
  for (size_t i = 0; i < channel_count; ++i) {
    producers.emplace_back([tx = set.senders[i], i]() mutable {
      for (uint32_t seq = 0; seq < kMessagesPerProducer; ++seq) {
        auto r = tx.Send(Event{static_cast<uint32_t>(i), seq});
        if (!r) {
          g_rejected[i].fetch_add(kMessagesPerProducer - seq,
                                  std::memory_order_relaxed);
          break;
        }
        g_sent[i].fetch_add(1, std::memory_order_relaxed);
      }
    });
  }

  // Runtime topology changes.
  mch::Sender<Event, int>* bulk = set.Find("bulk");
  if (bulk != nullptr) {
    SleepMs(5);
    if (bulk->Freeze()) {
      MCH_LOG_INFO("topology", "bulk frozen, backlog=%zu", bulk->QueueLength());
    }
    SleepMs(20);
    if (bulk->Unfreeze()) {
      MCH_LOG_INFO("topology", "bulk unfrozen, backlog=%zu",
                   bulk->QueueLength());
    }
  }

  mch::Sender<Event, int>* spare = set.Find("spare");
  if (spare != nullptr) {
    SleepMs(5);
    auto removed = set.receiver.RemoveChannel(*spare);
    if (!removed) {
      MCH_LOG_WARN("topology", "remove spare: %s",
                   mch::ChannelErrorToString(removed.get_error()));
    }
  }

  for (auto& t : producers) t.join();

  // Drain every channel still attached and not frozen.
  for (int spins = 0; spins < 5000; ++spins) {
    size_t pending = 0U;
    for (auto& tx : set.senders) {
      auto frozen = tx.IsFrozen();
      if (frozen.has_value() && !frozen.value()) pending += tx.QueueLength();
    }
    if (pending == 0U) break;
    SleepMs(1);
  }

  stop.Cancel();
  for (auto& t : consumers) t.join();

  std::printf("%-14s %8s %8s %8s\n", "channel", "sent", "recv", "rejected");
  for (size_t i = 0; i < channel_count; ++i) {
    std::printf("%-14s %8u %8u %8u\n", set.names[i].c_str(),
                g_sent[i].load(), g_recv[i].load(), g_rejected[i].load());
  }

  auto st = set.receiver.GetStatistics();
  MCH_LOG_INFO("topology",
               "sent=%llu received=%llu discarded=%llu receive_waits=%llu "
               "send_waits=%llu",
               static_cast<unsigned long long>(st.messages_sent),
               static_cast<unsigned long long>(st.messages_received),
               static_cast<unsigned long long>(st.messages_discarded),
               static_cast<unsigned long long>(st.receive_waits),
               static_cast<unsigned long long>(st.send_waits));
  return 0;
}
