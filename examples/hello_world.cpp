// hello_world.cpp -- Minimal multi-channel demo.
// A high priority shutdown channel preempts two weighted low priority
// data channels that still hold a backlog.

#include "mch/log.hpp"
#include "mch/receiver.hpp"

#include <cstdint>
#include <cstdio>
#include <type_traits>
#include <variant>

// Message definitions -------------------------------------------------------

struct Shutdown {};

struct IntegerData {
  int32_t value;
};

struct FloatingData {
  float value;
};

using Msg = std::variant<Shutdown, IntegerData, FloatingData>;

enum class Priority : uint8_t { kLow = 0, kHigh = 1 };

static void Print(const Msg& msg) {
  std::visit(
      [](const auto& m) {
        using M = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<M, IntegerData>) {
          std::printf("  IntegerData(%d)\n", static_cast<int>(m.value));
        } else if constexpr (std::is_same_v<M, FloatingData>) {
          std::printf("  FloatingData(%.2f)\n", static_cast<double>(m.value));
        } else {
          std::printf("  Shutdown\n");
        }
      },
      msg);
}

int main() {
  mch::log::SetLevel(mch::log::Level::kInfo);
  auto rx = mch::NewRegistry<Msg, Priority>();

  // Unfrozen, high priority, dummy weight, capacity 1.
  auto shutdown_tx = rx.NewChannel(Priority::kHigh, 1U, false, 1U);

  // Same priority: float_tx is picked about twice as often as int_tx.
  auto int_tx = rx.NewChannel(Priority::kLow, 33U, false, {});
  auto float_tx = rx.NewChannel(Priority::kLow, 66U, false, {});

  const bool queued = int_tx.Send(IntegerData{33}).has_value() &&
                      int_tx.Send(IntegerData{4031}).has_value() &&
                      float_tx.Send(FloatingData{3.14F}).has_value() &&
                      int_tx.Send(IntegerData{2}).has_value() &&
                      float_tx.Send(FloatingData{10.0F}).has_value() &&
                      float_tx.Send(FloatingData{0.0F}).has_value();
  if (!queued) {
    MCH_LOG_ERROR("hello", "failed to queue the data messages");
    return 1;
  }

  std::printf("First four receives:\n");
  for (int i = 0; i < 4; ++i) {
    Print(rx.Receive());
  }

  auto sent = shutdown_tx.Send(Shutdown{});
  if (!sent) {
    MCH_LOG_ERROR("hello", "shutdown send failed: %s",
                  mch::ChannelErrorToString(sent.get_error()));
    return 1;
  }

  // Two low priority messages are still queued; shutdown wins anyway.
  Msg next = rx.Receive();
  if (!std::holds_alternative<Shutdown>(next)) {
    MCH_LOG_ERROR("hello", "expected the shutdown message first");
    return 1;
  }
  std::printf("Received shutdown message\n");

  auto st = rx.GetStatistics();
  MCH_LOG_INFO("hello", "sent=%llu received=%llu left=%zu",
               static_cast<unsigned long long>(st.messages_sent),
               static_cast<unsigned long long>(st.messages_received),
               int_tx.QueueLength() + float_tx.QueueLength());
  return 0;
}
