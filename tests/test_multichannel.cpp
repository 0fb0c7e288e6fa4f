/**
 * @file test_multichannel.cpp
 * @brief End-to-end tests for Sender / Receiver: priority, weighting,
 *        freezing, bounded blocking, cancellation and MPMC delivery.
 */

#include "mch/multichannel.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <random>
#include <thread>
#include <vector>

namespace {

using IntRx = mch::Receiver<int, uint16_t>;

mch::RegistryConfig Seeded(uint32_t seed) {
  mch::RegistryConfig cfg;
  cfg.seed = seed;
  return cfg;
}

enum class Prio : uint8_t { kLow = 0, kHigh = 1 };

struct Msg {
  enum class Kind : uint8_t { kShutdown, kInteger, kFloating };
  Kind kind;
  int integer;
  float floating;

  static Msg Integer(int v) { return Msg{Kind::kInteger, v, 0.0F}; }
  static Msg Floating(float v) { return Msg{Kind::kFloating, 0, v}; }
  static Msg Shutdown() { return Msg{Kind::kShutdown, 0, 0.0F}; }
};

void SleepMs(int ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace

// ============================================================================
// Basic delivery
// ============================================================================

TEST_CASE("Receive drains higher priority first, FIFO within channel",
          "[multichannel][priority]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto low = rx.NewChannel(1, 10U, false, {});
  auto high = rx.NewChannel(10, 10U, false, {});

  for (int x = 0; x < 100; ++x) {
    REQUIRE(low.Send(100 + x).has_value());
  }
  for (int x = 0; x < 100; ++x) {
    REQUIRE(high.Send(x).has_value());
  }
  for (int x = 0; x < 200; ++x) {
    REQUIRE(rx.Receive() == x);
  }
}

TEST_CASE("Bounded channels deliver the same order", "[multichannel][bounded]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto low = rx.NewChannel(1, 10U, false, 100U);
  auto high = rx.NewChannel(10, 10U, false, 100U);

  for (int x = 0; x < 100; ++x) {
    REQUIRE(low.TrySend(100 + x).has_value());
  }
  for (int x = 0; x < 100; ++x) {
    REQUIRE(high.TrySend(x).has_value());
  }
  REQUIRE(low.TrySend(-1).get_error() == mch::ChannelError::kFull);
  for (int x = 0; x < 200; ++x) {
    REQUIRE(rx.Receive() == x);
  }
}

TEST_CASE("Capacity 0 behaves as capacity 1", "[multichannel][bounded]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto low = rx.NewChannel(1, 10U, false, 0U);
  auto high = rx.NewChannel(10, 10U, false, 0U);
  REQUIRE(low.Capacity().value() == 1U);

  std::atomic<int> failures{0};
  std::thread t_low([low, &failures]() mutable {
    if (!low.Send(1)) failures.fetch_add(1);
  });
  std::thread t_high([high, &failures]() mutable {
    if (!high.Send(0)) failures.fetch_add(1);
  });
  t_low.join();
  t_high.join();
  REQUIRE(failures.load() == 0);

  REQUIRE(rx.Receive() == 0);
  REQUIRE(rx.Receive() == 1);
}

TEST_CASE("TryReceive on nothing eligible is kEmpty", "[multichannel][receive]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  REQUIRE(rx.TryReceive().get_error() == mch::ChannelError::kEmpty);

  auto tx = rx.NewChannel(1, 1U, false, {});
  REQUIRE(rx.TryReceive().get_error() == mch::ChannelError::kEmpty);
  REQUIRE(tx.Send(5).has_value());
  REQUIRE(rx.TryReceive().value() == 5);
}

TEST_CASE("Worked scenario: late high priority preempts low backlog",
          "[multichannel][scenario]") {
  auto rx = mch::NewRegistry<Msg, Prio>(Seeded(7U));
  auto shutdown_tx = rx.NewChannel(Prio::kHigh, 1U, false, 1U);
  auto int_tx = rx.NewChannel(Prio::kLow, 33U, false, {});
  auto float_tx = rx.NewChannel(Prio::kLow, 66U, false, {});

  REQUIRE(int_tx.Send(Msg::Integer(33)).has_value());
  REQUIRE(int_tx.Send(Msg::Integer(4031)).has_value());
  REQUIRE(float_tx.Send(Msg::Floating(3.14F)).has_value());
  REQUIRE(int_tx.Send(Msg::Integer(2)).has_value());
  REQUIRE(float_tx.Send(Msg::Floating(10.0F)).has_value());
  REQUIRE(float_tx.Send(Msg::Floating(0.0F)).has_value());

  const int ints[] = {33, 4031, 2};
  const float floats[] = {3.14F, 10.0F, 0.0F};
  size_t next_int = 0;
  size_t next_float = 0;
  for (int i = 0; i < 4; ++i) {
    Msg m = rx.Receive();
    REQUIRE(m.kind != Msg::Kind::kShutdown);
    if (m.kind == Msg::Kind::kInteger) {
      REQUIRE(m.integer == ints[next_int]);
      ++next_int;
    } else {
      REQUIRE(m.floating == floats[next_float]);
      ++next_float;
    }
  }
  REQUIRE(next_int + next_float == 4U);

  REQUIRE(shutdown_tx.Send(Msg::Shutdown()).has_value());
  REQUIRE(rx.Receive().kind == Msg::Kind::kShutdown);

  // Remaining low backlog is still intact.
  REQUIRE(int_tx.QueueLength() == 3U - next_int);
  REQUIRE(float_tx.QueueLength() == 3U - next_float);
}

// ============================================================================
// Freezing
// ============================================================================

TEST_CASE("Freeze and unfreeze", "[multichannel][freeze]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto low = rx.NewChannel(1, 10U, false, {});
  auto high = rx.NewChannel(10, 10U, false, {});

  for (int x = 100; x < 200; ++x) REQUIRE(low.Send(x).has_value());
  for (int x = 0; x < 100; ++x) REQUIRE(high.Send(x).has_value());

  for (int x = 0; x < 50; ++x) REQUIRE(rx.Receive() == x);
  REQUIRE(high.Freeze().has_value());
  REQUIRE(high.IsFrozen().value());
  for (int x = 100; x < 150; ++x) REQUIRE(rx.Receive() == x);
  REQUIRE(high.Unfreeze().has_value());
  REQUIRE(!high.IsFrozen().value());
  for (int x = 50; x < 100; ++x) REQUIRE(rx.Receive() == x);
  for (int x = 150; x < 200; ++x) REQUIRE(rx.Receive() == x);
}

TEST_CASE("Frozen channel keeps accepting sends", "[multichannel][freeze]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, true, {});
  REQUIRE(tx.Send(1).has_value());
  REQUIRE(tx.Send(2).has_value());
  REQUIRE(rx.TryReceive().get_error() == mch::ChannelError::kEmpty);
  REQUIRE(rx.ReceiveFor(10000U).get_error() == mch::ChannelError::kTimedOut);
  REQUIRE(rx.QueueLength(tx.Id()).value() == 2U);

  REQUIRE(tx.SetFrozen(false).has_value());
  REQUIRE(rx.Receive() == 1);
  REQUIRE(rx.Receive() == 2);
}

TEST_CASE("Unfreeze wakes a blocked receiver", "[multichannel][freeze]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, true, {});
  REQUIRE(tx.Send(42).has_value());

  std::atomic<int> got{-1};
  std::thread consumer([rx, &got]() mutable {
    auto r = rx.ReceiveFor(5000000U);
    got.store(r.has_value() ? r.value() : -2);
  });

  SleepMs(30);
  REQUIRE(got.load() == -1);
  REQUIRE(tx.Unfreeze().has_value());
  consumer.join();
  REQUIRE(got.load() == 42);
}

// ============================================================================
// Blocking senders
// ============================================================================

TEST_CASE("Send blocks on a full channel until a receive",
          "[multichannel][bounded]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, 1U);
  REQUIRE(tx.Send(1).has_value());

  std::atomic<bool> done{false};
  std::atomic<bool> ok{false};
  std::thread producer([tx, &done, &ok]() mutable {
    ok.store(tx.Send(2).has_value());
    done.store(true);
  });

  SleepMs(30);
  REQUIRE(!done.load());
  REQUIRE(rx.Receive() == 1);
  producer.join();
  REQUIRE(done.load());
  REQUIRE(ok.load());
  REQUIRE(rx.Receive() == 2);
}

TEST_CASE("SendFor times out without enqueueing", "[multichannel][bounded]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, 1U);
  REQUIRE(tx.Send(1).has_value());
  REQUIRE(tx.SendFor(2, 20000U).get_error() == mch::ChannelError::kTimedOut);
  REQUIRE(tx.QueueLength() == 1U);
}

TEST_CASE("Failed send leaves the message with the caller",
          "[multichannel][bounded]") {
  auto rx = mch::NewRegistry<std::unique_ptr<int>, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, 1U);
  REQUIRE(tx.TrySend(std::unique_ptr<int>(new int(1))).has_value());

  std::unique_ptr<int> second(new int(2));
  auto r = tx.TrySend(std::move(second));
  REQUIRE(r.get_error() == mch::ChannelError::kFull);
  REQUIRE(second != nullptr);
  REQUIRE(*second == 2);

  std::unique_ptr<int> first = rx.Receive();
  REQUIRE(*first == 1);
  REQUIRE(tx.TrySend(std::move(second)).has_value());
  REQUIRE(second == nullptr);
  REQUIRE(*rx.Receive() == 2);
}

// ============================================================================
// Close / Remove / Disconnect
// ============================================================================

TEST_CASE("Closed channel rejects sends, backlog stays",
          "[multichannel][lifecycle]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, {});
  auto twin = tx;
  REQUIRE(tx.Send(1).has_value());
  tx.Close();
  REQUIRE(tx.IsClosed());
  REQUIRE(twin.IsClosed());
  REQUIRE(twin.Send(2).get_error() == mch::ChannelError::kClosed);
  REQUIRE(rx.Receive() == 1);
  REQUIRE(rx.TryReceive().get_error() == mch::ChannelError::kEmpty);
}

TEST_CASE("Close wakes a blocked sender", "[multichannel][lifecycle]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, 1U);
  REQUIRE(tx.Send(1).has_value());

  std::atomic<int> err{-1};
  std::thread producer([tx, &err]() mutable {
    auto r = tx.Send(2);
    err.store(r.has_value() ? 0 : static_cast<int>(r.get_error()));
  });
  SleepMs(20);
  tx.Close();
  producer.join();
  REQUIRE(err.load() == static_cast<int>(mch::ChannelError::kClosed));
}

TEST_CASE("RemoveChannel discards backlog", "[multichannel][lifecycle]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, {});
  REQUIRE(tx.Send(1).has_value());
  REQUIRE(tx.Send(2).has_value());

  REQUIRE(rx.RemoveChannel(tx).has_value());
  REQUIRE(rx.NoChannels());
  REQUIRE(tx.Send(3).get_error() == mch::ChannelError::kClosed);
  REQUIRE(tx.IsClosed());
  REQUIRE(rx.TryReceive().get_error() == mch::ChannelError::kEmpty);
  REQUIRE(rx.GetStatistics().messages_discarded == 2U);
  REQUIRE(rx.RemoveChannel(tx.Id()).get_error() == mch::ChannelError::kNotFound);
  REQUIRE(rx.QueueLength(tx.Id()).get_error() == mch::ChannelError::kNotFound);
}

TEST_CASE("RemoveChannel wakes a blocked sender", "[multichannel][lifecycle]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, 1U);
  REQUIRE(tx.Send(1).has_value());

  std::atomic<int> err{-1};
  std::thread producer([tx, &err]() mutable {
    auto r = tx.Send(2);
    err.store(r.has_value() ? 0 : static_cast<int>(r.get_error()));
  });
  SleepMs(20);
  REQUIRE(rx.RemoveChannel(tx.Id()).has_value());
  producer.join();
  REQUIRE(err.load() == static_cast<int>(mch::ChannelError::kClosed));
}

TEST_CASE("Dropping the last receiver disconnects senders",
          "[multichannel][lifecycle]") {
  std::unique_ptr<IntRx> rx(new IntRx(Seeded(1U)));
  auto tx = rx->NewChannel(10, 10U, false, {});
  REQUIRE(tx.Send(0).has_value());

  {
    IntRx copy = *rx;
    REQUIRE(rx->ReceiverCount() == 2U);
  }
  REQUIRE(rx->ReceiverCount() == 1U);
  REQUIRE(tx.Send(1).has_value());

  rx.reset();
  REQUIRE(tx.Send(2).get_error() == mch::ChannelError::kDisconnected);
}

TEST_CASE("Dropping the last receiver wakes a blocked sender",
          "[multichannel][lifecycle]") {
  std::unique_ptr<IntRx> rx(new IntRx(Seeded(1U)));
  auto tx = rx->NewChannel(10, 10U, false, 1U);
  REQUIRE(tx.Send(0).has_value());

  std::atomic<int> err{-1};
  std::thread producer([tx, &err]() mutable {
    auto r = tx.Send(1);
    err.store(r.has_value() ? 0 : static_cast<int>(r.get_error()));
  });
  SleepMs(20);
  rx.reset();
  producer.join();
  REQUIRE(err.load() == static_cast<int>(mch::ChannelError::kDisconnected));
}

TEST_CASE("Receiver copy, move and assignment accounting",
          "[multichannel][lifecycle]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  REQUIRE(rx.ReceiverCount() == 1U);

  IntRx copy(rx);
  REQUIRE(rx.ReceiverCount() == 2U);
  REQUIRE(copy.SharesRegistryWith(rx));

  IntRx moved(std::move(copy));
  REQUIRE(rx.ReceiverCount() == 2U);

  IntRx other(Seeded(2U));
  REQUIRE(!other.SharesRegistryWith(rx));
  other = rx;
  REQUIRE(other.SharesRegistryWith(rx));
  REQUIRE(rx.ReceiverCount() == 3U);

  other = std::move(moved);
  REQUIRE(rx.ReceiverCount() == 2U);
}

// ============================================================================
// Timeouts and cancellation
// ============================================================================

TEST_CASE("ReceiveFor times out", "[multichannel][receive]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, {});
  auto start = std::chrono::steady_clock::now();
  auto r = rx.ReceiveFor(20000U);
  REQUIRE(r.get_error() == mch::ChannelError::kTimedOut);
  REQUIRE(std::chrono::steady_clock::now() - start >=
          std::chrono::milliseconds(20));
  REQUIRE(tx.Send(1).has_value());
  REQUIRE(rx.ReceiveFor(20000U).value() == 1);
}

TEST_CASE("Cancel interrupts a blocked receive", "[multichannel][cancel]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, {});
  mch::CancelToken token = rx.MakeCancelToken();

  std::atomic<int> err{-1};
  std::thread consumer([rx, token, &err]() mutable {
    auto r = rx.Receive(token);
    err.store(r.has_value() ? 0 : static_cast<int>(r.get_error()));
  });
  SleepMs(20);
  token.Cancel();
  consumer.join();
  REQUIRE(err.load() == static_cast<int>(mch::ChannelError::kCancelled));

  // A cancelled token never consumes.
  REQUIRE(tx.Send(7).has_value());
  REQUIRE(rx.Receive(token).get_error() == mch::ChannelError::kCancelled);
  token.Reset();
  REQUIRE(rx.Receive(token).value() == 7);
}

TEST_CASE("Cancel interrupts a blocked send", "[multichannel][cancel]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, 1U);
  REQUIRE(tx.Send(1).has_value());
  mch::CancelToken token = rx.MakeCancelToken();

  std::atomic<int> err{-1};
  std::thread producer([tx, token, &err]() mutable {
    auto r = tx.Send(2, token);
    err.store(r.has_value() ? 0 : static_cast<int>(r.get_error()));
  });
  SleepMs(20);
  token.Cancel();
  producer.join();
  REQUIRE(err.load() == static_cast<int>(mch::ChannelError::kCancelled));
  REQUIRE(tx.QueueLength() == 1U);
}

TEST_CASE("Cancelled receiver passes its wake-up on", "[multichannel][cancel]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, {});
  // Unbound: Cancel() raises the flag without waking anyone, so the single
  // notification of the send below may land on the cancelled waiter.
  mch::CancelToken quiet;

  std::atomic<int> plain_value{-1};
  std::atomic<int> cancelled_err{-1};
  std::thread plain([rx, &plain_value]() mutable {
    auto r = rx.ReceiveFor(2000000U);
    plain_value.store(r.has_value() ? r.value() : -2);
  });
  std::thread cancelled([rx, quiet, &cancelled_err]() mutable {
    auto r = rx.Receive(quiet);
    cancelled_err.store(r.has_value() ? 0 : static_cast<int>(r.get_error()));
  });
  while (rx.GetStatistics().receive_waits < 2U) SleepMs(1);
  SleepMs(10);

  quiet.Cancel();
  REQUIRE(tx.Send(7).has_value());
  plain.join();

  // Wake the cancelled waiter if the send notified the plain one.
  rx.MakeCancelToken().Cancel();
  cancelled.join();

  REQUIRE(plain_value.load() == 7);
  REQUIRE(cancelled_err.load() == static_cast<int>(mch::ChannelError::kCancelled));
  REQUIRE(tx.QueueLength() == 0U);
}

TEST_CASE("Cancelled sender passes its wake-up on", "[multichannel][cancel]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, 1U);
  REQUIRE(tx.Send(1).has_value());
  mch::CancelToken quiet;

  std::atomic<int> plain_err{-1};
  std::atomic<int> cancelled_err{-1};
  std::thread plain([tx, &plain_err]() mutable {
    auto r = tx.SendFor(2, 2000000U);
    plain_err.store(r.has_value() ? 0 : static_cast<int>(r.get_error()));
  });
  std::thread cancelled([tx, quiet, &cancelled_err]() mutable {
    auto r = tx.Send(3, quiet);
    cancelled_err.store(r.has_value() ? 0 : static_cast<int>(r.get_error()));
  });
  while (rx.GetStatistics().send_waits < 2U) SleepMs(1);
  SleepMs(10);

  quiet.Cancel();
  REQUIRE(rx.Receive() == 1);  // frees the single slot
  plain.join();

  rx.MakeCancelToken().Cancel();
  cancelled.join();

  REQUIRE(plain_err.load() == 0);
  REQUIRE(cancelled_err.load() == static_cast<int>(mch::ChannelError::kCancelled));
  REQUIRE(rx.TryReceive().value() == 2);
  REQUIRE(rx.TryReceive().get_error() == mch::ChannelError::kEmpty);
}

TEST_CASE("ReceiveFor with the largest timeout waits", "[multichannel][receive]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, {});

  std::thread producer([tx]() mutable {
    SleepMs(20);
    (void)tx.Send(5);
  });
  auto r = rx.ReceiveFor(UINT64_MAX);
  producer.join();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 5);
}

TEST_CASE("SendFor with the largest timeout waits", "[multichannel][send]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(1, 1U, false, 1U);
  REQUIRE(tx.Send(1).has_value());

  std::atomic<int> got{-1};
  std::thread consumer([rx, &got]() mutable {
    SleepMs(20);
    got.store(rx.Receive());
  });
  auto r = tx.SendFor(2, UINT64_MAX);
  consumer.join();
  REQUIRE(r.has_value());
  REQUIRE(got.load() == 1);
  REQUIRE(tx.QueueLength() == 1U);
}

// ============================================================================
// Dynamic topology
// ============================================================================

TEST_CASE("Channel registered while a receiver waits",
          "[multichannel][dynamic]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  REQUIRE(rx.NoChannels());

  std::atomic<int> got{-1};
  std::thread consumer([rx, &got]() mutable { got.store(rx.Receive()); });
  SleepMs(20);

  auto tx = rx.NewChannel(3, 1U, false, {});
  REQUIRE(tx.Send(99).has_value());
  consumer.join();
  REQUIRE(got.load() == 99);
}

TEST_CASE("Many channels created and removed", "[multichannel][dynamic]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  std::vector<mch::Sender<int, uint16_t>> senders;
  for (int i = 0; i < 1000; ++i) {
    senders.push_back(rx.NewChannel(10, 10U, false, {}));
  }
  REQUIRE(rx.ChannelCount() == 1000U);

  std::mt19937 rng(5U);
  std::shuffle(senders.begin(), senders.end(), rng);
  for (const auto& tx : senders) {
    REQUIRE(rx.RemoveChannel(tx).has_value());
  }
  REQUIRE(rx.NoChannels());
}

TEST_CASE("Parallel create and remove", "[multichannel][dynamic]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 16; ++t) {
    threads.emplace_back([rx, &failures]() mutable {
      for (int i = 0; i < 256; ++i) {
        auto tx = rx.NewChannel(10, 10U, false, {});
        if (!rx.RemoveChannel(tx)) failures.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(failures.load() == 0);
  REQUIRE(rx.NoChannels());
}

TEST_CASE("NewChannel with ChannelOptions", "[multichannel][dynamic]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  mch::ChannelOptions opts;
  opts.weight = 5U;
  opts.capacity = 8U;
  opts.frozen = true;
  auto tx = rx.NewChannel(4, opts);
  REQUIRE(tx.Weight() == 5U);
  REQUIRE(tx.Capacity().value() == 8U);
  REQUIRE(tx.IsFrozen().value());
  REQUIRE(tx.Priority() == 4);

  auto plain = rx.NewChannel(4);
  REQUIRE(plain.Weight() == 1U);
  REQUIRE(!plain.Capacity().has_value());
  REQUIRE(!plain.IsFrozen().value());
  REQUIRE(rx.PriorityLevelCount() == 1U);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("Many producers, one consumer, bounded and unbounded",
          "[multichannel][concurrency]") {
  const int kSenders = 32;
  const int kMessages = 500;
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(11U));
  std::mt19937 rng(11U);
  std::uniform_int_distribution<int> prio(0, 9);
  std::uniform_int_distribution<int> weight(1, 9);
  std::uniform_int_distribution<int> cap(0, 99);

  std::atomic<int> failures{0};
  std::vector<std::thread> producers;
  for (int s = 0; s < kSenders; ++s) {
    mch::optional<uint32_t> capacity;
    if ((s % 2) == 0) capacity = static_cast<uint32_t>(cap(rng));
    auto tx = rx.NewChannel(static_cast<uint16_t>(prio(rng)),
                            static_cast<uint32_t>(weight(rng)), false,
                            capacity);
    producers.emplace_back([tx, &failures]() mutable {
      for (int x = 0; x < kMessages; ++x) {
        if (!tx.Send(x)) failures.fetch_add(1);
      }
    });
  }

  int received = 0;
  for (; received < kSenders * kMessages; ++received) {
    (void)rx.Receive();
  }
  for (auto& th : producers) th.join();
  REQUIRE(failures.load() == 0);
  REQUIRE(received == kSenders * kMessages);
  REQUIRE(rx.TryReceive().get_error() == mch::ChannelError::kEmpty);
}

TEST_CASE("Many producers, many consumers, exactly once",
          "[multichannel][concurrency]") {
  const size_t kPairs = 16;
  const size_t kMessages = 1000;
  using SizeRx = mch::Receiver<size_t, uint16_t>;
  auto rx = mch::NewRegistry<size_t, uint16_t>(Seeded(3U));
  std::mt19937 rng(3U);
  std::uniform_int_distribution<int> prio(0, 9);
  std::uniform_int_distribution<int> weight(1, 9);
  std::uniform_int_distribution<int> cap(1, 99);

  std::vector<mch::Sender<size_t, uint16_t>> senders;
  for (size_t i = 0; i < kPairs; ++i) {
    senders.push_back(rx.NewChannel(static_cast<uint16_t>(prio(rng)),
                                    static_cast<uint32_t>(weight(rng)), false,
                                    static_cast<uint32_t>(cap(rng))));
  }

  std::atomic<int> failures{0};
  std::vector<std::vector<size_t>> per_consumer(kPairs);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < kPairs; ++i) {
    threads.emplace_back([tx = senders[i], i, &failures]() mutable {
      for (size_t x = kMessages * i; x < kMessages * (i + 1); ++x) {
        if (!tx.Send(x)) failures.fetch_add(1);
      }
    });
  }
  for (size_t i = 0; i < kPairs; ++i) {
    threads.emplace_back([consumer = SizeRx(rx), &per_consumer, i]() mutable {
      per_consumer[i].reserve(kMessages);
      for (size_t n = 0; n < kMessages; ++n) {
        per_consumer[i].push_back(consumer.Receive());
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(failures.load() == 0);

  std::vector<size_t> all;
  for (const auto& v : per_consumer) all.insert(all.end(), v.begin(), v.end());
  std::sort(all.begin(), all.end());
  REQUIRE(all.size() == kPairs * kMessages);
  for (size_t idx = 0; idx < all.size(); ++idx) {
    REQUIRE(all[idx] == idx);
  }
}

TEST_CASE("One sender, many receivers", "[multichannel][concurrency]") {
  auto rx = mch::NewRegistry<int, uint16_t>(Seeded(1U));
  auto tx = rx.NewChannel(10, 10U, false, {});
  for (int x = 0; x < 64; ++x) REQUIRE(tx.Send(x).has_value());

  std::vector<int> got(64, -1);
  std::vector<std::thread> consumers;
  for (int i = 0; i < 64; ++i) {
    consumers.emplace_back([rx, &got, i]() mutable { got[i] = rx.Receive(); });
  }
  for (auto& th : consumers) th.join();

  std::sort(got.begin(), got.end());
  for (int x = 0; x < 64; ++x) REQUIRE(got[x] == x);
}
