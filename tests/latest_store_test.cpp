#include <atomic>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/progress.hpp"
#include "infra/latest_store.hpp"

static int g_failures = 0;

static void Expect(bool ok, const std::string& what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++g_failures;
}

static void EmptyUntilFirstWrite() {
  prw::LatestStore<prw::Progress> store;
  Expect(!store.has_value(), "new store has no value");
  Expect(!store.read_latest().has_value(), "new store reads std::nullopt");
  Expect(store.version() == 0, "new store is at version 0");

  store.write(prw::ProgressAtRecord(3));
  Expect(store.has_value(), "store has a value after write");
  Expect(store.read_latest() == std::optional<prw::Progress>(prw::ProgressAtRecord(3)), "read returns the written value");
  Expect(store.version() == 1, "write bumps the version");
}

static void LastWriteWins() {
  prw::LatestStore<prw::Progress> store;
  store.write(prw::ProgressAtRecord(1));
  store.write(prw::ProgressAtRecord(2));
  store.write(prw::ProgressAtRecord(7));

  Expect(store.read_latest()->position.record_index == 7, "latest write wins");
  Expect(store.read_latest() == store.read_latest(), "reads have no side effects");
  Expect(store.version() == 3, "three writes, version 3");
}

static void WritingNulloptEmpties() {
  prw::LatestStore<prw::Progress> store;
  store.write(prw::ProgressAtRecord(1));
  store.write(std::optional<prw::Progress>());

  Expect(!store.has_value(), "writing std::nullopt empties the store");
  Expect(store.version() == 2, "writing std::nullopt counts as a write");
}

// One writer publishing increasing values, several readers: a reader never sees a value older
// than one it has already seen.
static void ReadersSeeMonotonicValues() {
  prw::LatestStore<long> store;
  std::atomic_bool done{false};
  std::atomic<int> regressions{0};
  std::atomic<long> reads{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      long last = -1;
      while (!done.load(std::memory_order_acquire)) {
        const std::optional<long> v = store.read_latest();
        if (v) {
          if (*v < last) ++regressions;
          last = *v;
          ++reads;
        }
      }
    });
  }

  for (long i = 0; i < 20000; ++i) store.write(i);
  done.store(true, std::memory_order_release);
  for (auto& t : readers) t.join();

  Expect(regressions.load() == 0, "readers never observe a regression");
  Expect(store.read_latest() == std::optional<long>(19999), "final value is the last write");
}

int main() {
  EmptyUntilFirstWrite();
  LastWriteWins();
  WritingNulloptEmpties();
  ReadersSeeMonotonicValues();

  if (g_failures > 0) {
    std::cerr << g_failures << " check(s) failed\n";
    return 1;
  }
  return 0;
}
