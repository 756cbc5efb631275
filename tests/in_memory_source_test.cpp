#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/progress.hpp"
#include "core/source.hpp"
#include "sources/in_memory_source.hpp"

static int g_failures = 0;

static void Expect(bool ok, const std::string& what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++g_failures;
}

static std::int64_t One(const int&) { return 1; }

static std::vector<int> Iota(int n) {
  std::vector<int> v;
  for (int i = 0; i < n; ++i) v.push_back(i);
  return v;
}

static void ReadsRangeInOrder() {
  prw::InMemorySource<int> source(Iota(10), One, 2, 6);
  std::int64_t bytes = 0;
  const prw::SourceBase* origin = nullptr;
  auto it = source.iterator([&](const prw::SourceBase& o, std::int64_t n) {
    origin = &o;
    bytes += n;
  });

  std::vector<int> got;
  while (it->has_next()) got.push_back(it->next());
  it->close();

  Expect(got == std::vector<int>({2, 3, 4, 5}), "reads records [2, 6) in order");
  Expect(bytes == 4, "one byte notification per record");
  Expect(origin == &source, "notifications name the source as origin");
}

static void ProgressTracksNextRecord() {
  prw::InMemorySource<int> source(Iota(4), One);
  auto it = source.iterator(nullptr);

  auto p = it->get_progress();
  Expect(p && p->position.record_index == 0 && p->fraction_consumed == 0.0, "progress starts at record 0, fraction 0");

  it->next();
  it->next();
  p = it->get_progress();
  Expect(p && p->position.record_index == 2 && p->fraction_consumed == 0.5, "after two of four records: record 2, fraction 0.5");

  while (it->has_next()) it->next();
  p = it->get_progress();
  Expect(p && p->position.record_index == 4 && p->fraction_consumed == 1.0, "exhausted: record 4, fraction 1");
}

static void NextPastEndAndAfterCloseThrow() {
  prw::InMemorySource<int> source(Iota(1), One);
  auto it = source.iterator(nullptr);
  it->next();

  bool threw = false;
  try {
    it->next();
  } catch (const prw::IterationError&) {
    threw = true;
  }
  Expect(threw, "next() past the end throws IterationError");

  auto it2 = source.iterator(nullptr);
  it2->close();
  threw = false;
  try {
    it2->next();
  } catch (const prw::IterationError&) {
    threw = true;
  }
  Expect(threw, "next() after close() throws IterationError");
  Expect(!it2->has_next(), "has_next() is false after close()");
}

static void SplitByRecordIndex() {
  prw::InMemorySource<int> source(Iota(10), One);
  auto it = source.iterator(nullptr);
  it->next();  // record 0
  it->next();  // record 1, next unread is 2

  Expect(!it->update_stop_position(prw::ProgressAtRecord(1)).has_value(), "refuses a stop before a returned record");
  Expect(!it->update_stop_position(prw::ProgressAtRecord(10)).has_value(), "refuses a stop at the current end");
  Expect(!it->update_stop_position(prw::ProgressAtRecord(0)).has_value(), "refuses a stop at the start");
  Expect(!it->update_stop_position(prw::Progress{}).has_value(), "refuses a proposal with no position or fraction");

  const auto accepted = it->update_stop_position(prw::ProgressAtRecord(5));
  Expect(accepted && accepted->record_index == 5, "accepts a stop inside the remaining range");

  std::vector<int> rest;
  while (it->has_next()) rest.push_back(it->next());
  Expect(rest == std::vector<int>({2, 3, 4}), "reading stops at the accepted position");

  auto p = it->get_progress();
  Expect(p && p->fraction_consumed == 1.0, "fraction is relative to the shrunk range");
}

static void SplitAtNextUnreadRecordEndsImmediately() {
  prw::InMemorySource<int> source(Iota(10), One);
  auto it = source.iterator(nullptr);
  it->next();
  it->next();

  const auto accepted = it->update_stop_position(prw::ProgressAtRecord(2));
  Expect(accepted && accepted->record_index == 2, "accepts a stop right after the last returned record");
  Expect(!it->has_next(), "nothing left after a stop at the next unread record");
}

static void SplitByFraction() {
  prw::InMemorySource<int> source(Iota(8), One);
  auto it = source.iterator(nullptr);
  it->next();

  const auto accepted = it->update_stop_position(prw::ProgressAtFraction(0.5));
  Expect(accepted && accepted->record_index == 4, "fraction 0.5 of [0, 8) maps to record 4");

  prw::Progress bad;
  bad.fraction_consumed = 1.5;
  Expect(!it->update_stop_position(bad).has_value(), "fraction outside [0, 1] is refused");
}

static void RejectsInvalidRange() {
  bool threw = false;
  try {
    prw::InMemorySource<int> source(Iota(3), One, 2, 5);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Expect(threw, "stop past the element count is rejected");

  threw = false;
  try {
    prw::InMemorySource<int> source(Iota(3), One, 2, 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Expect(threw, "start after stop is rejected");
}

int main() {
  ReadsRangeInOrder();
  ProgressTracksNextRecord();
  NextPastEndAndAfterCloseThrow();
  SplitByRecordIndex();
  SplitAtNextUnreadRecordEndsImmediately();
  SplitByFraction();
  RejectsInvalidRange();

  if (g_failures > 0) {
    std::cerr << g_failures << " check(s) failed\n";
    return 1;
  }
  return 0;
}
