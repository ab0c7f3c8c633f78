#include "internal/cache/memory_due_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

using caretask::cache::MemoryDueCache;
using caretask::util::ManualTimeSource;

std::shared_ptr<ManualTimeSource> MakeClock() {
  return std::make_shared<ManualTimeSource>(caretask::util::ParseDate("2025-01-01"));
}

void TestEntryExpiresAfterTtl() {
  auto           clock = MakeClock();
  MemoryDueCache cache(clock);

  cache.Set("schedule:n1:p1", "{}", std::chrono::seconds(60));
  assert(cache.Get("schedule:n1:p1").value() == "{}");

  clock->Advance(std::chrono::seconds(59));
  assert(cache.Get("schedule:n1:p1").has_value());

  clock->Advance(std::chrono::seconds(1));
  assert(!cache.Get("schedule:n1:p1").has_value());
  assert(cache.Size() == 0);
}

void TestSetOverwritesValueAndExpiry() {
  auto           clock = MakeClock();
  MemoryDueCache cache(clock);

  cache.Set("k", "a", std::chrono::seconds(10));
  clock->Advance(std::chrono::seconds(8));
  cache.Set("k", "b", std::chrono::seconds(10));
  clock->Advance(std::chrono::seconds(8));

  assert(cache.Get("k").value() == "b");
}

void TestDeleteAndDeleteManyIgnoreMissingKeys() {
  auto           clock = MakeClock();
  MemoryDueCache cache(clock);

  cache.Set("a", "1", std::chrono::seconds(10));
  cache.Set("b", "2", std::chrono::seconds(10));
  cache.Set("c", "3", std::chrono::seconds(10));

  cache.Delete("missing");
  cache.Delete("a");
  assert(!cache.Get("a").has_value());

  cache.DeleteMany({"b", "missing", "c"});
  assert(cache.Size() == 0);
}

void TestWritesSweepEntriesNobodyReads() {
  auto           clock = MakeClock();
  MemoryDueCache cache(clock);

  cache.Set("schedule:n1:p1", "{}", std::chrono::seconds(60));
  cache.Set("schedule:n1:keys", "{}", std::chrono::seconds(60));
  clock->Advance(std::chrono::seconds(61));
  assert(cache.PurgeExpired() == 2);
  assert(cache.PurgeExpired() == 0);

  // two expired entries, never read again, then enough writes to trigger a sweep
  cache.Set("schedule:n2:p1", "{}", std::chrono::seconds(60));
  cache.Set("schedule:n2:keys", "{}", std::chrono::seconds(60));
  clock->Advance(std::chrono::seconds(61));
  for (std::size_t i = 2; i < MemoryDueCache::kPurgeInterval; ++i) {
    cache.Set("schedule:n3:p" + std::to_string(i), "{}", std::chrono::seconds(60));
  }
  assert(cache.PurgeExpired() == 0);
  assert(cache.Size() == MemoryDueCache::kPurgeInterval - 2);
}

void TestKeyHelpers() {
  assert(caretask::cache::DueEntryKey("n1", "p1") == "schedule:n1:p1");
  assert(caretask::cache::NoteKeysKey("n1") == "schedule:n1:keys");
}

} // namespace

int main() {
  TestEntryExpiresAfterTtl();
  TestSetOverwritesValueAndExpiry();
  TestDeleteAndDeleteManyIgnoreMissingKeys();
  TestWritesSweepEntriesNobodyReads();
  TestKeyHelpers();

  std::cout << "caretask_unit_due_cache: pass\n";
  return 0;
}
