#include "sc/ids/Id.hpp"

#include <atomic>
#include <chrono>

namespace sc {

namespace {

std::string toBase36(std::uint64_t v) {
  static const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
  if (v == 0) return "0";
  std::string out;
  while (v > 0) {
    out.insert(out.begin(), digits[v % 36]);
    v /= 36;
  }
  return out;
}

std::atomic<std::uint64_t> g_nextSerial{1};

} // namespace

std::string generateComponentId(const std::string& prefix) {
  std::uint64_t serial = g_nextSerial.fetch_add(1, std::memory_order_relaxed);
  auto ticks = static_cast<std::uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count());
  // Low bits of the clock only disambiguate ids across processes.
  return prefix + "_" + std::to_string(serial) + "_" + toBase36(ticks & 0xFFFFFFFFFull);
}

} // namespace sc
