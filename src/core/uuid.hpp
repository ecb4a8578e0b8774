#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace coderun {

// Simple UUID v4 generator
class UUID {
 public:
  static std::string generate() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t ab = dist(gen);
    uint64_t cd = dist(gen);

    // Set version to 4 (random)
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    // Set variant to RFC 4122
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (ab >> 32) << "-";
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (ab & 0xFFFF) << "-";
    ss << std::setw(4) << (cd >> 48) << "-";
    ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);
    return ss.str();
  }

  static std::string short_id(size_t length = 8) {
    static const char charset[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
      result += charset[dist(gen)];
    }
    return result;
  }
};

// Time-ordered identifiers: "<prefix>_<16 hex digits of ms*4096+counter><random>".
// Ids generated later in the process compare greater as strings.
class Identifier {
 public:
  static std::string ascending(const std::string& prefix) {
    static std::atomic<uint64_t> last{0};

    auto now = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
    uint64_t candidate = now * 0x1000;
    uint64_t prev = last.load();
    uint64_t next;
    do {
      next = candidate > prev ? candidate : prev + 1;
    } while (!last.compare_exchange_weak(prev, next));

    std::stringstream ss;
    ss << prefix << "_" << std::hex << std::setfill('0') << std::setw(16) << next << UUID::short_id(14);
    return ss.str();
  }
};

}  // namespace coderun
