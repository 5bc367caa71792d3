#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace turnloop {

// Random identifiers for sessions, messages and tool calls
class UUID {
 public:
  // RFC 4122 version 4
  static std::string generate() {
    uint64_t hi = next();
    uint64_t lo = next();

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (hi >> 32) << '-' << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-' << std::setw(4) << (hi & 0xFFFF) << '-';
    ss << std::setw(4) << (lo >> 48) << '-' << std::setw(12) << (lo & 0x0000FFFFFFFFFFFFULL);
    return ss.str();
  }

 private:
  static uint64_t next() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine();
  }
};

}  // namespace turnloop
