#include "execai/common/id.hpp"

#include <array>
#include <cctype>
#include <iomanip>
#include <openssl/rand.h>
#include <random>
#include <sstream>

namespace execai::common {

namespace {

std::array<unsigned char, 16> random_bytes() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    // CSPRNG not seeded; ids only need uniqueness, not secrecy.
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    for (auto &byte : bytes) {
      byte = static_cast<unsigned char>(rng() & 0xff);
    }
  }
  return bytes;
}

} // namespace

std::string generate_uuid() {
  auto bytes = random_bytes();
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return stream.str();
}

bool is_uuid(const std::string &value) {
  if (value.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (ch != '-') {
        return false;
      }
      continue;
    }
    if (std::isxdigit(static_cast<unsigned char>(ch)) == 0 ||
        std::isupper(static_cast<unsigned char>(ch)) != 0) {
      return false;
    }
  }
  return true;
}

} // namespace execai::common
