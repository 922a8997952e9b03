#include "uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace evolve::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i==4||i==6||i==8||i==10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(id[i]);
  }
  return oss.str();
}

std::optional<UUID> ParseUUID(std::string_view str) {
  // canonical 8-4-4-4-12 layout only
  if (str.size() != 36) return std::nullopt;

  UUID   id{};
  size_t byte = 0;
  for (size_t i = 0; i < str.size();) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (str[i] != '-') return std::nullopt;
      ++i;
      continue;
    }

    const int hi = HexNibble(str[i]);
    const int lo = HexNibble(str[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;

    id[byte++] = static_cast<uint8_t>((hi << 4) | lo);
    i += 2;
  }

  return id;
}

std::string NewId() {
  return ToString(GenerateUUID());
}

bool IsWellFormedId(std::string_view str) {
  return ParseUUID(str).has_value();
}

} // namespace evolve::util
