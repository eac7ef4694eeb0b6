#include "uuid.hpp"

#include <iomanip>
#include <sstream>

namespace cloudsim::util {

namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

UUID GenerateUUID() {
  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(Rng()());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

std::string GenerateNetworkId(std::string_view prefix) {
  // 17 hex chars: the first 8.5 bytes of a fresh UUID, dashes removed.
  std::string hex;
  for (char c : ToString(GenerateUUID()))
    if (c != '-') hex += c;

  return std::string(prefix) + "-" + hex.substr(0, 17);
}

std::string GenerateUniqueId(std::string_view prefix) {
  static constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

  std::uniform_int_distribution<size_t> pick(0, kAlphabet.size() - 1);

  std::string id(prefix);
  for (int i = 0; i < 16; ++i)
    id += kAlphabet[pick(Rng())];
  return id;
}

} // namespace cloudsim::util
