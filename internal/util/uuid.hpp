#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace cloudsim::util {

/*
  Identifier helpers

  Emulated resources carry provider-shaped identifiers:
    - network resources: "<prefix>-" + 17 lowercase hex chars ("vpc-0a1b...")
    - identity principals: 4 char prefix + 16 uppercase alphanumerics ("AIDA...")
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Canonical 8-4-4-4-12 lowercase form.
std::string ToString(const UUID& id);

std::string GenerateNetworkId(std::string_view prefix);
std::string GenerateUniqueId(std::string_view prefix);

} // namespace cloudsim::util
