#include "uuid.hpp"

#include <fmt/format.h>

namespace dispatch::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (std::size_t i = 0; i < id.size(); i += 8) {
    const uint64_t word = rng();
    for (std::size_t j = 0; j < 8; ++j) id[i + j] = static_cast<uint8_t>(word >> (j * 8));
  }

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  return fmt::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}", id[0], id[1], id[2],
                     id[3], id[4], id[5], id[6], id[7], id[8], id[9], id[10], id[11], id[12], id[13], id[14], id[15]);
}

std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace dispatch::util
