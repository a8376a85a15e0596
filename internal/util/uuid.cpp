#include "uuid.hpp"

#include <cstring>
#include <random>

namespace graphflow::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (std::size_t offset = 0; offset < id.size(); offset += sizeof(uint64_t)) {
    const uint64_t word = rng();
    std::memcpy(id.data() + offset, &word, sizeof(word));
  }

  // version 4, RFC4122 variant
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;
  return id;
}

std::string ToString(const UUID& id) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[id[i] >> 4]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

std::string NewId(const std::string& prefix) {
  if (prefix.empty()) return ToString(GenerateUUID());
  return prefix + "-" + ToString(GenerateUUID());
}

} // namespace graphflow::util
