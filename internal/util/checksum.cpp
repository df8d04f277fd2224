#include "internal/util/checksum.hpp"

#include <crc32c/crc32c.h>

namespace rollback::util {

std::uint32_t Crc32c(std::string_view data) {
  if (data.empty()) {
    return 0;
  }
  return crc32c::Crc32c(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

std::string Checksum(std::string_view data) {
  static constexpr char kHex[] = "0123456789abcdef";

  const auto  crc = Crc32c(data);
  std::string out(8, '0');
  for (int i = 7; i >= 0; --i) {
    out[static_cast<std::size_t>(7 - i)] = kHex[(crc >> (i * 4)) & 0x0F];
  }
  return out;
}

} // namespace rollback::util
