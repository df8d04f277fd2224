#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rollback::util {

/*
  Content checksum for snapshot payloads.

  CRC-32C via the crc32c library, rendered as 8 lowercase hex digits so it
  can be stored and compared as text.
*/
std::uint32_t Crc32c(std::string_view data);

std::string Checksum(std::string_view data);

} // namespace rollback::util
