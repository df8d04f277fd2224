#include "internal/util/ids.hpp"

#include <cstdint>
#include <random>

#include "internal/util/time.hpp"

namespace rollback::util {

namespace {

constexpr std::size_t kSuffixLength = 9;

std::string RandomSuffix() {
  static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::uniform_int_distribution<int> pick(0, 35);
  std::string                        suffix;
  suffix.reserve(kSuffixLength);
  for (std::size_t i = 0; i < kSuffixLength; ++i) {
    suffix.push_back(kAlphabet[pick(rng)]);
  }
  return suffix;
}

} // namespace

std::string GenerateID(std::string_view prefix) {
  std::string id(prefix);
  id += '_';
  id += std::to_string(NowMillis());
  id += '_';
  id += RandomSuffix();
  return id;
}

} // namespace rollback::util
