#include "uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace arena::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (std::size_t i = 0; i < id.size(); i += 8) {
    const auto word = rng();
    for (std::size_t j = 0; j < 8; ++j)
      id[i + j] = static_cast<uint8_t>(word >> (j * 8));
  }

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
    oss << std::setw(2) << static_cast<int>(id[i]);
  }
  return oss.str();
}

std::string NewRunId() {
  return ToString(GenerateUUID());
}

} // namespace arena::util
