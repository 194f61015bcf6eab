#include "conductor/common/hash.hpp"

#include <iomanip>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <random>
#include <sstream>
#include <vector>

namespace conductor::common {

namespace {

std::vector<unsigned char> random_bytes(const std::size_t count) {
  std::vector<unsigned char> data(count);
  if (count == 0) {
    return data;
  }
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    // OpenSSL's pool is not seeded; the OS device is still fine for ids.
    std::random_device device;
    for (auto &byte : data) {
      byte = static_cast<unsigned char>(device() & 0xFFU);
    }
  }
  return data;
}

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    out << std::setw(2) << static_cast<int>(data[i]);
  }
  return out.str();
}

} // namespace

std::string sha256_hex(const std::string_view text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  return to_hex(digest, SHA256_DIGEST_LENGTH);
}

std::string random_hex(const std::size_t bytes) {
  const auto data = random_bytes(bytes);
  return to_hex(data.data(), data.size());
}

std::string generate_uuid() {
  auto data = random_bytes(16);
  data[6] = static_cast<unsigned char>((data[6] & 0x0FU) | 0x40U);
  data[8] = static_cast<unsigned char>((data[8] & 0x3FU) | 0x80U);
  const std::string hex = to_hex(data.data(), data.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20);
}

} // namespace conductor::common
