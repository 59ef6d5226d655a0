#include "core/uuid.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace relay {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::string base64url(const std::vector<uint8_t> &bytes) {
  std::string out;
  out.reserve((bytes.size() * 4 + 2) / 3);

  size_t i = 0;
  for (; i + 2 < bytes.size(); i += 3) {
    uint32_t n = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8) | bytes[i + 2];
    out.push_back(kAlphabet[(n >> 18) & 0x3f]);
    out.push_back(kAlphabet[(n >> 12) & 0x3f]);
    out.push_back(kAlphabet[(n >> 6) & 0x3f]);
    out.push_back(kAlphabet[n & 0x3f]);
  }

  size_t rest = bytes.size() - i;
  if (rest == 1) {
    uint32_t n = uint32_t(bytes[i]) << 16;
    out.push_back(kAlphabet[(n >> 18) & 0x3f]);
    out.push_back(kAlphabet[(n >> 12) & 0x3f]);
  } else if (rest == 2) {
    uint32_t n = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8);
    out.push_back(kAlphabet[(n >> 18) & 0x3f]);
    out.push_back(kAlphabet[(n >> 12) & 0x3f]);
    out.push_back(kAlphabet[(n >> 6) & 0x3f]);
  }
  return out;
}

}  // namespace

std::string random_token(std::size_t num_bytes) {
  // random_device is backed by the kernel entropy pool on Linux
  std::random_device rd;
  std::vector<uint8_t> bytes;
  bytes.reserve(num_bytes + 4);
  while (bytes.size() < num_bytes) {
    auto word = rd();
    for (int shift = 0; shift < 32 && bytes.size() < num_bytes; shift += 8) {
      bytes.push_back(static_cast<uint8_t>((word >> shift) & 0xff));
    }
  }
  return base64url(bytes);
}

std::string short_id(const std::string &id) {
  if (id.size() <= 8) return id;
  return id.substr(0, 8) + "...";
}

}  // namespace relay
