#pragma once

#include <cstddef>
#include <string>

namespace relay {

// URL-safe base64 (no padding) of `num_bytes` bytes drawn from the OS entropy source
std::string random_token(std::size_t num_bytes);

// Prefix of an identifier, safe to print in logs
std::string short_id(const std::string &id);

}  // namespace relay
