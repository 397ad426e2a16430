#pragma once

#include <string>
#include <string_view>

namespace fieldops::util {

bool crypto_ready();

std::string sha256_hex(std::string_view payload);

// Random RFC 4122 version 4 identifier. Empty when the crypto library failed to initialize.
std::string random_uuid();

// Version 4 shaped identifier derived from a digest of `seed`, so every replica computes the same id.
std::string uuid_from_seed(std::string_view seed);

}  // namespace fieldops::util
