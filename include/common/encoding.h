#pragma once

#include "common/types.h"
#include <string>
#include <vector>

namespace localnet {
namespace common {

/// Base58 (Bitcoin alphabet), the text form of addresses, hashes and signatures
std::string encode_base58(const std::vector<uint8_t> &data);
Result<std::vector<uint8_t>> decode_base58(const std::string &encoded);

/// Decode a base58 address and require exactly 32 bytes
Result<PublicKey> parse_pubkey(const std::string &encoded);

/// Standard base64 with padding
std::string encode_base64(const std::vector<uint8_t> &data);
Result<std::vector<uint8_t>> decode_base64(const std::string &encoded);

std::string to_hex(const std::vector<uint8_t> &data);

} // namespace common
} // namespace localnet
