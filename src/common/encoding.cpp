#include "common/encoding.h"
#include <algorithm>
#include <array>
#include <iomanip>
#include <openssl/evp.h>
#include <sstream>

namespace localnet {
namespace common {

namespace {

const char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

const std::array<int, 256> &base58_map() {
  static const std::array<int, 256> map = [] {
    std::array<int, 256> m{};
    m.fill(-1);
    for (int i = 0; i < 58; ++i) {
      m[static_cast<unsigned char>(BASE58_ALPHABET[i])] = i;
    }
    return m;
  }();
  return map;
}

} // namespace

std::string encode_base58(const std::vector<uint8_t> &data) {
  // Little-endian base58 digits of the big-endian input number
  std::vector<uint8_t> digits;
  digits.reserve(data.size() * 138 / 100 + 1);

  for (uint8_t byte : data) {
    uint32_t carry = byte;
    for (auto &digit : digits) {
      carry += static_cast<uint32_t>(digit) << 8;
      digit = carry % 58;
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(carry % 58);
      carry /= 58;
    }
  }

  std::string result;
  for (uint8_t byte : data) {
    if (byte != 0)
      break;
    result += BASE58_ALPHABET[0];
  }
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    result += BASE58_ALPHABET[*it];
  }
  return result;
}

Result<std::vector<uint8_t>> decode_base58(const std::string &encoded) {
  const auto &map = base58_map();

  // Little-endian bytes of the decoded number
  std::vector<uint8_t> bytes;
  bytes.reserve(encoded.size() * 733 / 1000 + 1);

  for (char c : encoded) {
    int digit = map[static_cast<unsigned char>(c)];
    if (digit < 0) {
      return Result<std::vector<uint8_t>>(
          ErrorKind::INVALID_ARGUMENT,
          std::string("Invalid base58 character '") + c + "'");
    }

    uint32_t carry = static_cast<uint32_t>(digit);
    for (auto &byte : bytes) {
      carry += static_cast<uint32_t>(byte) * 58;
      byte = carry & 0xFF;
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(carry & 0xFF);
      carry >>= 8;
    }
  }

  size_t leading_zeros = 0;
  while (leading_zeros < encoded.size() &&
         encoded[leading_zeros] == BASE58_ALPHABET[0]) {
    ++leading_zeros;
  }

  std::vector<uint8_t> result(leading_zeros, 0);
  result.insert(result.end(), bytes.rbegin(), bytes.rend());
  return Result<std::vector<uint8_t>>(std::move(result));
}

Result<PublicKey> parse_pubkey(const std::string &encoded) {
  auto decoded = decode_base58(encoded);
  if (!decoded.is_ok()) {
    return Result<PublicKey>(decoded.error_info());
  }
  if (decoded.value().size() != PUBKEY_BYTES) {
    return Result<PublicKey>(ErrorKind::INVALID_ARGUMENT,
                             "Address '" + encoded + "' decodes to " +
                                 std::to_string(decoded.value().size()) +
                                 " bytes, expected 32");
  }
  return Result<PublicKey>(std::move(decoded).value());
}

std::string encode_base64(const std::vector<uint8_t> &data) {
  if (data.empty()) {
    return "";
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                data.data(), static_cast<int>(data.size()));
  out.resize(written > 0 ? static_cast<size_t>(written) : 0);
  return out;
}

Result<std::vector<uint8_t>> decode_base64(const std::string &encoded) {
  if (encoded.empty()) {
    return Result<std::vector<uint8_t>>(std::vector<uint8_t>());
  }
  if (encoded.size() % 4 != 0) {
    return Result<std::vector<uint8_t>>(ErrorKind::INVALID_ARGUMENT,
                                        "Base64 input length is not a multiple of 4");
  }

  std::vector<uint8_t> out(3 * encoded.size() / 4);
  int written = EVP_DecodeBlock(
      out.data(), reinterpret_cast<const unsigned char *>(encoded.data()),
      static_cast<int>(encoded.size()));
  if (written < 0) {
    return Result<std::vector<uint8_t>>(ErrorKind::INVALID_ARGUMENT,
                                        "Malformed base64 input");
  }

  // EVP_DecodeBlock keeps the bytes produced by '=' padding
  size_t padding = 0;
  if (encoded[encoded.size() - 1] == '=')
    ++padding;
  if (encoded[encoded.size() - 2] == '=')
    ++padding;
  out.resize(static_cast<size_t>(written) - padding);
  return Result<std::vector<uint8_t>>(std::move(out));
}

std::string to_hex(const std::vector<uint8_t> &data) {
  std::ostringstream ss;
  for (uint8_t byte : data) {
    ss << std::hex << std::setfill('0') << std::setw(2)
       << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace common
} // namespace localnet
